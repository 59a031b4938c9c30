#pragma once

#include "domain/Holding.hpp"
#include "domain/Account.hpp"
#include "domain/HoldingMovement.hpp"
#include "domain/CashTransaction.hpp"
#include <memory>
#include <optional>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief Единица работы: одна транзакция хранилища для многострочных изменений
 *
 * Все денежные операции (движение по позиции, запись журнала, отмена записи)
 * выполняются внутри одной единицы работы:
 *
 * ```cpp
 * auto uow = uowFactory->begin();
 * auto holding = uow->lockHolding(id);          // SELECT ... FOR UPDATE
 * auto account = uow->lockAccount(holding->accountId);
 * // проверки по заблокированным строкам
 * uow->updateHoldingPosition(...);
 * uow->updateCashBalance(...);
 * uow->insertMovement(...);
 * uow->commit();
 * // без commit() деструктор откатывает всё
 * ```
 *
 * lock*() блокируют строку до конца транзакции: конкурирующее движение
 * по той же позиции ждёт и затем видит уже зафиксированный результат.
 */
class IUnitOfWork {
public:
    virtual ~IUnitOfWork() = default;

    /**
     * @brief Прочитать и заблокировать позицию (с данными инструмента)
     */
    virtual std::optional<domain::Holding> lockHolding(int64_t holdingId) = 0;

    /**
     * @brief Прочитать и заблокировать счёт
     */
    virtual std::optional<domain::Account> lockAccount(int64_t accountId) = 0;

    /**
     * @brief Прочитать и заблокировать запись журнала
     */
    virtual std::optional<domain::CashTransaction> lockCashTransaction(int64_t transactionId) = 0;

    virtual void updateHoldingPosition(int64_t holdingId, int64_t quantity, int64_t averageCost) = 0;
    virtual void updateCashBalance(int64_t accountId, int64_t cashBalance) = 0;

    /**
     * @brief Добавить движение, вернуть запись с присвоенным id
     */
    virtual domain::HoldingMovement insertMovement(const domain::HoldingMovement& movement) = 0;

    /**
     * @brief Добавить запись журнала, вернуть запись с присвоенным id
     */
    virtual domain::CashTransaction insertCashTransaction(const domain::CashTransaction& transaction) = 0;

    virtual void deleteCashTransaction(int64_t transactionId) = 0;

    /**
     * @brief Зафиксировать все изменения
     */
    virtual void commit() = 0;
};

/**
 * @brief Фабрика единиц работы (явный handle хранилища вместо глобального соединения)
 */
class IUnitOfWorkFactory {
public:
    virtual ~IUnitOfWorkFactory() = default;

    virtual std::unique_ptr<IUnitOfWork> begin() = 0;
};

} // namespace ledger::ports::output
