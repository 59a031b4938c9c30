#pragma once

#include "domain/Account.hpp"
#include <optional>
#include <vector>
#include <string>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief Интерфейс репозитория счетов
 *
 * Баланс здесь НЕ обновляется — только через IUnitOfWork.
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    /**
     * @brief Создать счёт
     * @throws ConflictException если у пользователя уже есть счёт этого типа
     */
    virtual domain::Account save(const domain::Account& account) = 0;

    virtual std::optional<domain::Account> findById(int64_t accountId) = 0;

    /**
     * @brief Счета пользователя, упорядоченные по типу, с числом позиций
     */
    virtual std::vector<domain::Account> findByUserId(int64_t userId) = 0;

    virtual std::optional<domain::Account> findByUserAndType(int64_t userId, domain::AccountType type) = 0;

    /**
     * @brief Обновить реквизиты (номер счёта, порог предупреждения)
     * @return false если счёт не найден
     */
    virtual bool updateDetails(int64_t accountId, const std::string& accountRef, int64_t warnCash) = 0;

    /**
     * @brief Удалить счёт каскадно в одной транзакции
     *
     * Порядок: записи журнала → движения → позиции → счёт.
     * @return false если счёт не найден
     */
    virtual bool deleteCascade(int64_t accountId) = 0;
};

} // namespace ledger::ports::output
