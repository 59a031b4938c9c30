#pragma once

#include "domain/CashTransaction.hpp"
#include "domain/IsaAllowance.hpp"
#include "domain/enums/TransactionType.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace ledger::ports::input {

/**
 * @brief Запрос на запись в денежный журнал
 *
 * amount — десятичная сумма:
 * - deposit/withdrawal/drawdown: > 0, знак определяется типом
 * - adjustment: != 0, знак задаёт направление
 */
struct CashTransactionRequest {
    int64_t accountId = 0;
    std::optional<domain::TransactionType> transactionType;
    std::optional<std::string> transactionDate;     ///< YYYY-MM-DD
    std::optional<double> amount;
    std::optional<std::string> notes;
};

/**
 * @brief Денежный журнал счёта
 */
class ICashLedgerService {
public:
    virtual ~ICashLedgerService() = default;

    /**
     * @brief Записать операцию и изменить баланс атомарно
     * @throws ValidationException, NotFoundException, InsufficientFundsException
     */
    virtual domain::CashTransaction record(const CashTransactionRequest& request) = 0;

    virtual std::optional<domain::CashTransaction> getTransaction(int64_t transactionId) = 0;

    /**
     * @brief История, новые первыми, с остатком после каждой записи
     * @param limit 0 = размер страницы по умолчанию
     * @throws NotFoundException если счёта нет
     */
    virtual std::vector<domain::CashTransaction> history(int64_t accountId, int limit = 0, int offset = 0) = 0;

    /**
     * @brief Отменить ручную запись и вернуть её эффект на баланс
     * @throws NotFoundException, ConflictException (запись движения),
     *         InsufficientFundsException (баланс ушёл бы в минус)
     */
    virtual void remove(int64_t transactionId) = 0;

    /**
     * @brief Использование лимита ISA за налоговый год, содержащий onDate
     * @throws NotFoundException, ValidationException (не ISA)
     */
    virtual domain::IsaAllowance isaAllowance(int64_t accountId, const std::string& onDate) = 0;

    /**
     * @brief Есть ли уже drawdown на дату (для внешнего планировщика)
     */
    virtual bool drawdownExists(int64_t accountId, const std::string& date) = 0;
};

} // namespace ledger::ports::input
