#pragma once

#include "domain/CashTransaction.hpp"
#include <optional>
#include <vector>
#include <string>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief Чтение денежного журнала (запись — только через IUnitOfWork)
 */
class ICashTransactionRepository {
public:
    virtual ~ICashTransactionRepository() = default;

    virtual std::optional<domain::CashTransaction> findById(int64_t transactionId) = 0;

    /**
     * @brief Записи счёта, новые первыми (дата, id)
     */
    virtual std::vector<domain::CashTransaction> findByAccountId(int64_t accountId, int limit, int offset) = 0;

    /**
     * @brief Сумма взносов (deposit) за период, включительно, ×10000
     */
    virtual int64_t sumDeposits(int64_t accountId, const std::string& fromDate, const std::string& toDate) = 0;

    virtual bool existsOfTypeOnDate(int64_t accountId, domain::TransactionType type, const std::string& date) = 0;
};

} // namespace ledger::ports::output
