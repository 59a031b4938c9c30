#pragma once

#include "enums/TransactionType.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Запись денежного журнала счёта — неизменяемая
 *
 * amount — знаковый эффект на баланс (×10000): взнос > 0, вывод < 0.
 * balanceAfter — снимок баланса сразу после записи. История показывает
 * остаток на каждую запись без обратного пересчёта.
 */
struct CashTransaction {
    int64_t id = 0;
    int64_t accountId = 0;
    std::optional<int64_t> holdingMovementId;   ///< Для buy/sell
    TransactionType transactionType = TransactionType::DEPOSIT;
    std::string transactionDate;                ///< YYYY-MM-DD
    int64_t amount = 0;
    int64_t balanceAfter = 0;
    std::optional<std::string> notes;
};

} // namespace ledger::domain
