// include/adapters/secondary/PostgresRows.hpp
#pragma once

#include "domain/Account.hpp"
#include "domain/Holding.hpp"
#include "domain/HoldingMovement.hpp"
#include "domain/CashTransaction.hpp"
#include <pqxx/pqxx>
#include <optional>
#include <string>

namespace ledger::adapters::secondary::rows {

// Общие SELECT и маппинг строк — используются репозиториями и PostgresUnitOfWork

inline const std::string ACCOUNT_COLUMNS =
    "a.id, a.user_id, a.account_type, a.account_ref, a.cash_balance, a.warn_cash";

inline const std::string ACCOUNT_SELECT =
    "SELECT " + ACCOUNT_COLUMNS + ", "
    "(SELECT COUNT(*) FROM holdings h WHERE h.account_id = a.id) AS holdings_count "
    "FROM accounts a ";

/// Для FOR UPDATE: без подзапроса с агрегатом
inline const std::string ACCOUNT_LOCK_SELECT =
    "SELECT " + ACCOUNT_COLUMNS + ", 0 AS holdings_count FROM accounts a ";

/// Порядок типов счетов: trading, isa, sipp
inline const std::string ACCOUNT_ORDER =
    "ORDER BY CASE a.account_type WHEN 'trading' THEN 0 WHEN 'isa' THEN 1 ELSE 2 END";

inline const std::string HOLDING_SELECT =
    "SELECT h.id, h.account_id, h.investment_id, h.quantity, h.average_cost, "
    "i.description AS investment_description, i.public_id AS investment_public_id, "
    "c.id AS currency_id, c.code AS currency_code, c.description AS currency_description "
    "FROM holdings h "
    "JOIN investments i ON i.id = h.investment_id "
    "JOIN currencies c ON c.id = i.currency_id ";

/// Побайтовый порядок описаний — как std::string::operator< в памяти
inline const std::string HOLDING_ORDER = "ORDER BY i.description COLLATE \"C\", h.id";

inline const std::string MOVEMENT_SELECT =
    "SELECT id, holding_id, movement_type, to_char(movement_date, 'YYYY-MM-DD') AS movement_date, "
    "quantity, movement_value, deductible_costs, book_cost, revised_avg_cost, notes "
    "FROM holding_movements ";

inline const std::string CASH_TRANSACTION_SELECT =
    "SELECT id, account_id, holding_movement_id, transaction_type, "
    "to_char(transaction_date, 'YYYY-MM-DD') AS transaction_date, amount, balance_after, notes "
    "FROM cash_transactions ";

template <typename T>
std::optional<T> optionalField(const pqxx::field& field) {
    if (field.is_null()) return std::nullopt;
    return field.as<T>();
}

inline domain::Account toAccount(const pqxx::row& row) {
    domain::Account account;
    account.id = row["id"].as<int64_t>();
    account.userId = row["user_id"].as<int64_t>();
    account.accountType = domain::parseAccountType(row["account_type"].as<std::string>());
    account.accountRef = row["account_ref"].as<std::string>();
    account.cashBalance = row["cash_balance"].as<int64_t>();
    account.warnCash = row["warn_cash"].as<int64_t>();
    account.holdingsCount = row["holdings_count"].as<int64_t>();
    return account;
}

inline domain::Holding toHolding(const pqxx::row& row) {
    domain::Holding holding;
    holding.id = row["id"].as<int64_t>();
    holding.accountId = row["account_id"].as<int64_t>();
    holding.investmentId = row["investment_id"].as<int64_t>();
    holding.quantity = row["quantity"].as<int64_t>();
    holding.averageCost = row["average_cost"].as<int64_t>();
    holding.investmentDescription = row["investment_description"].as<std::string>();
    holding.investmentPublicId = optionalField<std::string>(row["investment_public_id"]);
    holding.currencyId = row["currency_id"].as<int64_t>();
    holding.currencyCode = row["currency_code"].as<std::string>();
    holding.currencyDescription = row["currency_description"].as<std::string>();
    return holding;
}

inline domain::HoldingMovement toMovement(const pqxx::row& row) {
    domain::HoldingMovement movement;
    movement.id = row["id"].as<int64_t>();
    movement.holdingId = row["holding_id"].as<int64_t>();
    movement.movementType = domain::parseMovementType(row["movement_type"].as<std::string>());
    movement.movementDate = row["movement_date"].as<std::string>();
    movement.quantity = row["quantity"].as<int64_t>();
    movement.movementValue = row["movement_value"].as<int64_t>();
    movement.deductibleCosts = row["deductible_costs"].as<int64_t>();
    movement.bookCost = row["book_cost"].as<int64_t>();
    movement.revisedAvgCost = optionalField<int64_t>(row["revised_avg_cost"]);
    movement.notes = optionalField<std::string>(row["notes"]);
    return movement;
}

inline domain::CashTransaction toCashTransaction(const pqxx::row& row) {
    domain::CashTransaction transaction;
    transaction.id = row["id"].as<int64_t>();
    transaction.accountId = row["account_id"].as<int64_t>();
    transaction.holdingMovementId = optionalField<int64_t>(row["holding_movement_id"]);
    transaction.transactionType = domain::parseTransactionType(row["transaction_type"].as<std::string>());
    transaction.transactionDate = row["transaction_date"].as<std::string>();
    transaction.amount = row["amount"].as<int64_t>();
    transaction.balanceAfter = row["balance_after"].as<int64_t>();
    transaction.notes = optionalField<std::string>(row["notes"]);
    return transaction;
}

} // namespace ledger::adapters::secondary::rows
