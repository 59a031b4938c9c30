// include/adapters/secondary/PostgresCashTransactionRepository.hpp
#pragma once

#include "ports/output/ICashTransactionRepository.hpp"
#include "settings/DbSettings.hpp"
#include "adapters/secondary/PostgresRows.hpp"
#include "adapters/secondary/PostgresErrors.hpp"
#include <pqxx/pqxx>
#include <memory>

namespace ledger::adapters::secondary {

/**
 * @brief Чтение денежного журнала
 *
 * Таблица: cash_transactions
 * - amount BIGINT        — знаковый эффект на баланс, ×10000
 * - balance_after BIGINT — баланс после записи, ×10000
 */
class PostgresCashTransactionRepository : public ports::output::ICashTransactionRepository {
public:
    explicit PostgresCashTransactionRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings)) {}

    std::optional<domain::CashTransaction> findById(int64_t transactionId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(rows::CASH_TRANSACTION_SELECT + "WHERE id = $1", transactionId);
            if (result.empty()) return std::nullopt;
            return rows::toCashTransaction(result[0]);

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresCashTransactionRepository] findById");
        }
    }

    std::vector<domain::CashTransaction> findByAccountId(int64_t accountId, int limit, int offset) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                rows::CASH_TRANSACTION_SELECT +
                "WHERE account_id = $1 "
                "ORDER BY transaction_date DESC, id DESC LIMIT $2 OFFSET $3",
                accountId, limit, offset
            );

            std::vector<domain::CashTransaction> transactions;
            for (const auto& row : result) {
                transactions.push_back(rows::toCashTransaction(row));
            }
            return transactions;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresCashTransactionRepository] findByAccountId");
        }
    }

    int64_t sumDeposits(int64_t accountId, const std::string& fromDate, const std::string& toDate) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT COALESCE(SUM(amount), 0) AS total FROM cash_transactions "
                "WHERE account_id = $1 AND transaction_type = 'deposit' "
                "AND transaction_date >= $2::date AND transaction_date <= $3::date",
                accountId, fromDate, toDate
            );
            return result[0]["total"].as<int64_t>();

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresCashTransactionRepository] sumDeposits");
        }
    }

    bool existsOfTypeOnDate(int64_t accountId, domain::TransactionType type, const std::string& date) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT EXISTS (SELECT 1 FROM cash_transactions "
                "WHERE account_id = $1 AND transaction_type = $2 AND transaction_date = $3::date) AS found",
                accountId, domain::toString(type), date
            );
            return result[0]["found"].as<bool>();

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresCashTransactionRepository] existsOfTypeOnDate");
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace ledger::adapters::secondary
