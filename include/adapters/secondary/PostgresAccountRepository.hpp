// include/adapters/secondary/PostgresAccountRepository.hpp
#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "settings/DbSettings.hpp"
#include "adapters/secondary/PostgresRows.hpp"
#include "adapters/secondary/PostgresErrors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация репозитория счетов
 *
 * Таблица: accounts (UNIQUE (user_id, account_type))
 * cash_balance здесь только читается — пишет его PostgresUnitOfWork.
 */
class PostgresAccountRepository : public ports::output::IAccountRepository {
public:
    explicit PostgresAccountRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings)) {}

    domain::Account save(const domain::Account& account) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "INSERT INTO accounts (user_id, account_type, account_ref, cash_balance, warn_cash) "
                "VALUES ($1, $2, $3, 0, $4) RETURNING id",
                account.userId,
                domain::toString(account.accountType),
                account.accountRef,
                account.warnCash
            );
            txn.commit();

            domain::Account saved = account;
            saved.id = result[0]["id"].as<int64_t>();
            saved.cashBalance = 0;
            return saved;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresAccountRepository] save",
                              "User already has an account of this type");
        }
    }

    std::optional<domain::Account> findById(int64_t accountId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(rows::ACCOUNT_SELECT + "WHERE a.id = $1", accountId);
            if (result.empty()) return std::nullopt;
            return rows::toAccount(result[0]);

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresAccountRepository] findById");
        }
    }

    std::vector<domain::Account> findByUserId(int64_t userId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                rows::ACCOUNT_SELECT + "WHERE a.user_id = $1 " + rows::ACCOUNT_ORDER,
                userId
            );

            std::vector<domain::Account> accounts;
            for (const auto& row : result) {
                accounts.push_back(rows::toAccount(row));
            }
            return accounts;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresAccountRepository] findByUserId");
        }
    }

    std::optional<domain::Account> findByUserAndType(int64_t userId, domain::AccountType type) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                rows::ACCOUNT_SELECT + "WHERE a.user_id = $1 AND a.account_type = $2",
                userId, domain::toString(type)
            );
            if (result.empty()) return std::nullopt;
            return rows::toAccount(result[0]);

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresAccountRepository] findByUserAndType");
        }
    }

    bool updateDetails(int64_t accountId, const std::string& accountRef, int64_t warnCash) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "UPDATE accounts SET account_ref = $2, warn_cash = $3 WHERE id = $1",
                accountId, accountRef, warnCash
            );
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresAccountRepository] updateDetails");
        }
    }

    bool deleteCascade(int64_t accountId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto locked = txn.exec_params("SELECT id FROM accounts WHERE id = $1 FOR UPDATE", accountId);
            if (locked.empty()) return false;

            auto transactions = txn.exec_params(
                "DELETE FROM cash_transactions WHERE account_id = $1", accountId);
            auto movements = txn.exec_params(
                "DELETE FROM holding_movements WHERE holding_id IN "
                "(SELECT id FROM holdings WHERE account_id = $1)", accountId);
            auto holdings = txn.exec_params(
                "DELETE FROM holdings WHERE account_id = $1", accountId);
            txn.exec_params("DELETE FROM accounts WHERE id = $1", accountId);

            txn.commit();

            std::clog << "[PostgresAccountRepository] Cascade delete account " << accountId
                      << ": " << transactions.affected_rows() << " cash transactions, "
                      << movements.affected_rows() << " movements, "
                      << holdings.affected_rows() << " holdings" << std::endl;
            return true;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresAccountRepository] deleteCascade");
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace ledger::adapters::secondary
