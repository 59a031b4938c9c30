// include/adapters/secondary/PostgresUnitOfWork.hpp
#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "settings/DbSettings.hpp"
#include "adapters/secondary/PostgresRows.hpp"
#include "adapters/secondary/PostgresErrors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief Единица работы на одном pqxx::work
 *
 * Соединение открывается на время единицы работы. lock*() выполняют
 * SELECT ... FOR UPDATE, блокировки держатся до commit()/отката.
 * Деструктор pqxx::work без commit() откатывает транзакцию.
 */
class PostgresUnitOfWork : public ports::output::IUnitOfWork {
public:
    explicit PostgresUnitOfWork(const std::string& connectionString)
        : conn_(connectionString)
        , txn_(conn_)
    {}

    std::optional<domain::Holding> lockHolding(int64_t holdingId) override {
        try {
            auto result = txn_.exec_params(
                rows::HOLDING_SELECT + "WHERE h.id = $1 FOR UPDATE OF h",
                holdingId
            );
            if (result.empty()) return std::nullopt;
            return rows::toHolding(result[0]);
        } catch (const std::exception&) {
            rethrowTranslated("[PostgresUnitOfWork] lockHolding");
        }
    }

    std::optional<domain::Account> lockAccount(int64_t accountId) override {
        try {
            auto result = txn_.exec_params(
                rows::ACCOUNT_LOCK_SELECT + "WHERE a.id = $1 FOR UPDATE",
                accountId
            );
            if (result.empty()) return std::nullopt;
            return rows::toAccount(result[0]);
        } catch (const std::exception&) {
            rethrowTranslated("[PostgresUnitOfWork] lockAccount");
        }
    }

    std::optional<domain::CashTransaction> lockCashTransaction(int64_t transactionId) override {
        try {
            auto result = txn_.exec_params(
                rows::CASH_TRANSACTION_SELECT + "WHERE id = $1 FOR UPDATE",
                transactionId
            );
            if (result.empty()) return std::nullopt;
            return rows::toCashTransaction(result[0]);
        } catch (const std::exception&) {
            rethrowTranslated("[PostgresUnitOfWork] lockCashTransaction");
        }
    }

    void updateHoldingPosition(int64_t holdingId, int64_t quantity, int64_t averageCost) override {
        try {
            txn_.exec_params(
                "UPDATE holdings SET quantity = $2, average_cost = $3 WHERE id = $1",
                holdingId, quantity, averageCost
            );
        } catch (const std::exception&) {
            rethrowTranslated("[PostgresUnitOfWork] updateHoldingPosition");
        }
    }

    void updateCashBalance(int64_t accountId, int64_t cashBalance) override {
        try {
            txn_.exec_params(
                "UPDATE accounts SET cash_balance = $2 WHERE id = $1",
                accountId, cashBalance
            );
        } catch (const std::exception&) {
            rethrowTranslated("[PostgresUnitOfWork] updateCashBalance");
        }
    }

    domain::HoldingMovement insertMovement(const domain::HoldingMovement& movement) override {
        try {
            auto result = txn_.exec_params(
                "INSERT INTO holding_movements "
                "(holding_id, movement_type, movement_date, quantity, movement_value, "
                " deductible_costs, book_cost, revised_avg_cost, notes) "
                "VALUES ($1, $2, $3::date, $4, $5, $6, $7, $8, $9) RETURNING id",
                movement.holdingId,
                domain::toString(movement.movementType),
                movement.movementDate,
                movement.quantity,
                movement.movementValue,
                movement.deductibleCosts,
                movement.bookCost,
                movement.revisedAvgCost,
                movement.notes
            );
            domain::HoldingMovement saved = movement;
            saved.id = result[0]["id"].as<int64_t>();
            return saved;
        } catch (const std::exception&) {
            rethrowTranslated("[PostgresUnitOfWork] insertMovement");
        }
    }

    domain::CashTransaction insertCashTransaction(const domain::CashTransaction& transaction) override {
        try {
            auto result = txn_.exec_params(
                "INSERT INTO cash_transactions "
                "(account_id, holding_movement_id, transaction_type, transaction_date, "
                " amount, balance_after, notes) "
                "VALUES ($1, $2, $3, $4::date, $5, $6, $7) RETURNING id",
                transaction.accountId,
                transaction.holdingMovementId,
                domain::toString(transaction.transactionType),
                transaction.transactionDate,
                transaction.amount,
                transaction.balanceAfter,
                transaction.notes
            );
            domain::CashTransaction saved = transaction;
            saved.id = result[0]["id"].as<int64_t>();
            return saved;
        } catch (const std::exception&) {
            rethrowTranslated("[PostgresUnitOfWork] insertCashTransaction");
        }
    }

    void deleteCashTransaction(int64_t transactionId) override {
        try {
            txn_.exec_params("DELETE FROM cash_transactions WHERE id = $1", transactionId);
        } catch (const std::exception&) {
            rethrowTranslated("[PostgresUnitOfWork] deleteCashTransaction");
        }
    }

    void commit() override {
        try {
            txn_.commit();
        } catch (const std::exception&) {
            rethrowTranslated("[PostgresUnitOfWork] commit");
        }
    }

private:
    // Порядок важен: транзакция разрушается (и откатывается) раньше соединения
    pqxx::connection conn_;
    pqxx::work txn_;
};

/**
 * @brief Фабрика: новое соединение и транзакция на каждую единицу работы
 */
class PostgresUnitOfWorkFactory : public ports::output::IUnitOfWorkFactory {
public:
    explicit PostgresUnitOfWorkFactory(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::clog << "[PostgresUnitOfWorkFactory] Created" << std::endl;
    }

    std::unique_ptr<ports::output::IUnitOfWork> begin() override {
        try {
            return std::make_unique<PostgresUnitOfWork>(settings_->getConnectionString());
        } catch (const std::exception&) {
            rethrowTranslated("[PostgresUnitOfWorkFactory] begin");
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace ledger::adapters::secondary
