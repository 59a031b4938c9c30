// include/adapters/secondary/PostgresHoldingRepository.hpp
#pragma once

#include "ports/output/IHoldingRepository.hpp"
#include "settings/DbSettings.hpp"
#include "adapters/secondary/PostgresRows.hpp"
#include "adapters/secondary/PostgresErrors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища позиций
 *
 * Таблица: holdings (UNIQUE (account_id, investment_id))
 * Чтение всегда с JOIN investments/currencies.
 */
class PostgresHoldingRepository : public ports::output::IHoldingRepository {
public:
    explicit PostgresHoldingRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings)) {}

    domain::Holding save(const domain::Holding& holding) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto inserted = txn.exec_params(
                "INSERT INTO holdings (account_id, investment_id, quantity, average_cost) "
                "VALUES ($1, $2, $3, $4) RETURNING id",
                holding.accountId, holding.investmentId, holding.quantity, holding.averageCost
            );
            int64_t id = inserted[0]["id"].as<int64_t>();

            auto result = txn.exec_params(rows::HOLDING_SELECT + "WHERE h.id = $1", id);
            txn.commit();

            return rows::toHolding(result[0]);

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresHoldingRepository] save",
                              "Holding already exists for this investment");
        }
    }

    std::optional<domain::Holding> findById(int64_t holdingId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(rows::HOLDING_SELECT + "WHERE h.id = $1", holdingId);
            if (result.empty()) return std::nullopt;
            return rows::toHolding(result[0]);

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresHoldingRepository] findById");
        }
    }

    std::vector<domain::Holding> findByAccountId(int64_t accountId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                rows::HOLDING_SELECT + "WHERE h.account_id = $1 " + rows::HOLDING_ORDER,
                accountId
            );

            std::vector<domain::Holding> holdings;
            for (const auto& row : result) {
                holdings.push_back(rows::toHolding(row));
            }
            return holdings;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresHoldingRepository] findByAccountId");
        }
    }

    std::optional<domain::Holding> findByAccountAndInvestment(int64_t accountId, int64_t investmentId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                rows::HOLDING_SELECT + "WHERE h.account_id = $1 AND h.investment_id = $2",
                accountId, investmentId
            );
            if (result.empty()) return std::nullopt;
            return rows::toHolding(result[0]);

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresHoldingRepository] findByAccountAndInvestment");
        }
    }

    bool updatePosition(int64_t holdingId, int64_t quantity, int64_t averageCost) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "UPDATE holdings SET quantity = $2, average_cost = $3 WHERE id = $1",
                holdingId, quantity, averageCost
            );
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresHoldingRepository] updatePosition");
        }
    }

    bool deleteById(int64_t holdingId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto locked = txn.exec_params("SELECT id FROM holdings WHERE id = $1 FOR UPDATE", holdingId);
            if (locked.empty()) return false;

            txn.exec_params(
                "DELETE FROM cash_transactions WHERE holding_movement_id IN "
                "(SELECT id FROM holding_movements WHERE holding_id = $1)", holdingId);
            auto movements = txn.exec_params(
                "DELETE FROM holding_movements WHERE holding_id = $1", holdingId);
            txn.exec_params("DELETE FROM holdings WHERE id = $1", holdingId);

            txn.commit();

            std::clog << "[PostgresHoldingRepository] Deleted holding " << holdingId
                      << " with " << movements.affected_rows() << " movements" << std::endl;
            return true;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresHoldingRepository] deleteById");
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace ledger::adapters::secondary
