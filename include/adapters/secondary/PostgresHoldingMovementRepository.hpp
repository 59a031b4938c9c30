// include/adapters/secondary/PostgresHoldingMovementRepository.hpp
#pragma once

#include "ports/output/IHoldingMovementRepository.hpp"
#include "settings/DbSettings.hpp"
#include "adapters/secondary/PostgresRows.hpp"
#include "adapters/secondary/PostgresErrors.hpp"
#include <pqxx/pqxx>
#include <memory>

namespace ledger::adapters::secondary {

class PostgresHoldingMovementRepository : public ports::output::IHoldingMovementRepository {
public:
    explicit PostgresHoldingMovementRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings)) {}

    std::optional<domain::HoldingMovement> findById(int64_t movementId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(rows::MOVEMENT_SELECT + "WHERE id = $1", movementId);
            if (result.empty()) return std::nullopt;
            return rows::toMovement(result[0]);

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresHoldingMovementRepository] findById");
        }
    }

    std::vector<domain::HoldingMovement> findByHoldingId(int64_t holdingId, int limit) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                rows::MOVEMENT_SELECT +
                "WHERE holding_id = $1 ORDER BY movement_date DESC, id DESC LIMIT $2",
                holdingId, limit
            );

            std::vector<domain::HoldingMovement> movements;
            for (const auto& row : result) {
                movements.push_back(rows::toMovement(row));
            }
            return movements;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresHoldingMovementRepository] findByHoldingId");
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace ledger::adapters::secondary
