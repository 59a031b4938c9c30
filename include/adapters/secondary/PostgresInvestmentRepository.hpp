// include/adapters/secondary/PostgresInvestmentRepository.hpp
#pragma once

#include "ports/output/IInvestmentRepository.hpp"
#include "settings/DbSettings.hpp"
#include "adapters/secondary/PostgresRows.hpp"
#include "adapters/secondary/PostgresErrors.hpp"
#include <pqxx/pqxx>
#include <memory>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация справочника инструментов
 *
 * url/selector хранятся для внешнего сборщика цен как есть.
 */
class PostgresInvestmentRepository : public ports::output::IInvestmentRepository {
public:
    explicit PostgresInvestmentRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings)) {}

    std::vector<domain::Investment> findAll() override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec(SELECT + "ORDER BY i.description COLLATE \"C\", i.id");

            std::vector<domain::Investment> investments;
            for (const auto& row : result) {
                investments.push_back(toInvestment(row));
            }
            return investments;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresInvestmentRepository] findAll");
        }
    }

    std::optional<domain::Investment> findById(int64_t investmentId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(SELECT + "WHERE i.id = $1", investmentId);
            if (result.empty()) return std::nullopt;
            return toInvestment(result[0]);

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresInvestmentRepository] findById");
        }
    }

    domain::Investment save(const domain::Investment& investment) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto inserted = txn.exec_params(
                "INSERT INTO investments (currency_id, type_id, description, public_id, url, selector) "
                "VALUES ($1, $2, $3, $4, $5, $6) RETURNING id",
                investment.currencyId, investment.typeId, investment.description,
                investment.publicId, investment.url, investment.selector
            );
            auto result = txn.exec_params(SELECT + "WHERE i.id = $1", inserted[0]["id"].as<int64_t>());
            txn.commit();

            return toInvestment(result[0]);

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresInvestmentRepository] save");
        }
    }

    bool update(const domain::Investment& investment) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "UPDATE investments SET currency_id = $2, type_id = $3, description = $4, "
                "public_id = $5, url = $6, selector = $7 WHERE id = $1",
                investment.id, investment.currencyId, investment.typeId, investment.description,
                investment.publicId, investment.url, investment.selector
            );
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresInvestmentRepository] update");
        }
    }

    bool deleteById(int64_t investmentId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params("DELETE FROM prices WHERE investment_id = $1", investmentId);
            auto result = txn.exec_params("DELETE FROM investments WHERE id = $1", investmentId);
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresInvestmentRepository] deleteById");
        }
    }

    int64_t countHoldingsUsing(int64_t investmentId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT COUNT(*) AS cnt FROM holdings WHERE investment_id = $1", investmentId);
            return result[0]["cnt"].as<int64_t>();

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresInvestmentRepository] countHoldingsUsing");
        }
    }

    std::vector<domain::InvestmentType> findAllTypes() override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec(
                "SELECT id, short_description, description FROM investment_types ORDER BY id");

            std::vector<domain::InvestmentType> types;
            for (const auto& row : result) {
                types.push_back(toType(row));
            }
            return types;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresInvestmentRepository] findAllTypes");
        }
    }

    std::optional<domain::InvestmentType> findTypeById(int64_t typeId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, short_description, description FROM investment_types WHERE id = $1", typeId);
            if (result.empty()) return std::nullopt;
            return toType(result[0]);

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresInvestmentRepository] findTypeById");
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    inline static const std::string SELECT =
        "SELECT i.id, i.currency_id, i.type_id, i.description, i.public_id, i.url, i.selector, "
        "c.code AS currency_code "
        "FROM investments i JOIN currencies c ON c.id = i.currency_id ";

    static domain::Investment toInvestment(const pqxx::row& row) {
        domain::Investment investment;
        investment.id = row["id"].as<int64_t>();
        investment.currencyId = row["currency_id"].as<int64_t>();
        investment.typeId = row["type_id"].as<int64_t>();
        investment.description = row["description"].as<std::string>();
        investment.publicId = rows::optionalField<std::string>(row["public_id"]);
        investment.url = rows::optionalField<std::string>(row["url"]);
        investment.selector = rows::optionalField<std::string>(row["selector"]);
        investment.currencyCode = row["currency_code"].as<std::string>();
        return investment;
    }

    static domain::InvestmentType toType(const pqxx::row& row) {
        domain::InvestmentType type;
        type.id = row["id"].as<int64_t>();
        type.shortDescription = row["short_description"].as<std::string>();
        type.description = row["description"].as<std::string>();
        return type;
    }
};

} // namespace ledger::adapters::secondary
