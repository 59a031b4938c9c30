// include/adapters/secondary/PostgresCurrencyRepository.hpp
#pragma once

#include "ports/output/ICurrencyRepository.hpp"
#include "settings/DbSettings.hpp"
#include "adapters/secondary/PostgresErrors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

class PostgresCurrencyRepository : public ports::output::ICurrencyRepository {
public:
    explicit PostgresCurrencyRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings)) {}

    std::vector<domain::Currency> findAll() override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec("SELECT id, code, description FROM currencies ORDER BY code");

            std::vector<domain::Currency> currencies;
            for (const auto& row : result) {
                currencies.push_back(toCurrency(row));
            }
            return currencies;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresCurrencyRepository] findAll");
        }
    }

    std::optional<domain::Currency> findById(int64_t currencyId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, code, description FROM currencies WHERE id = $1", currencyId);
            if (result.empty()) return std::nullopt;
            return toCurrency(result[0]);

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresCurrencyRepository] findById");
        }
    }

    std::optional<domain::Currency> findByCode(const std::string& code) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, code, description FROM currencies WHERE code = $1", code);
            if (result.empty()) return std::nullopt;
            return toCurrency(result[0]);

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresCurrencyRepository] findByCode");
        }
    }

    domain::Currency save(const domain::Currency& currency) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "INSERT INTO currencies (code, description) VALUES ($1, $2) RETURNING id",
                currency.code, currency.description
            );
            txn.commit();

            domain::Currency saved = currency;
            saved.id = result[0]["id"].as<int64_t>();
            return saved;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresCurrencyRepository] save", "Currency code already exists");
        }
    }

    bool update(const domain::Currency& currency) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "UPDATE currencies SET code = $2, description = $3 WHERE id = $1",
                currency.id, currency.code, currency.description
            );
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresCurrencyRepository] update", "Currency code already exists");
        }
    }

    bool deleteById(int64_t currencyId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params("DELETE FROM currency_rates WHERE currency_id = $1", currencyId);
            auto result = txn.exec_params("DELETE FROM currencies WHERE id = $1", currencyId);
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresCurrencyRepository] deleteById");
        }
    }

    int64_t countInvestmentsUsing(int64_t currencyId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT COUNT(*) AS cnt FROM investments WHERE currency_id = $1", currencyId);
            return result[0]["cnt"].as<int64_t>();

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresCurrencyRepository] countInvestmentsUsing");
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static domain::Currency toCurrency(const pqxx::row& row) {
        domain::Currency currency;
        currency.id = row["id"].as<int64_t>();
        currency.code = row["code"].as<std::string>();
        currency.description = row["description"].as<std::string>();
        return currency;
    }
};

} // namespace ledger::adapters::secondary
