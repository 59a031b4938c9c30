// include/adapters/secondary/PostgresExchangeRateRepository.hpp
#pragma once

#include "ports/output/IExchangeRateRepository.hpp"
#include "settings/DbSettings.hpp"
#include "adapters/secondary/PostgresErrors.hpp"
#include <pqxx/pqxx>
#include <memory>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация курсов валют к GBP
 *
 * Таблица: currency_rates, PRIMARY KEY (currency_id, rate_date)
 * upsert — INSERT ... ON CONFLICT DO UPDATE (последняя запись на дату выигрывает).
 */
class PostgresExchangeRateRepository : public ports::output::IExchangeRateRepository {
public:
    explicit PostgresExchangeRateRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings)) {}

    void upsert(const domain::ExchangeRate& rate) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "INSERT INTO currency_rates (currency_id, rate_date, rate_time, rate) "
                "VALUES ($1, $2::date, $3, $4) "
                "ON CONFLICT (currency_id, rate_date) DO UPDATE SET "
                "rate_time = EXCLUDED.rate_time, rate = EXCLUDED.rate",
                rate.currencyId, rate.rateDate, rate.rateTime, rate.rate
            );
            txn.commit();

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresExchangeRateRepository] upsert");
        }
    }

    std::optional<domain::ExchangeRate> findLatest(int64_t currencyId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                SELECT + "WHERE currency_id = $1 ORDER BY rate_date DESC LIMIT 1", currencyId);
            if (result.empty()) return std::nullopt;
            return toRate(result[0]);

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresExchangeRateRepository] findLatest");
        }
    }

    std::optional<domain::ExchangeRate> findByDate(int64_t currencyId, const std::string& rateDate) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                SELECT + "WHERE currency_id = $1 AND rate_date = $2::date", currencyId, rateDate);
            if (result.empty()) return std::nullopt;
            return toRate(result[0]);

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresExchangeRateRepository] findByDate");
        }
    }

    std::vector<domain::ExchangeRate> findHistory(int64_t currencyId, int limit) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                SELECT + "WHERE currency_id = $1 ORDER BY rate_date DESC LIMIT $2",
                currencyId, limit
            );

            std::vector<domain::ExchangeRate> rates;
            for (const auto& row : result) {
                rates.push_back(toRate(row));
            }
            return rates;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresExchangeRateRepository] findHistory");
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    inline static const std::string SELECT =
        "SELECT currency_id, to_char(rate_date, 'YYYY-MM-DD') AS rate_date, rate_time, rate "
        "FROM currency_rates ";

    static domain::ExchangeRate toRate(const pqxx::row& row) {
        domain::ExchangeRate rate;
        rate.currencyId = row["currency_id"].as<int64_t>();
        rate.rateDate = row["rate_date"].as<std::string>();
        rate.rateTime = row["rate_time"].as<std::string>();
        rate.rate = row["rate"].as<int64_t>();
        return rate;
    }
};

} // namespace ledger::adapters::secondary
