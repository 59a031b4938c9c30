// include/adapters/secondary/PostgresPriceRepository.hpp
#pragma once

#include "ports/output/IPriceRepository.hpp"
#include "settings/DbSettings.hpp"
#include "adapters/secondary/PostgresErrors.hpp"
#include <pqxx/pqxx>
#include <memory>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация цен инструментов
 *
 * Таблица: prices, PRIMARY KEY (investment_id, price_date)
 * upsert — INSERT ... ON CONFLICT DO UPDATE (последняя запись на дату выигрывает).
 */
class PostgresPriceRepository : public ports::output::IPriceRepository {
public:
    explicit PostgresPriceRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings)) {}

    void upsert(const domain::Price& price) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "INSERT INTO prices (investment_id, price_date, price_time, price) "
                "VALUES ($1, $2::date, $3, $4) "
                "ON CONFLICT (investment_id, price_date) DO UPDATE SET "
                "price_time = EXCLUDED.price_time, price = EXCLUDED.price",
                price.investmentId, price.priceDate, price.priceTime, price.price
            );
            txn.commit();

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresPriceRepository] upsert");
        }
    }

    std::optional<domain::Price> findLatest(int64_t investmentId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                SELECT + "WHERE investment_id = $1 ORDER BY price_date DESC LIMIT 1", investmentId);
            if (result.empty()) return std::nullopt;
            return toPrice(result[0]);

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresPriceRepository] findLatest");
        }
    }

    std::optional<domain::Price> findByDate(int64_t investmentId, const std::string& priceDate) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                SELECT + "WHERE investment_id = $1 AND price_date = $2::date", investmentId, priceDate);
            if (result.empty()) return std::nullopt;
            return toPrice(result[0]);

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresPriceRepository] findByDate");
        }
    }

    std::vector<domain::Price> findHistory(int64_t investmentId, int limit) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                SELECT + "WHERE investment_id = $1 ORDER BY price_date DESC LIMIT $2",
                investmentId, limit
            );

            std::vector<domain::Price> prices;
            for (const auto& row : result) {
                prices.push_back(toPrice(row));
            }
            return prices;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresPriceRepository] findHistory");
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    inline static const std::string SELECT =
        "SELECT investment_id, to_char(price_date, 'YYYY-MM-DD') AS price_date, price_time, price "
        "FROM prices ";

    static domain::Price toPrice(const pqxx::row& row) {
        domain::Price price;
        price.investmentId = row["investment_id"].as<int64_t>();
        price.priceDate = row["price_date"].as<std::string>();
        price.priceTime = row["price_time"].as<std::string>();
        price.price = row["price"].as<int64_t>();
        return price;
    }
};

} // namespace ledger::adapters::secondary
