// include/adapters/secondary/PostgresSchema.hpp
#pragma once

#include "settings/DbSettings.hpp"
#include "adapters/secondary/PostgresErrors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief Идемпотентное создание схемы и справочных данных
 *
 * Все денежные/количественные колонки — BIGINT ×10000.
 * Даты — DATE, читаются как to_char(..., 'YYYY-MM-DD').
 *
 * Справочные данные: базовая валюта GBP и типы инструментов.
 */
class PostgresSchema {
public:
    explicit PostgresSchema(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings)) {}

    void init() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS users (
                    id BIGSERIAL PRIMARY KEY,
                    initials VARCHAR(5) NOT NULL,
                    first_name VARCHAR(30) NOT NULL,
                    last_name VARCHAR(30) NOT NULL DEFAULT '',
                    provider VARCHAR(5) NOT NULL DEFAULT ''
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS investment_types (
                    id BIGSERIAL PRIMARY KEY,
                    short_description VARCHAR(8) NOT NULL UNIQUE,
                    description VARCHAR(30) NOT NULL
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS currencies (
                    id BIGSERIAL PRIMARY KEY,
                    code VARCHAR(3) NOT NULL UNIQUE,
                    description VARCHAR(30) NOT NULL
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS investments (
                    id BIGSERIAL PRIMARY KEY,
                    currency_id BIGINT NOT NULL REFERENCES currencies(id),
                    type_id BIGINT NOT NULL REFERENCES investment_types(id),
                    description VARCHAR(60) NOT NULL,
                    public_id VARCHAR(20),
                    url TEXT,
                    selector TEXT
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS prices (
                    investment_id BIGINT NOT NULL REFERENCES investments(id) ON DELETE CASCADE,
                    price_date DATE NOT NULL,
                    price_time VARCHAR(8) NOT NULL DEFAULT '00:00:00',
                    price BIGINT NOT NULL CHECK (price > 0),
                    PRIMARY KEY (investment_id, price_date)
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS currency_rates (
                    currency_id BIGINT NOT NULL REFERENCES currencies(id) ON DELETE CASCADE,
                    rate_date DATE NOT NULL,
                    rate_time VARCHAR(8) NOT NULL DEFAULT '00:00:00',
                    rate BIGINT NOT NULL CHECK (rate > 0),
                    PRIMARY KEY (currency_id, rate_date)
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS accounts (
                    id BIGSERIAL PRIMARY KEY,
                    user_id BIGINT NOT NULL REFERENCES users(id),
                    account_type VARCHAR(8) NOT NULL
                        CHECK (account_type IN ('trading', 'isa', 'sipp')),
                    account_ref VARCHAR(15) NOT NULL DEFAULT '',
                    cash_balance BIGINT NOT NULL DEFAULT 0 CHECK (cash_balance >= 0),
                    warn_cash BIGINT NOT NULL DEFAULT 0 CHECK (warn_cash >= 0),
                    UNIQUE (user_id, account_type)
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS holdings (
                    id BIGSERIAL PRIMARY KEY,
                    account_id BIGINT NOT NULL REFERENCES accounts(id),
                    investment_id BIGINT NOT NULL REFERENCES investments(id),
                    quantity BIGINT NOT NULL DEFAULT 0 CHECK (quantity >= 0),
                    average_cost BIGINT NOT NULL DEFAULT 0 CHECK (average_cost >= 0),
                    UNIQUE (account_id, investment_id)
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS holding_movements (
                    id BIGSERIAL PRIMARY KEY,
                    holding_id BIGINT NOT NULL REFERENCES holdings(id),
                    movement_type VARCHAR(10) NOT NULL
                        CHECK (movement_type IN ('buy', 'sell', 'adjustment')),
                    movement_date DATE NOT NULL,
                    quantity BIGINT NOT NULL,
                    movement_value BIGINT NOT NULL DEFAULT 0,
                    deductible_costs BIGINT NOT NULL DEFAULT 0,
                    book_cost BIGINT NOT NULL DEFAULT 0,
                    revised_avg_cost BIGINT,
                    notes VARCHAR(255)
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS cash_transactions (
                    id BIGSERIAL PRIMARY KEY,
                    account_id BIGINT NOT NULL REFERENCES accounts(id),
                    holding_movement_id BIGINT REFERENCES holding_movements(id),
                    transaction_type VARCHAR(10) NOT NULL
                        CHECK (transaction_type IN
                            ('deposit', 'withdrawal', 'drawdown', 'adjustment', 'buy', 'sell')),
                    transaction_date DATE NOT NULL,
                    amount BIGINT NOT NULL,
                    balance_after BIGINT NOT NULL,
                    notes VARCHAR(255)
                )
            )");

            txn.exec("CREATE INDEX IF NOT EXISTS idx_holding_movements_holding "
                     "ON holding_movements (holding_id, movement_date DESC, id DESC)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_cash_transactions_account "
                     "ON cash_transactions (account_id, transaction_date DESC, id DESC)");

            txn.exec(R"(
                INSERT INTO investment_types (short_description, description) VALUES
                    ('SHARE', 'Shares'),
                    ('MUTUAL', 'Mutual Funds'),
                    ('TRUST', 'Investment Trusts'),
                    ('SAVINGS', 'Savings Accounts'),
                    ('OTHER', 'Other')
                ON CONFLICT (short_description) DO NOTHING
            )");

            txn.exec(R"(
                INSERT INTO currencies (code, description)
                VALUES ('GBP', 'British Pound Sterling')
                ON CONFLICT (code) DO NOTHING
            )");

            txn.commit();
            std::clog << "[PostgresSchema] Schema initialized" << std::endl;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresSchema] init");
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace ledger::adapters::secondary
