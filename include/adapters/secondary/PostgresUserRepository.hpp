// include/adapters/secondary/PostgresUserRepository.hpp
#pragma once

#include "ports/output/IUserRepository.hpp"
#include "settings/DbSettings.hpp"
#include "adapters/secondary/PostgresErrors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

class PostgresUserRepository : public ports::output::IUserRepository {
public:
    explicit PostgresUserRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings)) {}

    domain::User save(const domain::User& user) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "INSERT INTO users (initials, first_name, last_name, provider) "
                "VALUES ($1, $2, $3, $4) RETURNING id",
                user.initials, user.firstName, user.lastName, user.provider
            );
            txn.commit();

            domain::User saved = user;
            saved.id = result[0]["id"].as<int64_t>();
            return saved;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresUserRepository] save");
        }
    }

    std::optional<domain::User> findById(int64_t userId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, initials, first_name, last_name, provider FROM users WHERE id = $1",
                userId
            );
            if (result.empty()) return std::nullopt;
            return toUser(result[0]);

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresUserRepository] findById");
        }
    }

    std::vector<domain::User> findAll() override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec(
                "SELECT id, initials, first_name, last_name, provider FROM users "
                "ORDER BY last_name, first_name, id"
            );

            std::vector<domain::User> users;
            for (const auto& row : result) {
                users.push_back(toUser(row));
            }
            return users;

        } catch (const std::exception&) {
            rethrowTranslated("[PostgresUserRepository] findAll");
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static domain::User toUser(const pqxx::row& row) {
        domain::User user;
        user.id = row["id"].as<int64_t>();
        user.initials = row["initials"].as<std::string>();
        user.firstName = row["first_name"].as<std::string>();
        user.lastName = row["last_name"].as<std::string>();
        user.provider = row["provider"].as<std::string>();
        return user;
    }
};

} // namespace ledger::adapters::secondary
