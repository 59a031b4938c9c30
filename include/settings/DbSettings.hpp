// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace ledger::settings {

/**
 * @brief Настройки подключения к PostgreSQL
 *
 * Читает параметры из переменных окружения:
 * - LEDGER_DB_HOST (localhost)
 * - LEDGER_DB_PORT (5432)
 * - LEDGER_DB_NAME (ledger_db)
 * - LEDGER_DB_USER (ledger_user)
 * - LEDGER_DB_PASSWORD (обязательна)
 */
class DbSettings {
public:
    DbSettings() {
        host_ = getEnvOrDefault("LEDGER_DB_HOST", "localhost");
        port_ = std::stoi(getEnvOrDefault("LEDGER_DB_PORT", "5432"));
        name_ = getEnvOrDefault("LEDGER_DB_NAME", "ledger_db");
        user_ = getEnvOrDefault("LEDGER_DB_USER", "ledger_user");
        password_ = getEnvOrThrow("LEDGER_DB_PASSWORD");
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }

    std::string getConnectionString() const {
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + name_ +
               " user=" + user_ +
               " password=" + password_;
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    static std::string getEnvOrThrow(const char* name) {
        const char* value = std::getenv(name);
        if (!value) {
            throw std::runtime_error(std::string("Required env variable not set: ") + name);
        }
        return value;
    }
};

} // namespace ledger::settings
