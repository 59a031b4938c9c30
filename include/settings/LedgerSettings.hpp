// include/settings/LedgerSettings.hpp
#pragma once

#include <string>
#include <cstdlib>

namespace ledger::settings {

/**
 * @brief Общие настройки ядра учёта
 *
 * Переменные окружения:
 * - LEDGER_HISTORY_LIMIT: размер страницы истории по умолчанию (50)
 */
class LedgerSettings {
public:
    LedgerSettings() {
        historyLimit_ = std::stoi(getEnvOrDefault("LEDGER_HISTORY_LIMIT", "50"));
        if (historyLimit_ <= 0) {
            historyLimit_ = 50;
        }
    }

    explicit LedgerSettings(int historyLimit) : historyLimit_(historyLimit) {}

    /**
     * @brief Размер страницы истории движений/журнала по умолчанию
     */
    int getHistoryLimit() const { return historyLimit_; }

private:
    int historyLimit_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace ledger::settings
