// include/settings/IsaAllowanceSettings.hpp
#pragma once

#include "domain/FixedPoint.hpp"
#include <string>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace ledger::settings {

/**
 * @brief Лимит взносов ISA и границы налогового года
 *
 * Переменные окружения:
 * - LEDGER_ISA_ANNUAL_LIMIT: годовой лимит в GBP (20000)
 * - LEDGER_ISA_TAX_YEAR_START_MONTH: месяц начала года, 1-12 (4)
 * - LEDGER_ISA_TAX_YEAR_START_DAY: день начала года, 1-28 (6)
 *
 * Некорректные значения заменяются значениями по умолчанию.
 */
class IsaAllowanceSettings {
public:
    IsaAllowanceSettings() {
        annualLimit_ = parseLimit(getEnvOrDefault("LEDGER_ISA_ANNUAL_LIMIT", "20000"));
        startMonth_ = parseInt(getEnvOrDefault("LEDGER_ISA_TAX_YEAR_START_MONTH", "4"));
        startDay_ = parseInt(getEnvOrDefault("LEDGER_ISA_TAX_YEAR_START_DAY", "6"));

        if (annualLimit_ <= 0) {
            std::cerr << "[IsaAllowanceSettings] Invalid annual limit, using default" << std::endl;
            annualLimit_ = DEFAULT_ANNUAL_LIMIT;
        }
        if (startMonth_ < 1 || startMonth_ > 12) {
            std::cerr << "[IsaAllowanceSettings] Invalid start month, using default" << std::endl;
            startMonth_ = 4;
        }
        if (startDay_ < 1 || startDay_ > 28) {
            std::cerr << "[IsaAllowanceSettings] Invalid start day, using default" << std::endl;
            startDay_ = 6;
        }
    }

    IsaAllowanceSettings(int64_t annualLimit, int startMonth, int startDay)
        : annualLimit_(annualLimit), startMonth_(startMonth), startDay_(startDay) {}

    /**
     * @brief Годовой лимит ×10000
     */
    int64_t getAnnualLimit() const { return annualLimit_; }
    int getTaxYearStartMonth() const { return startMonth_; }
    int getTaxYearStartDay() const { return startDay_; }

private:
    static constexpr int64_t DEFAULT_ANNUAL_LIMIT = 20000 * domain::FixedPoint::SCALE_FACTOR;

    int64_t annualLimit_;
    int startMonth_;
    int startDay_;

    /// Нечисловой текст → 0, дальше подставляется значение по умолчанию
    static int64_t parseLimit(const std::string& text) {
        try {
            return domain::FixedPoint::parse(text);
        } catch (const domain::ValidationException&) {
            return 0;
        }
    }

    static int parseInt(const std::string& text) {
        try {
            std::size_t pos = 0;
            int value = std::stoi(text, &pos);
            return pos == text.size() ? value : 0;
        } catch (const std::invalid_argument&) {
            return 0;
        } catch (const std::out_of_range&) {
            return 0;
        }
    }

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace ledger::settings
