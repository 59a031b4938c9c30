#pragma once

#include <string>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cctype>

namespace ledger::domain {

/**
 * @brief Налоговый год (UK): даты начала и конца включительно
 */
struct TaxYear {
    std::string start;  ///< "2025-04-06"
    std::string end;    ///< "2026-04-05"
    std::string label;  ///< "2025/2026"
};

/**
 * @brief Календарная дата в формате ISO 8601 "YYYY-MM-DD"
 *
 * Даты хранятся строками: лексикографический порядок совпадает
 * с хронологическим.
 */
struct IsoDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    /**
     * @brief Проверить строку: формат YYYY-MM-DD и существующая дата
     */
    static bool isValid(const std::string& text) {
        if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
            return false;
        }
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (i == 4 || i == 7) continue;
            if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
        }
        IsoDate d = parseUnchecked(text);
        return d.month >= 1 && d.month <= 12 && d.day >= 1 && d.day <= daysInMonth(d.year, d.month);
    }

    /**
     * @brief Разобрать строку, формат должен быть уже проверен isValid()
     */
    static IsoDate parseUnchecked(const std::string& text) {
        IsoDate d;
        d.year = std::stoi(text.substr(0, 4));
        d.month = std::stoi(text.substr(5, 2));
        d.day = std::stoi(text.substr(8, 2));
        return d;
    }

    /**
     * @brief Сегодняшняя дата (UTC)
     */
    static std::string today() {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm = *std::gmtime(&now);
        IsoDate d{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
        return d.toString();
    }

    static bool isLeapYear(int year) {
        return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    }

    static int daysInMonth(int year, int month) {
        static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month == 2 && isLeapYear(year)) return 29;
        return days[month - 1];
    }

    /**
     * @brief Предыдущий календарный день
     */
    IsoDate previousDay() const {
        IsoDate d = *this;
        if (--d.day == 0) {
            if (--d.month == 0) {
                d.month = 12;
                --d.year;
            }
            d.day = daysInMonth(d.year, d.month);
        }
        return d;
    }

    std::string toString() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
        return buf;
    }

    /**
     * @brief Налоговый год, содержащий дату
     *
     * Год начинается startDay/startMonth (в UK — 6 апреля) и заканчивается
     * накануне того же дня следующего года.
     *
     * @example taxYearContaining("2026-04-05", 4, 6) → 2025-04-06 .. 2026-04-05
     */
    static TaxYear taxYearContaining(const std::string& date, int startMonth, int startDay) {
        IsoDate d = parseUnchecked(date);

        int startYear = d.year;
        if (d.month < startMonth || (d.month == startMonth && d.day < startDay)) {
            startYear = d.year - 1;
        }

        IsoDate start{startYear, startMonth, startDay};
        IsoDate nextStart{startYear + 1, startMonth, startDay};

        TaxYear taxYear;
        taxYear.start = start.toString();
        taxYear.end = nextStart.previousDay().toString();
        taxYear.label = std::to_string(startYear) + "/" + std::to_string(startYear + 1);
        return taxYear;
    }
};

} // namespace ledger::domain
