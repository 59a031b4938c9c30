// include/domain/FixedPoint.hpp
#pragma once

#include "domain/exceptions/LedgerException.hpp"
#include <string>
#include <cstdint>
#include <cmath>
#include <cstdlib>
#include <cctype>
#include <algorithm>
#include <limits>

namespace ledger::domain {

/**
 * @brief Фиксированная точка ×10000 для цен, курсов, количеств и денег
 *
 * Все дробные значения хранятся как int64_t:
 *   scaled = round(value × 10000), округление half-away-from-zero.
 *
 * Пример: 1.25435 → 12544, -50.25 → -502500, 123.45678 → 1234568
 *
 * Обратное преобразование unscale(scale(x)) == x для значений
 * с не более чем 4 знаками после запятой. Более точные значения
 * теряют младшие разряды при scale().
 *
 * @note Только здесь происходит преобразование decimal ⇄ integer.
 *       Остальной код работает с уже масштабированными целыми.
 */
struct FixedPoint {
    static constexpr int64_t SCALE_FACTOR = 10000;
    static constexpr int DECIMALS = 4;
    /// Целая часть по модулю должна быть строго меньше
    static constexpr int64_t MAX_UNSCALED = std::numeric_limits<int64_t>::max() / SCALE_FACTOR;

    /**
     * @brief Десятичное значение → масштабированное целое
     *
     * std::llround округляет половину от нуля, знак сохраняется.
     * @throws ValidationException для NaN, бесконечности и |value| >= MAX_UNSCALED
     */
    static int64_t scale(double value) {
        if (!std::isfinite(value) || std::fabs(value) >= static_cast<double>(MAX_UNSCALED)) {
            throw ValidationException("Value out of range");
        }
        return static_cast<int64_t>(std::llround(value * static_cast<double>(SCALE_FACTOR)));
    }

    /**
     * @brief Масштабированное целое → десятичное значение (без повторного округления)
     */
    static double unscale(int64_t scaled) {
        return static_cast<double>(scaled) / static_cast<double>(SCALE_FACTOR);
    }

    /**
     * @brief Точный разбор десятичной строки ("-1234.56789") без double
     *
     * Пятый и последующие знаки после запятой округляются half-away-from-zero.
     * @throws ValidationException если строка не является числом или вне диапазона
     */
    static int64_t parse(const std::string& text) {
        std::size_t pos = 0;
        bool negative = false;

        while (pos < text.size() && text[pos] == ' ') ++pos;
        if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
            negative = text[pos] == '-';
            ++pos;
        }

        int64_t whole = 0;
        int64_t fraction = 0;
        int fractionDigits = 0;
        bool roundUp = false;
        bool anyDigit = false;

        for (; pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])); ++pos) {
            whole = whole * 10 + (text[pos] - '0');
            anyDigit = true;
            if (whole >= MAX_UNSCALED) {
                throw ValidationException("Value out of range");
            }
        }

        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            for (; pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])); ++pos) {
                anyDigit = true;
                if (fractionDigits < DECIMALS) {
                    fraction = fraction * 10 + (text[pos] - '0');
                    ++fractionDigits;
                } else if (fractionDigits == DECIMALS) {
                    roundUp = (text[pos] - '0') >= 5;
                    ++fractionDigits;
                }
            }
        }

        while (pos < text.size() && text[pos] == ' ') ++pos;
        if (!anyDigit || pos != text.size()) {
            throw ValidationException("Invalid decimal value: '" + text + "'");
        }

        for (int i = std::min(fractionDigits, DECIMALS); i < DECIMALS; ++i) {
            fraction *= 10;
        }

        int64_t scaled = whole * SCALE_FACTOR + fraction + (roundUp ? 1 : 0);
        return negative ? -scaled : scaled;
    }

    /**
     * @brief Масштабированное целое → строка с 4 знаками ("-50.2500")
     */
    static std::string format(int64_t scaled) {
        int64_t magnitude = scaled < 0 ? -scaled : scaled;
        std::string fraction = std::to_string(magnitude % SCALE_FACTOR);
        fraction.insert(0, static_cast<std::size_t>(DECIMALS) - fraction.size(), '0');
        return (scaled < 0 ? "-" : "") + std::to_string(magnitude / SCALE_FACTOR) + "." + fraction;
    }

    /**
     * @brief Округлить до пенсов (2 знака) для отображения
     */
    static double roundToPence(double value) {
        return static_cast<double>(std::llround(value * 100.0)) / 100.0;
    }
};

} // namespace ledger::domain
