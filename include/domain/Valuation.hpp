#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Оценка одной позиции
 *
 * Значения для отображения (double), округлены до пенсов.
 * Нет цены → hasPrice = false, позиция даёт 0 в итог, но остаётся в списке.
 * Нет курса (не базовая валюта) → hasRate = false, valueBase = 0.
 */
struct HoldingValuation {
    int64_t holdingId = 0;
    int64_t investmentId = 0;
    std::string description;
    std::optional<std::string> publicId;
    std::string currencyCode;
    double quantity = 0.0;
    double averageCost = 0.0;

    bool hasPrice = false;
    std::optional<double> price;
    std::optional<std::string> priceDate;

    bool hasRate = false;
    std::optional<double> rate;         ///< Для базовой валюты = 1.0
    std::optional<std::string> rateDate;

    double valueLocal = 0.0;            ///< В валюте инструмента
    double valueBase = 0.0;             ///< В GBP
};

/**
 * @brief Оценка счёта
 */
struct AccountValuation {
    int64_t accountId = 0;
    std::string accountType;
    std::string accountRef;
    double cashBalance = 0.0;
    double warnCash = 0.0;
    bool cashWarning = false;
    double investmentsTotal = 0.0;
    double accountTotal = 0.0;          ///< investmentsTotal + cashBalance
    std::vector<HoldingValuation> holdings;
};

struct ValuationTotals {
    double investments = 0.0;
    double cash = 0.0;
    double grandTotal = 0.0;
};

/**
 * @brief Сводная оценка пользователя в базовой валюте
 */
struct UserValuation {
    int64_t userId = 0;
    std::string firstName;
    std::string lastName;
    std::string valuationDate;          ///< Дата оценки (сегодня или as-of)
    bool pointInTime = false;           ///< Цены/курсы строго на valuationDate
    std::vector<AccountValuation> accounts;
    ValuationTotals totals;

    /**
     * @brief Сериализовать в JSON (snake_case поля)
     */
    std::string toJson() const;
};

/**
 * @brief Сводка по всем пользователям — JSON-массив
 */
std::string toJson(const std::vector<UserValuation>& valuations);

} // namespace ledger::domain
