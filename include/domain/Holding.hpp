#pragma once

#include "FixedPoint.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Позиция: инструмент внутри счёта
 *
 * Уникальна по (accountId, investmentId). Количество 0 означает
 * «закрытую» позицию — при наличии истории движений её не удаляют.
 *
 * averageCost — себестоимость единицы в валюте инструмента
 * (без учёта вычитаемых расходов), меняется только при покупке.
 */
struct Holding {
    int64_t id = 0;
    int64_t accountId = 0;
    int64_t investmentId = 0;
    int64_t quantity = 0;       ///< ×10000, всегда >= 0
    int64_t averageCost = 0;    ///< ×10000

    // Заполняется при чтении (JOIN investments, currencies)
    std::string investmentDescription;
    std::optional<std::string> investmentPublicId;
    int64_t currencyId = 0;
    std::string currencyCode;
    std::string currencyDescription;

    double quantityValue() const { return FixedPoint::unscale(quantity); }
    double averageCostValue() const { return FixedPoint::unscale(averageCost); }

    /**
     * @brief Балансовая стоимость позиции: quantity × averageCost
     */
    double bookCostValue() const {
        return quantityValue() * averageCostValue();
    }

    bool isClosed() const { return quantity == 0; }
};

} // namespace ledger::domain
