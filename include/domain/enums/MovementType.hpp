#pragma once

#include "domain/exceptions/LedgerException.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Тип движения по позиции
 */
enum class MovementType {
    BUY,        ///< Покупка: списание денег, пересчёт средней цены
    SELL,       ///< Продажа: зачисление денег, средняя цена не меняется
    ADJUSTMENT  ///< Корректировка количества (сплит), без денег
};

inline std::string toString(MovementType type) {
    switch (type) {
        case MovementType::BUY:        return "buy";
        case MovementType::SELL:       return "sell";
        case MovementType::ADJUSTMENT: return "adjustment";
        default: return "unknown";
    }
}

/**
 * @throws ValidationException если строка не распознана
 */
inline MovementType parseMovementType(const std::string& str) {
    if (str == "buy")        return MovementType::BUY;
    if (str == "sell")       return MovementType::SELL;
    if (str == "adjustment") return MovementType::ADJUSTMENT;
    throw ValidationException("Movement type must be 'buy', 'sell' or 'adjustment'");
}

} // namespace ledger::domain
