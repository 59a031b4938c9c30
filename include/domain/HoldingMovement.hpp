#pragma once

#include "enums/MovementType.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Движение по позиции — неизменяемая запись аудита
 *
 * Все суммы ×10000.
 * - buy:        bookCost = movementValue - deductibleCosts, revisedAvgCost заполнен
 * - sell:       bookCost = quantity × averageCost (списанная себестоимость)
 * - adjustment: quantity = |новое - старое|, movementValue = bookCost = 0
 */
struct HoldingMovement {
    int64_t id = 0;
    int64_t holdingId = 0;
    MovementType movementType = MovementType::BUY;
    std::string movementDate;               ///< YYYY-MM-DD
    int64_t quantity = 0;
    int64_t movementValue = 0;              ///< Total consideration (брутто)
    int64_t deductibleCosts = 0;
    int64_t bookCost = 0;
    std::optional<int64_t> revisedAvgCost;  ///< Средняя цена после покупки
    std::optional<std::string> notes;
};

} // namespace ledger::domain
