#pragma once

#include "HoldingMovement.hpp"
#include "Holding.hpp"
#include "Account.hpp"

namespace ledger::domain {

/**
 * @brief Результат движения по позиции
 *
 * holding и account — состояние на момент фиксации той же транзакции.
 */
struct MovementResult {
    HoldingMovement movement;
    Holding holding;
    Account account;
};

} // namespace ledger::domain
