#pragma once

#include "domain/MovementResult.hpp"
#include "domain/HoldingMovement.hpp"
#include "domain/enums/MovementType.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace ledger::ports::input {

/**
 * @brief Запрос на движение по позиции
 *
 * Десятичные значения (как ввёл пользователь), масштабируются в сервисе.
 * std::nullopt = поле не передано.
 *
 * - buy/sell:   quantity, totalConsideration, deductibleCosts (по умолчанию 0)
 * - adjustment: newQuantity
 */
struct MovementRequest {
    int64_t holdingId = 0;
    std::optional<domain::MovementType> movementType;
    std::optional<std::string> movementDate;        ///< YYYY-MM-DD
    std::optional<double> quantity;
    std::optional<double> totalConsideration;
    std::optional<double> deductibleCosts;
    std::optional<double> newQuantity;
    std::optional<std::string> notes;
};

/**
 * @brief Обработчик движений по позициям
 */
class IMovementService {
public:
    virtual ~IMovementService() = default;

    /**
     * @brief Применить покупку/продажу/корректировку атомарно
     *
     * @throws ValidationException, NotFoundException,
     *         InsufficientFundsException, InsufficientQuantityException
     */
    virtual domain::MovementResult applyMovement(const MovementRequest& request) = 0;

    virtual std::optional<domain::HoldingMovement> getMovement(int64_t movementId) = 0;

    /**
     * @brief История движений позиции, новые первыми
     * @param limit 0 = размер страницы по умолчанию
     * @throws NotFoundException если позиции нет
     */
    virtual std::vector<domain::HoldingMovement> listMovements(int64_t holdingId, int limit = 0) = 0;
};

} // namespace ledger::ports::input
