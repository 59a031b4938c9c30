#pragma once

#include "domain/HoldingMovement.hpp"
#include <optional>
#include <vector>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief Чтение журнала движений (запись — только через IUnitOfWork)
 */
class IHoldingMovementRepository {
public:
    virtual ~IHoldingMovementRepository() = default;

    virtual std::optional<domain::HoldingMovement> findById(int64_t movementId) = 0;

    /**
     * @brief Движения позиции, новые первыми (дата, id)
     */
    virtual std::vector<domain::HoldingMovement> findByHoldingId(int64_t holdingId, int limit) = 0;
};

} // namespace ledger::ports::output
