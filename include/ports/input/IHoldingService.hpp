#pragma once

#include "domain/Holding.hpp"
#include <optional>
#include <vector>
#include <cstdint>

namespace ledger::ports::input {

struct CreateHoldingRequest {
    int64_t accountId = 0;
    int64_t investmentId = 0;
    double quantity = 0.0;
    double averageCost = 0.0;
};

/**
 * @brief Ручная корректировка позиции (не покупка/продажа)
 */
struct UpdateHoldingRequest {
    int64_t holdingId = 0;
    double quantity = 0.0;
    double averageCost = 0.0;
};

/**
 * @brief Хранилище позиций
 */
class IHoldingService {
public:
    virtual ~IHoldingService() = default;

    /**
     * @throws ValidationException, NotFoundException, ConflictException
     */
    virtual domain::Holding createHolding(const CreateHoldingRequest& request) = 0;

    /**
     * @throws ValidationException, NotFoundException
     */
    virtual domain::Holding updateHolding(const UpdateHoldingRequest& request) = 0;

    /**
     * @throws NotFoundException
     */
    virtual void deleteHolding(int64_t holdingId) = 0;

    virtual std::optional<domain::Holding> getHolding(int64_t holdingId) = 0;
    virtual std::vector<domain::Holding> listByAccount(int64_t accountId) = 0;
};

} // namespace ledger::ports::input
