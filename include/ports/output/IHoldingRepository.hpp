#pragma once

#include "domain/Holding.hpp"
#include <optional>
#include <vector>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief Интерфейс репозитория позиций
 *
 * Покупки/продажи идут через IUnitOfWork, здесь — только CRUD
 * и ручная корректировка.
 */
class IHoldingRepository {
public:
    virtual ~IHoldingRepository() = default;

    /**
     * @brief Создать позицию
     * @throws ConflictException если пара (счёт, инструмент) уже есть
     */
    virtual domain::Holding save(const domain::Holding& holding) = 0;

    virtual std::optional<domain::Holding> findById(int64_t holdingId) = 0;

    /**
     * @brief Позиции счёта, по описанию инструмента
     */
    virtual std::vector<domain::Holding> findByAccountId(int64_t accountId) = 0;

    virtual std::optional<domain::Holding> findByAccountAndInvestment(int64_t accountId, int64_t investmentId) = 0;

    /**
     * @return false если позиция не найдена
     */
    virtual bool updatePosition(int64_t holdingId, int64_t quantity, int64_t averageCost) = 0;

    /**
     * @brief Удалить позицию, её движения и связанные записи журнала
     * @return false если позиция не найдена
     */
    virtual bool deleteById(int64_t holdingId) = 0;
};

} // namespace ledger::ports::output
