#pragma once

#include "domain/Investment.hpp"
#include "domain/InvestmentType.hpp"
#include <optional>
#include <vector>
#include <cstdint>

namespace ledger::ports::output {

class IInvestmentRepository {
public:
    virtual ~IInvestmentRepository() = default;

    /**
     * @brief Все инструменты, по описанию
     */
    virtual std::vector<domain::Investment> findAll() = 0;
    virtual std::optional<domain::Investment> findById(int64_t investmentId) = 0;
    virtual domain::Investment save(const domain::Investment& investment) = 0;

    /**
     * @return false если инструмент не найден
     */
    virtual bool update(const domain::Investment& investment) = 0;

    /**
     * @brief Удалить инструмент вместе с историей цен
     * @return false если инструмент не найден
     */
    virtual bool deleteById(int64_t investmentId) = 0;

    virtual int64_t countHoldingsUsing(int64_t investmentId) = 0;

    virtual std::vector<domain::InvestmentType> findAllTypes() = 0;
    virtual std::optional<domain::InvestmentType> findTypeById(int64_t typeId) = 0;
};

} // namespace ledger::ports::output
