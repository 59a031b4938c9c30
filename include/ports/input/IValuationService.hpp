#pragma once

#include "domain/Valuation.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace ledger::ports::input {

/**
 * @brief Оценка портфеля в базовой валюте (только чтение)
 *
 * asOfDate не задан → последние цены/курсы, дата оценки = сегодня.
 * asOfDate задан → цены/курсы строго на эту дату.
 */
class IValuationService {
public:
    virtual ~IValuationService() = default;

    /**
     * @throws NotFoundException если счёта нет
     */
    virtual domain::AccountValuation valueAccount(
        int64_t accountId,
        const std::optional<std::string>& asOfDate = std::nullopt
    ) = 0;

    /**
     * @throws NotFoundException если пользователя нет
     */
    virtual domain::UserValuation valueUser(
        int64_t userId,
        const std::optional<std::string>& asOfDate = std::nullopt
    ) = 0;

    virtual std::vector<domain::UserValuation> valueAllUsers(
        const std::optional<std::string>& asOfDate = std::nullopt
    ) = 0;
};

} // namespace ledger::ports::input
