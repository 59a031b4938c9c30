#pragma once

#include "domain/ExchangeRate.hpp"
#include <optional>
#include <vector>
#include <string>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief Курсы валют к базовой (GBP)
 *
 * Та же семантика, что у IPriceRepository: upsert по (валюта, дата).
 */
class IExchangeRateRepository {
public:
    virtual ~IExchangeRateRepository() = default;

    virtual void upsert(const domain::ExchangeRate& rate) = 0;
    virtual std::optional<domain::ExchangeRate> findLatest(int64_t currencyId) = 0;
    virtual std::optional<domain::ExchangeRate> findByDate(int64_t currencyId, const std::string& rateDate) = 0;
    virtual std::vector<domain::ExchangeRate> findHistory(int64_t currencyId, int limit) = 0;
};

} // namespace ledger::ports::output
