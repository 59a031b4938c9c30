#pragma once

#include "domain/Currency.hpp"
#include <optional>
#include <vector>
#include <string>
#include <cstdint>

namespace ledger::ports::output {

class ICurrencyRepository {
public:
    virtual ~ICurrencyRepository() = default;

    /**
     * @brief Все валюты, по коду
     */
    virtual std::vector<domain::Currency> findAll() = 0;
    virtual std::optional<domain::Currency> findById(int64_t currencyId) = 0;
    virtual std::optional<domain::Currency> findByCode(const std::string& code) = 0;

    /**
     * @throws ConflictException при дублировании кода
     */
    virtual domain::Currency save(const domain::Currency& currency) = 0;

    /**
     * @return false если валюта не найдена
     * @throws ConflictException при дублировании кода
     */
    virtual bool update(const domain::Currency& currency) = 0;

    /**
     * @brief Удалить валюту вместе с её курсами
     * @return false если валюта не найдена
     */
    virtual bool deleteById(int64_t currencyId) = 0;

    /**
     * @brief Сколько инструментов номинировано в валюте
     */
    virtual int64_t countInvestmentsUsing(int64_t currencyId) = 0;
};

} // namespace ledger::ports::output
