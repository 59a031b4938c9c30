#pragma once

#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Курс валюты на дату
 *
 * rate = сколько единиц валюты за 1 единицу базовой валюты (GBP), ×10000.
 * Пример: 1 GBP = 1.2543 USD → rate = 12543.
 *
 * Для базовой валюты курс неявно равен 1.0 и в таблице не хранится.
 */
struct ExchangeRate {
    int64_t currencyId = 0;
    std::string rateDate;               ///< YYYY-MM-DD
    std::string rateTime = "00:00:00";
    int64_t rate = 0;                   ///< ×10000
};

} // namespace ledger::domain
