#pragma once

#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Цена инструмента на дату (в валюте инструмента, ×10000)
 *
 * Не более одной записи на (investmentId, priceDate):
 * повторная запись на ту же дату заменяет значение.
 */
struct Price {
    int64_t investmentId = 0;
    std::string priceDate;              ///< YYYY-MM-DD
    std::string priceTime = "00:00:00";
    int64_t price = 0;                  ///< ×10000
};

} // namespace ledger::domain
