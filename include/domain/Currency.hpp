#pragma once

#include <string>
#include <cstdint>

namespace ledger::domain {

/// Код базовой (отчётной) валюты. Её нельзя удалить и нельзя переименовать.
inline const std::string BASE_CURRENCY_CODE = "GBP";

/**
 * @brief Валюта (ISO 4217, три буквы)
 */
struct Currency {
    int64_t id = 0;
    std::string code;           ///< "GBP", "USD", "EUR" — уникальный
    std::string description;

    bool isBase() const { return code == BASE_CURRENCY_CODE; }
};

} // namespace ledger::domain
