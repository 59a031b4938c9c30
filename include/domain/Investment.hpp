#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Отслеживаемый финансовый инструмент
 *
 * url/selector используются только внешним сборщиком цен,
 * ядро их хранит, но не интерпретирует.
 */
struct Investment {
    int64_t id = 0;
    int64_t currencyId = 0;
    int64_t typeId = 0;
    std::string description;                ///< До 60 символов
    std::optional<std::string> publicId;    ///< ISIN / тикер, до 20 символов
    std::optional<std::string> url;
    std::optional<std::string> selector;

    // Заполняется при чтении (JOIN currencies)
    std::string currencyCode;
};

} // namespace ledger::domain
