#pragma once

#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Категория инструмента (справочник, заполняется при инициализации схемы)
 */
struct InvestmentType {
    int64_t id = 0;
    std::string shortDescription;   ///< "SHARE", "FUND", "TRUST"...
    std::string description;
};

} // namespace ledger::domain
