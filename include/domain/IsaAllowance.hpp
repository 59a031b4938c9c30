#pragma once

#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Использование годового лимита ISA за налоговый год
 */
struct IsaAllowance {
    int64_t accountId = 0;
    std::string taxYear;            ///< "2025/2026"
    std::string taxYearStart;
    std::string taxYearEnd;
    int64_t annualLimit = 0;        ///< ×10000
    int64_t depositsThisYear = 0;   ///< ×10000
    int64_t remaining = 0;          ///< ×10000, может быть отрицательным при превышении
};

} // namespace ledger::domain
