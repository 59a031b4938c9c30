#pragma once

#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Член семьи, владелец счетов
 */
struct User {
    int64_t id = 0;
    std::string initials;       ///< До 5 символов
    std::string firstName;
    std::string lastName;
    std::string provider;       ///< Код провайдера счетов (до 5 символов)

    std::string fullName() const {
        return firstName + " " + lastName;
    }
};

} // namespace ledger::domain
