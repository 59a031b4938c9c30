#pragma once

#include "domain/exceptions/LedgerException.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Тип счёта (у пользователя не более одного счёта каждого типа)
 */
enum class AccountType {
    TRADING,    ///< Обычный брокерский счёт
    ISA,        ///< Individual Savings Account, лимит взносов на налоговый год
    SIPP        ///< Пенсионный счёт (drawdown)
};

/**
 * @brief Преобразовать AccountType в строку (значение в БД)
 */
inline std::string toString(AccountType type) {
    switch (type) {
        case AccountType::TRADING: return "trading";
        case AccountType::ISA:     return "isa";
        case AccountType::SIPP:    return "sipp";
        default: return "unknown";
    }
}

/**
 * @brief Преобразовать строку в AccountType
 * @throws ValidationException если строка не распознана
 */
inline AccountType parseAccountType(const std::string& str) {
    if (str == "trading" || str == "TRADING") return AccountType::TRADING;
    if (str == "isa" || str == "ISA")         return AccountType::ISA;
    if (str == "sipp" || str == "SIPP")       return AccountType::SIPP;
    throw ValidationException("Account type must be 'trading', 'isa' or 'sipp'");
}

} // namespace ledger::domain
