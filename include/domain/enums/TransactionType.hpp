#pragma once

#include "domain/exceptions/LedgerException.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Тип записи в денежном журнале счёта
 *
 * BUY/SELL создаются только обработчиком движений и связаны
 * с записью HoldingMovement. Остальные типы — ручные операции.
 */
enum class TransactionType {
    DEPOSIT,     ///< Взнос, +amount
    WITHDRAWAL,  ///< Вывод, -amount
    DRAWDOWN,    ///< Пенсионная выплата (SIPP), -amount
    ADJUSTMENT,  ///< Ручная корректировка, знак задаётся суммой
    BUY,         ///< Покупка по позиции
    SELL         ///< Продажа по позиции
};

inline std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::DEPOSIT:    return "deposit";
        case TransactionType::WITHDRAWAL: return "withdrawal";
        case TransactionType::DRAWDOWN:   return "drawdown";
        case TransactionType::ADJUSTMENT: return "adjustment";
        case TransactionType::BUY:        return "buy";
        case TransactionType::SELL:       return "sell";
        default: return "unknown";
    }
}

/**
 * @throws ValidationException если строка не распознана
 */
inline TransactionType parseTransactionType(const std::string& str) {
    if (str == "deposit")    return TransactionType::DEPOSIT;
    if (str == "withdrawal") return TransactionType::WITHDRAWAL;
    if (str == "drawdown")   return TransactionType::DRAWDOWN;
    if (str == "adjustment") return TransactionType::ADJUSTMENT;
    if (str == "buy")        return TransactionType::BUY;
    if (str == "sell")       return TransactionType::SELL;
    throw ValidationException("Transaction type must be 'deposit', 'withdrawal', 'drawdown' or 'adjustment'");
}

/**
 * @brief Тип записывается только обработчиком движений
 */
inline bool isMovementLinked(TransactionType type) {
    return type == TransactionType::BUY || type == TransactionType::SELL;
}

} // namespace ledger::domain
