// include/domain/exceptions/LedgerException.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Вид ошибки ядра учёта
 *
 * Вызывающий слой (API/UI) переводит вид ошибки в свой ответ,
 * не разбирая текст сообщения.
 */
enum class ErrorKind {
    VALIDATION,             ///< Некорректный ввод, проверяется до любых изменений
    NOT_FOUND,              ///< Ссылка на несуществующую запись
    CONFLICT,               ///< Нарушение уникальности / запрет удаления
    INSUFFICIENT_FUNDS,     ///< Не хватает денег на счёте
    INSUFFICIENT_QUANTITY,  ///< Не хватает количества в позиции
    INTEGRITY               ///< Хранилище отклонило запись (FK, CHECK)
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:            return "VALIDATION";
        case ErrorKind::NOT_FOUND:             return "NOT_FOUND";
        case ErrorKind::CONFLICT:              return "CONFLICT";
        case ErrorKind::INSUFFICIENT_FUNDS:    return "INSUFFICIENT_FUNDS";
        case ErrorKind::INSUFFICIENT_QUANTITY: return "INSUFFICIENT_QUANTITY";
        case ErrorKind::INTEGRITY:             return "INTEGRITY";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Базовое исключение ядра учёта
 *
 * what() содержит сообщение для пользователя, kind() — вид ошибки.
 * Ни одна из этих ошибок не фатальна для процесса: неудачная операция
 * не оставляет частичных изменений.
 */
class LedgerException : public std::runtime_error {
public:
    LedgerException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ValidationException : public LedgerException {
public:
    explicit ValidationException(const std::string& message)
        : LedgerException(ErrorKind::VALIDATION, message) {}
};

class NotFoundException : public LedgerException {
public:
    explicit NotFoundException(const std::string& message)
        : LedgerException(ErrorKind::NOT_FOUND, message) {}
};

class ConflictException : public LedgerException {
public:
    explicit ConflictException(const std::string& message)
        : LedgerException(ErrorKind::CONFLICT, message) {}
};

class InsufficientFundsException : public LedgerException {
public:
    explicit InsufficientFundsException(const std::string& message)
        : LedgerException(ErrorKind::INSUFFICIENT_FUNDS, message) {}
};

class InsufficientQuantityException : public LedgerException {
public:
    explicit InsufficientQuantityException(const std::string& message)
        : LedgerException(ErrorKind::INSUFFICIENT_QUANTITY, message) {}
};

/**
 * @brief Хранилище отклонило запись, хотя прикладные проверки прошли
 *
 * Означает расхождение логики и схемы — пробрасывается как есть.
 */
class IntegrityException : public LedgerException {
public:
    explicit IntegrityException(const std::string& message)
        : LedgerException(ErrorKind::INTEGRITY, message) {}
};

} // namespace ledger::domain
