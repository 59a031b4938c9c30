// include/adapters/secondary/PostgresErrors.hpp
#pragma once

#include "domain/exceptions/LedgerException.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <string>

namespace ledger::adapters::secondary {

/**
 * @brief Перевести текущее исключение хранилища в исключение ядра
 *
 * Вызывается только внутри catch-блока:
 *
 * ```cpp
 * } catch (const std::exception&) {
 *     rethrowTranslated("[PostgresHoldingRepository] save", "Holding already exists");
 * }
 * ```
 *
 * - LedgerException                       → без изменений
 * - pqxx::unique_violation                → ConflictException(conflictMessage)
 * - pqxx::integrity_constraint_violation  → IntegrityException (FK, CHECK, NOT NULL)
 * - остальное (соединение, SQL)           → пишется в лог и пробрасывается как есть
 */
[[noreturn]] inline void rethrowTranslated(
    const std::string& where,
    const std::string& conflictMessage = "Duplicate record"
) {
    try {
        throw;
    } catch (const domain::LedgerException&) {
        throw;
    } catch (const pqxx::unique_violation& e) {
        std::cerr << where << " unique violation: " << e.what() << std::endl;
        throw domain::ConflictException(conflictMessage);
    } catch (const pqxx::integrity_constraint_violation& e) {
        std::cerr << where << " integrity violation: " << e.what() << std::endl;
        throw domain::IntegrityException("Storage rejected the change: referential integrity violated");
    } catch (const std::exception& e) {
        std::cerr << where << " error: " << e.what() << std::endl;
        throw;
    }
}

} // namespace ledger::adapters::secondary
