#pragma once

#include "enums/AccountType.hpp"
#include "FixedPoint.hpp"
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Счёт пользователя у провайдера
 *
 * Денежные поля хранятся ×10000 (как и все суммы в ядре).
 *
 * cashBalance меняется ТОЛЬКО через:
 * - движение по позиции (buy/sell) — MovementService
 * - запись денежного журнала (и её отмену) — CashLedgerService
 * Обновление реквизитов счёта баланс не трогает.
 */
struct Account {
    int64_t id = 0;
    int64_t userId = 0;
    AccountType accountType = AccountType::TRADING;
    std::string accountRef;         ///< Номер счёта у провайдера, до 15 символов
    int64_t cashBalance = 0;        ///< ×10000
    int64_t warnCash = 0;           ///< Порог предупреждения ×10000, 0 = выключено
    int64_t holdingsCount = 0;      ///< Заполняется при чтении списка

    /**
     * @brief Остаток ниже порога предупреждения
     */
    bool isCashWarning() const {
        return warnCash > 0 && cashBalance < warnCash;
    }

    double cashBalanceValue() const { return FixedPoint::unscale(cashBalance); }
    double warnCashValue() const { return FixedPoint::unscale(warnCash); }
};

} // namespace ledger::domain
