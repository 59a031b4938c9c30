#pragma once

#include "domain/User.hpp"
#include "domain/Account.hpp"
#include "domain/Currency.hpp"
#include "domain/Investment.hpp"
#include "domain/InvestmentType.hpp"
#include "domain/Price.hpp"
#include "domain/ExchangeRate.hpp"
#include "domain/Holding.hpp"
#include "domain/HoldingMovement.hpp"
#include "domain/CashTransaction.hpp"
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <cstdint>

namespace ledger::tests::mocks {

/**
 * @brief Все таблицы in-memory хранилища
 *
 * Копируется целиком при старте единицы работы и записывается обратно
 * при commit(). Без commit() изменения отбрасываются.
 */
struct InMemoryTables {
    std::map<int64_t, domain::User> users;
    std::map<int64_t, domain::InvestmentType> investmentTypes;
    std::map<int64_t, domain::Currency> currencies;
    std::map<int64_t, domain::Investment> investments;
    std::map<std::pair<int64_t, std::string>, domain::Price> prices;
    std::map<std::pair<int64_t, std::string>, domain::ExchangeRate> rates;
    std::map<int64_t, domain::Account> accounts;
    std::map<int64_t, domain::Holding> holdings;
    std::map<int64_t, domain::HoldingMovement> movements;
    std::map<int64_t, domain::CashTransaction> cashTransactions;
    int64_t nextId = 1;

    int64_t allocateId() { return nextId++; }

    /**
     * @brief Заполнить поля инструмента/валюты, как JOIN в PostgreSQL
     */
    domain::Holding withDetails(domain::Holding holding) const {
        auto inv = investments.find(holding.investmentId);
        if (inv != investments.end()) {
            holding.investmentDescription = inv->second.description;
            holding.investmentPublicId = inv->second.publicId;
            holding.currencyId = inv->second.currencyId;
            auto cur = currencies.find(inv->second.currencyId);
            if (cur != currencies.end()) {
                holding.currencyCode = cur->second.code;
                holding.currencyDescription = cur->second.description;
            }
        }
        return holding;
    }

    domain::Investment withCurrency(domain::Investment investment) const {
        auto cur = currencies.find(investment.currencyId);
        investment.currencyCode = cur != currencies.end() ? cur->second.code : "";
        return investment;
    }

    domain::Account withHoldingsCount(domain::Account account) const {
        account.holdingsCount = 0;
        for (const auto& [id, holding] : holdings) {
            if (holding.accountId == account.id) ++account.holdingsCount;
        }
        return account;
    }
};

/**
 * @brief Общее состояние для всех InMemory-репозиториев одного теста
 *
 * Засевается так же, как PostgresSchema::init(): GBP и типы инструментов.
 */
class InMemoryDatabase {
public:
    InMemoryDatabase() {
        seedType("SHARE", "Shares");
        seedType("MUTUAL", "Mutual Funds");
        seedType("TRUST", "Investment Trusts");
        seedType("SAVINGS", "Savings Accounts");
        seedType("OTHER", "Other");

        domain::Currency gbp;
        gbp.id = tables_.allocateId();
        gbp.code = domain::BASE_CURRENCY_CODE;
        gbp.description = "British Pound Sterling";
        tables_.currencies[gbp.id] = gbp;
        baseCurrencyId_ = gbp.id;
    }

    std::recursive_mutex& mutex() { return mutex_; }
    InMemoryTables& tables() { return tables_; }

    int64_t baseCurrencyId() const { return baseCurrencyId_; }
    int64_t shareTypeId() const { return shareTypeId_; }

private:
    std::recursive_mutex mutex_;
    InMemoryTables tables_;
    int64_t baseCurrencyId_ = 0;
    int64_t shareTypeId_ = 0;

    void seedType(const std::string& shortDescription, const std::string& description) {
        domain::InvestmentType type;
        type.id = tables_.allocateId();
        type.shortDescription = shortDescription;
        type.description = description;
        tables_.investmentTypes[type.id] = type;
        if (shortDescription == "SHARE") shareTypeId_ = type.id;
    }
};

} // namespace ledger::tests::mocks
