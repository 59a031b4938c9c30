#pragma once

#include "domain/Currency.hpp"
#include "domain/Investment.hpp"
#include "domain/InvestmentType.hpp"
#include "domain/Price.hpp"
#include "domain/ExchangeRate.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace ledger::ports::input {

struct CurrencyRequest {
    std::string code;
    std::string description;
};

struct InvestmentRequest {
    int64_t currencyId = 0;
    int64_t typeId = 0;
    std::string description;
    std::optional<std::string> publicId;
    std::optional<std::string> url;
    std::optional<std::string> selector;
};

/**
 * @brief Справочные данные: валюты, инструменты, цены, курсы
 */
class IReferenceDataService {
public:
    virtual ~IReferenceDataService() = default;

    // --- Валюты ---
    virtual std::vector<domain::Currency> listCurrencies() = 0;
    virtual std::optional<domain::Currency> getCurrency(int64_t currencyId) = 0;
    virtual domain::Currency createCurrency(const CurrencyRequest& request) = 0;
    virtual domain::Currency updateCurrency(int64_t currencyId, const CurrencyRequest& request) = 0;
    virtual void deleteCurrency(int64_t currencyId) = 0;

    // --- Инструменты ---
    virtual std::vector<domain::InvestmentType> listInvestmentTypes() = 0;
    virtual std::vector<domain::Investment> listInvestments() = 0;
    virtual std::optional<domain::Investment> getInvestment(int64_t investmentId) = 0;
    virtual domain::Investment createInvestment(const InvestmentRequest& request) = 0;
    virtual domain::Investment updateInvestment(int64_t investmentId, const InvestmentRequest& request) = 0;
    virtual void deleteInvestment(int64_t investmentId) = 0;

    // --- Цены и курсы (чтение) ---
    virtual std::optional<domain::Price> latestPrice(int64_t investmentId) = 0;
    virtual std::optional<domain::Price> priceOnDate(int64_t investmentId, const std::string& date) = 0;
    virtual std::vector<domain::Price> priceHistory(int64_t investmentId, int limit = 0) = 0;

    /**
     * @brief Последний курс; для базовой валюты — неявный 1.0 без обращения к хранилищу
     */
    virtual std::optional<domain::ExchangeRate> latestRate(int64_t currencyId) = 0;
    virtual std::optional<domain::ExchangeRate> rateOnDate(int64_t currencyId, const std::string& date) = 0;
    virtual std::vector<domain::ExchangeRate> rateHistory(int64_t currencyId, int limit = 0) = 0;

    // --- Цены и курсы (запись внешними поставщиками) ---
    virtual void upsertPrice(int64_t investmentId, const std::string& date, double price) = 0;
    virtual void upsertRate(int64_t currencyId, const std::string& date, double rate) = 0;
};

} // namespace ledger::ports::input
