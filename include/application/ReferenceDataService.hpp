// include/application/ReferenceDataService.hpp
#pragma once

#include "ports/input/IReferenceDataService.hpp"
#include "ports/output/ICurrencyRepository.hpp"
#include "ports/output/IInvestmentRepository.hpp"
#include "ports/output/IPriceRepository.hpp"
#include "ports/output/IExchangeRateRepository.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/FixedPoint.hpp"
#include "domain/IsoDate.hpp"
#include "domain/exceptions/LedgerException.hpp"
#include <memory>
#include <iostream>
#include <algorithm>
#include <cctype>

namespace ledger::application {

/**
 * @brief Справочные данные и доступ к ценам/курсам
 *
 * Отсутствие цены или курса — std::nullopt, не ошибка.
 * Базовая валюта (GBP) всегда имеет курс 1.0 и в хранилище не ищется.
 */
class ReferenceDataService : public ports::input::IReferenceDataService {
public:
    static constexpr std::size_t MAX_INVESTMENT_DESCRIPTION = 60;
    static constexpr std::size_t MAX_PUBLIC_ID = 20;
    static constexpr std::size_t MAX_CURRENCY_DESCRIPTION = 30;

    ReferenceDataService(
        std::shared_ptr<ports::output::ICurrencyRepository> currencyRepo,
        std::shared_ptr<ports::output::IInvestmentRepository> investmentRepo,
        std::shared_ptr<ports::output::IPriceRepository> priceRepo,
        std::shared_ptr<ports::output::IExchangeRateRepository> rateRepo,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : currencyRepo_(std::move(currencyRepo))
      , investmentRepo_(std::move(investmentRepo))
      , priceRepo_(std::move(priceRepo))
      , rateRepo_(std::move(rateRepo))
      , settings_(std::move(settings))
    {
        std::clog << "[ReferenceDataService] Created" << std::endl;
    }

    // ========================================================================
    // Валюты
    // ========================================================================

    std::vector<domain::Currency> listCurrencies() override {
        return currencyRepo_->findAll();
    }

    std::optional<domain::Currency> getCurrency(int64_t currencyId) override {
        return currencyRepo_->findById(currencyId);
    }

    domain::Currency createCurrency(const ports::input::CurrencyRequest& request) override {
        domain::Currency currency = validateCurrency(request);

        if (currencyRepo_->findByCode(currency.code)) {
            throw domain::ConflictException("Currency code already exists");
        }

        auto saved = currencyRepo_->save(currency);
        std::clog << "[ReferenceDataService] Created currency " << saved.code << std::endl;
        return saved;
    }

    domain::Currency updateCurrency(int64_t currencyId, const ports::input::CurrencyRequest& request) override {
        domain::Currency currency = validateCurrency(request);
        currency.id = currencyId;

        auto existing = currencyRepo_->findById(currencyId);
        if (!existing) {
            throw domain::NotFoundException("Currency not found");
        }
        if (existing->isBase() && !currency.isBase()) {
            throw domain::ConflictException("Base currency code cannot be changed");
        }

        auto sameCode = currencyRepo_->findByCode(currency.code);
        if (sameCode && sameCode->id != currencyId) {
            throw domain::ConflictException("Currency code already exists");
        }

        if (!currencyRepo_->update(currency)) {
            throw domain::NotFoundException("Currency not found");
        }
        return currency;
    }

    void deleteCurrency(int64_t currencyId) override {
        auto existing = currencyRepo_->findById(currencyId);
        if (!existing) {
            throw domain::NotFoundException("Currency not found");
        }
        if (existing->isBase()) {
            throw domain::ConflictException("Base currency cannot be deleted");
        }
        if (currencyRepo_->countInvestmentsUsing(currencyId) > 0) {
            throw domain::ConflictException("Currency is used by investments");
        }
        if (!currencyRepo_->deleteById(currencyId)) {
            throw domain::NotFoundException("Currency not found");
        }
        std::clog << "[ReferenceDataService] Deleted currency " << existing->code << std::endl;
    }

    // ========================================================================
    // Инструменты
    // ========================================================================

    std::vector<domain::InvestmentType> listInvestmentTypes() override {
        return investmentRepo_->findAllTypes();
    }

    std::vector<domain::Investment> listInvestments() override {
        return investmentRepo_->findAll();
    }

    std::optional<domain::Investment> getInvestment(int64_t investmentId) override {
        return investmentRepo_->findById(investmentId);
    }

    domain::Investment createInvestment(const ports::input::InvestmentRequest& request) override {
        domain::Investment investment = validateInvestment(request);
        auto saved = investmentRepo_->save(investment);
        std::clog << "[ReferenceDataService] Created investment " << saved.id
                  << " '" << saved.description << "'" << std::endl;
        return saved;
    }

    domain::Investment updateInvestment(int64_t investmentId, const ports::input::InvestmentRequest& request) override {
        domain::Investment investment = validateInvestment(request);
        investment.id = investmentId;

        if (!investmentRepo_->update(investment)) {
            throw domain::NotFoundException("Investment not found");
        }

        auto updated = investmentRepo_->findById(investmentId);
        if (!updated) {
            throw domain::NotFoundException("Investment not found");
        }
        return *updated;
    }

    void deleteInvestment(int64_t investmentId) override {
        if (!investmentRepo_->findById(investmentId)) {
            throw domain::NotFoundException("Investment not found");
        }
        if (investmentRepo_->countHoldingsUsing(investmentId) > 0) {
            throw domain::ConflictException("Investment is held in one or more accounts");
        }
        if (!investmentRepo_->deleteById(investmentId)) {
            throw domain::NotFoundException("Investment not found");
        }
        std::clog << "[ReferenceDataService] Deleted investment " << investmentId << std::endl;
    }

    // ========================================================================
    // Цены и курсы
    // ========================================================================

    std::optional<domain::Price> latestPrice(int64_t investmentId) override {
        return priceRepo_->findLatest(investmentId);
    }

    std::optional<domain::Price> priceOnDate(int64_t investmentId, const std::string& date) override {
        return priceRepo_->findByDate(investmentId, date);
    }

    std::vector<domain::Price> priceHistory(int64_t investmentId, int limit = 0) override {
        return priceRepo_->findHistory(investmentId, limit > 0 ? limit : settings_->getHistoryLimit());
    }

    std::optional<domain::ExchangeRate> latestRate(int64_t currencyId) override {
        auto currency = currencyRepo_->findById(currencyId);
        if (!currency) {
            return std::nullopt;
        }
        if (currency->isBase()) {
            return baseRate(currencyId, domain::IsoDate::today());
        }
        return rateRepo_->findLatest(currencyId);
    }

    std::optional<domain::ExchangeRate> rateOnDate(int64_t currencyId, const std::string& date) override {
        auto currency = currencyRepo_->findById(currencyId);
        if (!currency) {
            return std::nullopt;
        }
        if (currency->isBase()) {
            return baseRate(currencyId, date);
        }
        return rateRepo_->findByDate(currencyId, date);
    }

    std::vector<domain::ExchangeRate> rateHistory(int64_t currencyId, int limit = 0) override {
        return rateRepo_->findHistory(currencyId, limit > 0 ? limit : settings_->getHistoryLimit());
    }

    void upsertPrice(int64_t investmentId, const std::string& date, double price) override {
        if (!domain::IsoDate::isValid(date)) {
            throw domain::ValidationException("Price date must be in YYYY-MM-DD format");
        }
        int64_t scaled = domain::FixedPoint::scale(price);
        if (scaled <= 0) {
            throw domain::ValidationException("Price must be greater than zero");
        }
        if (!investmentRepo_->findById(investmentId)) {
            throw domain::NotFoundException("Investment not found");
        }

        domain::Price row;
        row.investmentId = investmentId;
        row.priceDate = date;
        row.price = scaled;
        priceRepo_->upsert(row);
    }

    void upsertRate(int64_t currencyId, const std::string& date, double rate) override {
        if (!domain::IsoDate::isValid(date)) {
            throw domain::ValidationException("Rate date must be in YYYY-MM-DD format");
        }
        int64_t scaled = domain::FixedPoint::scale(rate);
        if (scaled <= 0) {
            throw domain::ValidationException("Rate must be greater than zero");
        }

        auto currency = currencyRepo_->findById(currencyId);
        if (!currency) {
            throw domain::NotFoundException("Currency not found");
        }
        if (currency->isBase()) {
            throw domain::ValidationException("Base currency has no exchange rate");
        }

        domain::ExchangeRate row;
        row.currencyId = currencyId;
        row.rateDate = date;
        row.rate = scaled;
        rateRepo_->upsert(row);
    }

private:
    std::shared_ptr<ports::output::ICurrencyRepository> currencyRepo_;
    std::shared_ptr<ports::output::IInvestmentRepository> investmentRepo_;
    std::shared_ptr<ports::output::IPriceRepository> priceRepo_;
    std::shared_ptr<ports::output::IExchangeRateRepository> rateRepo_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    static domain::ExchangeRate baseRate(int64_t currencyId, const std::string& date) {
        domain::ExchangeRate rate;
        rate.currencyId = currencyId;
        rate.rateDate = date;
        rate.rate = domain::FixedPoint::SCALE_FACTOR;
        return rate;
    }

    static std::string trim(const std::string& text) {
        auto begin = text.find_first_not_of(" \t");
        if (begin == std::string::npos) return "";
        auto end = text.find_last_not_of(" \t");
        return text.substr(begin, end - begin + 1);
    }

    static domain::Currency validateCurrency(const ports::input::CurrencyRequest& request) {
        domain::Currency currency;
        currency.code = trim(request.code);
        std::transform(currency.code.begin(), currency.code.end(), currency.code.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        currency.description = trim(request.description);

        bool letters = std::all_of(currency.code.begin(), currency.code.end(),
                                   [](unsigned char c) { return std::isalpha(c) != 0; });
        if (currency.code.size() != 3 || !letters) {
            throw domain::ValidationException("Currency code must be 3 letters");
        }
        if (currency.description.empty()) {
            throw domain::ValidationException("Currency description is required");
        }
        if (currency.description.size() > MAX_CURRENCY_DESCRIPTION) {
            throw domain::ValidationException("Currency description must be 30 characters or fewer");
        }
        return currency;
    }

    domain::Investment validateInvestment(const ports::input::InvestmentRequest& request) {
        domain::Investment investment;
        investment.currencyId = request.currencyId;
        investment.typeId = request.typeId;
        investment.description = trim(request.description);
        investment.publicId = request.publicId;
        investment.url = request.url;
        investment.selector = request.selector;

        if (investment.description.empty()) {
            throw domain::ValidationException("Investment description is required");
        }
        if (investment.description.size() > MAX_INVESTMENT_DESCRIPTION) {
            throw domain::ValidationException("Investment description must be 60 characters or fewer");
        }
        if (investment.publicId && investment.publicId->size() > MAX_PUBLIC_ID) {
            throw domain::ValidationException("Public ID must be 20 characters or fewer");
        }
        if (investment.publicId && investment.publicId->empty()) {
            investment.publicId.reset();
        }

        auto currency = currencyRepo_->findById(request.currencyId);
        if (!currency) {
            throw domain::NotFoundException("Currency not found");
        }
        if (!investmentRepo_->findTypeById(request.typeId)) {
            throw domain::NotFoundException("Investment type not found");
        }
        investment.currencyCode = currency->code;
        return investment;
    }
};

} // namespace ledger::application
