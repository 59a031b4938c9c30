// include/application/ValuationService.hpp
#pragma once

#include "ports/input/IValuationService.hpp"
#include "ports/output/IUserRepository.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IHoldingRepository.hpp"
#include "ports/output/IPriceRepository.hpp"
#include "ports/output/IExchangeRateRepository.hpp"
#include "domain/Currency.hpp"
#include "domain/FixedPoint.hpp"
#include "domain/IsoDate.hpp"
#include "domain/exceptions/LedgerException.hpp"
#include <memory>
#include <iostream>

namespace ledger::application {

/**
 * @brief Оценка портфеля в базовой валюте
 *
 * Только чтение, без состояния. Для каждой позиции:
 *   valueLocal = quantity × price
 *   valueBase  = valueLocal                (базовая валюта, курс не ищется)
 *              = valueLocal / rate         (иначе)
 *
 * Нет цены → позиция в списке с hasPrice = false и нулевой стоимостью.
 * Нет курса → hasRate = false, valueBase = 0.
 * Неполные справочные данные никогда не приводят к исключению.
 */
class ValuationService : public ports::input::IValuationService {
public:
    ValuationService(
        std::shared_ptr<ports::output::IUserRepository> userRepo,
        std::shared_ptr<ports::output::IAccountRepository> accountRepo,
        std::shared_ptr<ports::output::IHoldingRepository> holdingRepo,
        std::shared_ptr<ports::output::IPriceRepository> priceRepo,
        std::shared_ptr<ports::output::IExchangeRateRepository> rateRepo
    ) : userRepo_(std::move(userRepo))
      , accountRepo_(std::move(accountRepo))
      , holdingRepo_(std::move(holdingRepo))
      , priceRepo_(std::move(priceRepo))
      , rateRepo_(std::move(rateRepo))
    {
        std::clog << "[ValuationService] Created" << std::endl;
    }

    domain::AccountValuation valueAccount(
        int64_t accountId,
        const std::optional<std::string>& asOfDate = std::nullopt
    ) override {
        checkDate(asOfDate);

        auto account = accountRepo_->findById(accountId);
        if (!account) {
            throw domain::NotFoundException("Account not found");
        }
        return valueAccountRow(*account, asOfDate);
    }

    domain::UserValuation valueUser(
        int64_t userId,
        const std::optional<std::string>& asOfDate = std::nullopt
    ) override {
        checkDate(asOfDate);

        auto user = userRepo_->findById(userId);
        if (!user) {
            throw domain::NotFoundException("User not found");
        }
        return valueUserRow(*user, asOfDate);
    }

    std::vector<domain::UserValuation> valueAllUsers(
        const std::optional<std::string>& asOfDate = std::nullopt
    ) override {
        checkDate(asOfDate);

        std::vector<domain::UserValuation> result;
        for (const auto& user : userRepo_->findAll()) {
            result.push_back(valueUserRow(user, asOfDate));
        }
        return result;
    }

private:
    std::shared_ptr<ports::output::IUserRepository> userRepo_;
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
    std::shared_ptr<ports::output::IHoldingRepository> holdingRepo_;
    std::shared_ptr<ports::output::IPriceRepository> priceRepo_;
    std::shared_ptr<ports::output::IExchangeRateRepository> rateRepo_;

    static void checkDate(const std::optional<std::string>& asOfDate) {
        if (asOfDate && !domain::IsoDate::isValid(*asOfDate)) {
            throw domain::ValidationException("Valuation date must be in YYYY-MM-DD format");
        }
    }

    domain::UserValuation valueUserRow(
        const domain::User& user,
        const std::optional<std::string>& asOfDate
    ) {
        domain::UserValuation valuation;
        valuation.userId = user.id;
        valuation.firstName = user.firstName;
        valuation.lastName = user.lastName;
        valuation.valuationDate = asOfDate ? *asOfDate : domain::IsoDate::today();
        valuation.pointInTime = asOfDate.has_value();

        double investments = 0.0;
        double cash = 0.0;
        for (const auto& account : accountRepo_->findByUserId(user.id)) {
            auto accountValuation = valueAccountRow(account, asOfDate);
            investments += accountValuation.investmentsTotal;
            cash += accountValuation.cashBalance;
            valuation.accounts.push_back(std::move(accountValuation));
        }

        valuation.totals.investments = domain::FixedPoint::roundToPence(investments);
        valuation.totals.cash = domain::FixedPoint::roundToPence(cash);
        valuation.totals.grandTotal = domain::FixedPoint::roundToPence(investments + cash);
        return valuation;
    }

    domain::AccountValuation valueAccountRow(
        const domain::Account& account,
        const std::optional<std::string>& asOfDate
    ) {
        domain::AccountValuation valuation;
        valuation.accountId = account.id;
        valuation.accountType = domain::toString(account.accountType);
        valuation.accountRef = account.accountRef;
        valuation.cashBalance = domain::FixedPoint::roundToPence(account.cashBalanceValue());
        valuation.warnCash = domain::FixedPoint::roundToPence(account.warnCashValue());
        valuation.cashWarning = account.isCashWarning();

        double investments = 0.0;
        for (const auto& holding : holdingRepo_->findByAccountId(account.id)) {
            auto holdingValuation = valueHolding(holding, asOfDate);
            investments += holdingValuation.valueBase;
            valuation.holdings.push_back(std::move(holdingValuation));
        }

        valuation.investmentsTotal = domain::FixedPoint::roundToPence(investments);
        valuation.accountTotal = domain::FixedPoint::roundToPence(investments + valuation.cashBalance);
        return valuation;
    }

    domain::HoldingValuation valueHolding(
        const domain::Holding& holding,
        const std::optional<std::string>& asOfDate
    ) {
        using domain::FixedPoint;

        domain::HoldingValuation v;
        v.holdingId = holding.id;
        v.investmentId = holding.investmentId;
        v.description = holding.investmentDescription;
        v.publicId = holding.investmentPublicId;
        v.currencyCode = holding.currencyCode;
        v.quantity = holding.quantityValue();
        v.averageCost = holding.averageCostValue();

        auto price = asOfDate
            ? priceRepo_->findByDate(holding.investmentId, *asOfDate)
            : priceRepo_->findLatest(holding.investmentId);
        if (!price) {
            return v;
        }
        v.hasPrice = true;
        v.price = FixedPoint::unscale(price->price);
        v.priceDate = price->priceDate;

        double valueLocal = FixedPoint::unscale(holding.quantity) * FixedPoint::unscale(price->price);
        v.valueLocal = FixedPoint::roundToPence(valueLocal);

        if (holding.currencyCode == domain::BASE_CURRENCY_CODE) {
            v.hasRate = true;
            v.rate = 1.0;
            v.valueBase = v.valueLocal;
            return v;
        }

        auto rate = asOfDate
            ? rateRepo_->findByDate(holding.currencyId, *asOfDate)
            : rateRepo_->findLatest(holding.currencyId);
        if (!rate || rate->rate <= 0) {
            return v;
        }
        v.hasRate = true;
        v.rate = FixedPoint::unscale(rate->rate);
        v.rateDate = rate->rateDate;
        v.valueBase = FixedPoint::roundToPence(valueLocal / FixedPoint::unscale(rate->rate));
        return v;
    }
};

} // namespace ledger::application
