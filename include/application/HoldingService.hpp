// include/application/HoldingService.hpp
#pragma once

#include "ports/input/IHoldingService.hpp"
#include "ports/output/IHoldingRepository.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IInvestmentRepository.hpp"
#include "domain/FixedPoint.hpp"
#include "domain/exceptions/LedgerException.hpp"
#include <memory>
#include <iostream>

namespace ledger::application {

/**
 * @brief Хранилище позиций: создание, ручная корректировка, удаление
 *
 * Покупки и продажи сюда не приходят — см. MovementService.
 */
class HoldingService : public ports::input::IHoldingService {
public:
    HoldingService(
        std::shared_ptr<ports::output::IHoldingRepository> holdingRepo,
        std::shared_ptr<ports::output::IAccountRepository> accountRepo,
        std::shared_ptr<ports::output::IInvestmentRepository> investmentRepo
    ) : holdingRepo_(std::move(holdingRepo))
      , accountRepo_(std::move(accountRepo))
      , investmentRepo_(std::move(investmentRepo))
    {
        std::clog << "[HoldingService] Created" << std::endl;
    }

    domain::Holding createHolding(const ports::input::CreateHoldingRequest& request) override {
        domain::Holding holding;
        holding.accountId = request.accountId;
        holding.investmentId = request.investmentId;
        holding.quantity = domain::FixedPoint::scale(request.quantity);
        holding.averageCost = domain::FixedPoint::scale(request.averageCost);
        validatePosition(holding.quantity, holding.averageCost);

        if (!accountRepo_->findById(request.accountId)) {
            throw domain::NotFoundException("Account not found");
        }
        if (!investmentRepo_->findById(request.investmentId)) {
            throw domain::NotFoundException("Investment not found");
        }
        if (holdingRepo_->findByAccountAndInvestment(request.accountId, request.investmentId)) {
            throw domain::ConflictException("Holding already exists for this investment");
        }

        auto saved = holdingRepo_->save(holding);
        std::clog << "[HoldingService] Created holding " << saved.id
                  << " account=" << saved.accountId
                  << " investment=" << saved.investmentId << std::endl;
        return saved;
    }

    domain::Holding updateHolding(const ports::input::UpdateHoldingRequest& request) override {
        int64_t quantity = domain::FixedPoint::scale(request.quantity);
        int64_t averageCost = domain::FixedPoint::scale(request.averageCost);
        validatePosition(quantity, averageCost);

        if (!holdingRepo_->updatePosition(request.holdingId, quantity, averageCost)) {
            throw domain::NotFoundException("Holding not found");
        }

        auto updated = holdingRepo_->findById(request.holdingId);
        if (!updated) {
            throw domain::NotFoundException("Holding not found");
        }
        return *updated;
    }

    void deleteHolding(int64_t holdingId) override {
        if (!holdingRepo_->deleteById(holdingId)) {
            throw domain::NotFoundException("Holding not found");
        }
        std::clog << "[HoldingService] Deleted holding " << holdingId << std::endl;
    }

    std::optional<domain::Holding> getHolding(int64_t holdingId) override {
        return holdingRepo_->findById(holdingId);
    }

    std::vector<domain::Holding> listByAccount(int64_t accountId) override {
        return holdingRepo_->findByAccountId(accountId);
    }

private:
    std::shared_ptr<ports::output::IHoldingRepository> holdingRepo_;
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
    std::shared_ptr<ports::output::IInvestmentRepository> investmentRepo_;

    static void validatePosition(int64_t quantity, int64_t averageCost) {
        if (quantity < 0) {
            throw domain::ValidationException("Quantity must not be negative");
        }
        if (averageCost < 0) {
            throw domain::ValidationException("Average cost must not be negative");
        }
    }
};

} // namespace ledger::application
