// include/application/MovementService.hpp
#pragma once

#include "ports/input/IMovementService.hpp"
#include "ports/output/IHoldingRepository.hpp"
#include "ports/output/IHoldingMovementRepository.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/FixedPoint.hpp"
#include "domain/IsoDate.hpp"
#include "domain/exceptions/LedgerException.hpp"
#include <memory>
#include <iostream>

namespace ledger::application {

/**
 * @brief Обработчик движений по позиции (buy / sell / adjustment)
 *
 * Поток applyMovement():
 * 1. Структурная валидация запроса (без обращения к хранилищу)
 * 2. Проверка существования позиции
 * 3. Единица работы: блокировка позиции, затем счёта
 * 4. Доменные проверки по заблокированным строкам
 * 5. Изменение позиции, баланса, запись движения и записи журнала
 * 6. commit()
 *
 * Любое исключение до commit() откатывает всю единицу работы.
 */
class MovementService : public ports::input::IMovementService {
public:
    static constexpr std::size_t MAX_NOTES_LENGTH = 255;

    MovementService(
        std::shared_ptr<ports::output::IHoldingRepository> holdingRepo,
        std::shared_ptr<ports::output::IHoldingMovementRepository> movementRepo,
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : holdingRepo_(std::move(holdingRepo))
      , movementRepo_(std::move(movementRepo))
      , uowFactory_(std::move(uowFactory))
      , settings_(std::move(settings))
    {
        std::clog << "[MovementService] Created" << std::endl;
    }

    domain::MovementResult applyMovement(const ports::input::MovementRequest& request) override {
        ValidatedMovement movement = validate(request);

        if (!holdingRepo_->findById(request.holdingId)) {
            throw domain::NotFoundException("Holding not found");
        }

        auto uow = uowFactory_->begin();

        // Порядок блокировок одинаковый для всех операций: позиция, затем счёт
        auto holding = uow->lockHolding(request.holdingId);
        if (!holding) {
            throw domain::NotFoundException("Holding not found");
        }
        auto account = uow->lockAccount(holding->accountId);
        if (!account) {
            throw domain::NotFoundException("Account not found");
        }

        domain::MovementResult result;
        switch (movement.type) {
            case domain::MovementType::BUY:
                result = applyBuy(*uow, movement, *holding, *account);
                break;
            case domain::MovementType::SELL:
                result = applySell(*uow, movement, *holding, *account);
                break;
            case domain::MovementType::ADJUSTMENT:
                result = applyAdjustment(*uow, movement, *holding, *account);
                break;
        }

        uow->commit();

        std::clog << "[MovementService] " << domain::toString(movement.type)
                  << " holding=" << result.holding.id
                  << " qty=" << domain::FixedPoint::format(result.holding.quantity)
                  << " avg=" << domain::FixedPoint::format(result.holding.averageCost)
                  << " cash=" << domain::FixedPoint::format(result.account.cashBalance)
                  << std::endl;

        return result;
    }

    std::optional<domain::HoldingMovement> getMovement(int64_t movementId) override {
        return movementRepo_->findById(movementId);
    }

    std::vector<domain::HoldingMovement> listMovements(int64_t holdingId, int limit = 0) override {
        if (!holdingRepo_->findById(holdingId)) {
            throw domain::NotFoundException("Holding not found");
        }
        return movementRepo_->findByHoldingId(holdingId, limit > 0 ? limit : settings_->getHistoryLimit());
    }

private:
    std::shared_ptr<ports::output::IHoldingRepository> holdingRepo_;
    std::shared_ptr<ports::output::IHoldingMovementRepository> movementRepo_;
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    /// Запрос после структурной проверки, все суммы ×10000
    struct ValidatedMovement {
        domain::MovementType type = domain::MovementType::BUY;
        std::string date;
        int64_t quantity = 0;           ///< buy/sell: количество, adjustment: новое количество
        int64_t totalConsideration = 0;
        int64_t deductibleCosts = 0;
        std::optional<std::string> notes;
    };

    static ValidatedMovement validate(const ports::input::MovementRequest& request) {
        ValidatedMovement v;

        if (!request.movementType) {
            throw domain::ValidationException("Movement type is required");
        }
        v.type = *request.movementType;

        if (!request.movementDate || request.movementDate->empty()) {
            throw domain::ValidationException("Movement date is required");
        }
        if (!domain::IsoDate::isValid(*request.movementDate)) {
            throw domain::ValidationException("Movement date must be in YYYY-MM-DD format");
        }
        v.date = *request.movementDate;

        if (v.type == domain::MovementType::ADJUSTMENT) {
            if (!request.newQuantity) {
                throw domain::ValidationException("New quantity is required");
            }
            v.quantity = domain::FixedPoint::scale(*request.newQuantity);
            if (v.quantity <= 0) {
                throw domain::ValidationException("New quantity must be greater than zero");
            }
        } else {
            if (!request.quantity) {
                throw domain::ValidationException("Quantity is required");
            }
            v.quantity = domain::FixedPoint::scale(*request.quantity);
            if (v.quantity <= 0) {
                throw domain::ValidationException("Quantity must be greater than zero");
            }

            if (!request.totalConsideration) {
                throw domain::ValidationException("Total consideration is required");
            }
            v.totalConsideration = domain::FixedPoint::scale(*request.totalConsideration);
            if (v.totalConsideration < 0) {
                throw domain::ValidationException("Total consideration must not be negative");
            }

            v.deductibleCosts = domain::FixedPoint::scale(request.deductibleCosts.value_or(0.0));
            if (v.deductibleCosts < 0) {
                throw domain::ValidationException("Deductible costs must not be negative");
            }
            if (v.deductibleCosts > v.totalConsideration) {
                throw domain::ValidationException("Deductible costs must not exceed total consideration");
            }
        }

        if (request.notes && request.notes->size() > MAX_NOTES_LENGTH) {
            throw domain::ValidationException("Notes must be 255 characters or fewer");
        }
        if (request.notes && !request.notes->empty()) {
            v.notes = request.notes;
        }

        return v;
    }

    /**
     * @brief Покупка: средняя цена пересчитывается по балансовой стоимости
     *
     * newAvg = (avg × qty + bookCost) / (qty + quantity), вычисляется
     * в десятичной области и масштабируется один раз.
     */
    static domain::MovementResult applyBuy(
        ports::output::IUnitOfWork& uow,
        const ValidatedMovement& v,
        domain::Holding holding,
        domain::Account account
    ) {
        using domain::FixedPoint;

        int64_t bookCost = v.totalConsideration - v.deductibleCosts;

        if (v.totalConsideration > account.cashBalance) {
            throw domain::InsufficientFundsException("Insufficient cash");
        }

        int64_t newQuantity = holding.quantity + v.quantity;
        double existingCost = FixedPoint::unscale(holding.averageCost) * FixedPoint::unscale(holding.quantity);
        double newAverage = (existingCost + FixedPoint::unscale(bookCost)) / FixedPoint::unscale(newQuantity);
        int64_t newAverageCost = FixedPoint::scale(newAverage);

        holding.quantity = newQuantity;
        holding.averageCost = newAverageCost;
        account.cashBalance -= v.totalConsideration;

        uow.updateHoldingPosition(holding.id, holding.quantity, holding.averageCost);
        uow.updateCashBalance(account.id, account.cashBalance);

        domain::HoldingMovement movement;
        movement.holdingId = holding.id;
        movement.movementType = domain::MovementType::BUY;
        movement.movementDate = v.date;
        movement.quantity = v.quantity;
        movement.movementValue = v.totalConsideration;
        movement.deductibleCosts = v.deductibleCosts;
        movement.bookCost = bookCost;
        movement.revisedAvgCost = newAverageCost;
        movement.notes = v.notes;
        movement = uow.insertMovement(movement);

        insertLedgerRow(uow, account, movement, domain::TransactionType::BUY, -v.totalConsideration);

        return domain::MovementResult{movement, holding, account};
    }

    /**
     * @brief Продажа: средняя цена не меняется, на счёт поступает нетто-выручка
     */
    static domain::MovementResult applySell(
        ports::output::IUnitOfWork& uow,
        const ValidatedMovement& v,
        domain::Holding holding,
        domain::Account account
    ) {
        using domain::FixedPoint;

        if (v.quantity > holding.quantity) {
            throw domain::InsufficientQuantityException("Insufficient quantity");
        }

        int64_t netProceeds = v.totalConsideration - v.deductibleCosts;
        int64_t disposedCost = FixedPoint::scale(
            FixedPoint::unscale(v.quantity) * FixedPoint::unscale(holding.averageCost));

        holding.quantity -= v.quantity;
        account.cashBalance += netProceeds;

        uow.updateHoldingPosition(holding.id, holding.quantity, holding.averageCost);
        uow.updateCashBalance(account.id, account.cashBalance);

        domain::HoldingMovement movement;
        movement.holdingId = holding.id;
        movement.movementType = domain::MovementType::SELL;
        movement.movementDate = v.date;
        movement.quantity = v.quantity;
        movement.movementValue = v.totalConsideration;
        movement.deductibleCosts = v.deductibleCosts;
        movement.bookCost = disposedCost;
        movement.notes = v.notes;
        movement = uow.insertMovement(movement);

        insertLedgerRow(uow, account, movement, domain::TransactionType::SELL, netProceeds);

        return domain::MovementResult{movement, holding, account};
    }

    /**
     * @brief Корректировка количества (сплит, консолидация) без денег
     */
    static domain::MovementResult applyAdjustment(
        ports::output::IUnitOfWork& uow,
        const ValidatedMovement& v,
        domain::Holding holding,
        domain::Account account
    ) {
        if (v.quantity == holding.quantity) {
            throw domain::ValidationException("New quantity is the same as the current quantity");
        }

        int64_t delta = v.quantity - holding.quantity;
        holding.quantity = v.quantity;

        uow.updateHoldingPosition(holding.id, holding.quantity, holding.averageCost);

        domain::HoldingMovement movement;
        movement.holdingId = holding.id;
        movement.movementType = domain::MovementType::ADJUSTMENT;
        movement.movementDate = v.date;
        movement.quantity = delta < 0 ? -delta : delta;
        movement.notes = v.notes;
        movement = uow.insertMovement(movement);

        return domain::MovementResult{movement, holding, account};
    }

    static void insertLedgerRow(
        ports::output::IUnitOfWork& uow,
        const domain::Account& account,
        const domain::HoldingMovement& movement,
        domain::TransactionType type,
        int64_t amount
    ) {
        domain::CashTransaction row;
        row.accountId = account.id;
        row.holdingMovementId = movement.id;
        row.transactionType = type;
        row.transactionDate = movement.movementDate;
        row.amount = amount;
        row.balanceAfter = account.cashBalance;
        row.notes = movement.notes;
        uow.insertCashTransaction(row);
    }
};

} // namespace ledger::application
