// include/application/CashLedgerService.hpp
#pragma once

#include "ports/input/ICashLedgerService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/ICashTransactionRepository.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "settings/LedgerSettings.hpp"
#include "settings/IsaAllowanceSettings.hpp"
#include "domain/FixedPoint.hpp"
#include "domain/IsoDate.hpp"
#include "domain/exceptions/LedgerException.hpp"
#include <memory>
#include <iostream>

namespace ledger::application {

/**
 * @brief Денежный журнал счёта
 *
 * Каждая ручная запись (deposit / withdrawal / drawdown / adjustment)
 * в одной единице работы:
 *   lockAccount → проверка остатка → updateCashBalance → insert → commit
 *
 * Записи buy/sell создаёт только MovementService.
 */
class CashLedgerService : public ports::input::ICashLedgerService {
public:
    static constexpr std::size_t MAX_NOTES_LENGTH = 255;

    CashLedgerService(
        std::shared_ptr<ports::output::IAccountRepository> accountRepo,
        std::shared_ptr<ports::output::ICashTransactionRepository> transactionRepo,
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<settings::LedgerSettings> settings,
        std::shared_ptr<settings::IsaAllowanceSettings> isaSettings
    ) : accountRepo_(std::move(accountRepo))
      , transactionRepo_(std::move(transactionRepo))
      , uowFactory_(std::move(uowFactory))
      , settings_(std::move(settings))
      , isaSettings_(std::move(isaSettings))
    {
        std::clog << "[CashLedgerService] Created" << std::endl;
    }

    domain::CashTransaction record(const ports::input::CashTransactionRequest& request) override {
        int64_t effect = validate(request);

        auto uow = uowFactory_->begin();

        auto account = uow->lockAccount(request.accountId);
        if (!account) {
            throw domain::NotFoundException("Account not found");
        }

        int64_t newBalance = account->cashBalance + effect;
        if (newBalance < 0) {
            throw domain::InsufficientFundsException("Insufficient funds");
        }

        uow->updateCashBalance(account->id, newBalance);

        domain::CashTransaction row;
        row.accountId = account->id;
        row.transactionType = *request.transactionType;
        row.transactionDate = *request.transactionDate;
        row.amount = effect;
        row.balanceAfter = newBalance;
        if (request.notes && !request.notes->empty()) {
            row.notes = request.notes;
        }
        row = uow->insertCashTransaction(row);

        uow->commit();

        std::clog << "[CashLedgerService] " << domain::toString(row.transactionType)
                  << " account=" << row.accountId
                  << " amount=" << domain::FixedPoint::format(row.amount)
                  << " balance=" << domain::FixedPoint::format(row.balanceAfter)
                  << std::endl;

        return row;
    }

    std::optional<domain::CashTransaction> getTransaction(int64_t transactionId) override {
        return transactionRepo_->findById(transactionId);
    }

    std::vector<domain::CashTransaction> history(int64_t accountId, int limit = 0, int offset = 0) override {
        if (!accountRepo_->findById(accountId)) {
            throw domain::NotFoundException("Account not found");
        }
        if (offset < 0) {
            throw domain::ValidationException("Offset must not be negative");
        }
        return transactionRepo_->findByAccountId(
            accountId, limit > 0 ? limit : settings_->getHistoryLimit(), offset);
    }

    void remove(int64_t transactionId) override {
        auto uow = uowFactory_->begin();

        auto row = uow->lockCashTransaction(transactionId);
        if (!row) {
            throw domain::NotFoundException("Cash transaction not found");
        }
        if (row->holdingMovementId || domain::isMovementLinked(row->transactionType)) {
            throw domain::ConflictException("Transaction belongs to a holding movement");
        }
        if (row->transactionType == domain::TransactionType::DRAWDOWN) {
            throw domain::ConflictException(
                "Drawdown transactions are system-generated and cannot be deleted");
        }

        auto account = uow->lockAccount(row->accountId);
        if (!account) {
            throw domain::NotFoundException("Account not found");
        }

        int64_t newBalance = account->cashBalance - row->amount;
        if (newBalance < 0) {
            throw domain::InsufficientFundsException("Insufficient funds");
        }

        uow->deleteCashTransaction(row->id);
        uow->updateCashBalance(account->id, newBalance);
        uow->commit();

        std::clog << "[CashLedgerService] Removed transaction " << transactionId
                  << " account=" << account->id
                  << " balance=" << domain::FixedPoint::format(newBalance) << std::endl;
    }

    domain::IsaAllowance isaAllowance(int64_t accountId, const std::string& onDate) override {
        if (!domain::IsoDate::isValid(onDate)) {
            throw domain::ValidationException("Date must be in YYYY-MM-DD format");
        }

        auto account = accountRepo_->findById(accountId);
        if (!account) {
            throw domain::NotFoundException("Account not found");
        }
        if (account->accountType != domain::AccountType::ISA) {
            throw domain::ValidationException("Not an ISA account");
        }

        auto taxYear = domain::IsoDate::taxYearContaining(
            onDate, isaSettings_->getTaxYearStartMonth(), isaSettings_->getTaxYearStartDay());

        domain::IsaAllowance allowance;
        allowance.accountId = accountId;
        allowance.taxYear = taxYear.label;
        allowance.taxYearStart = taxYear.start;
        allowance.taxYearEnd = taxYear.end;
        allowance.annualLimit = isaSettings_->getAnnualLimit();
        allowance.depositsThisYear = transactionRepo_->sumDeposits(accountId, taxYear.start, taxYear.end);
        allowance.remaining = allowance.annualLimit - allowance.depositsThisYear;
        return allowance;
    }

    bool drawdownExists(int64_t accountId, const std::string& date) override {
        if (!domain::IsoDate::isValid(date)) {
            throw domain::ValidationException("Date must be in YYYY-MM-DD format");
        }
        return transactionRepo_->existsOfTypeOnDate(accountId, domain::TransactionType::DRAWDOWN, date);
    }

private:
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
    std::shared_ptr<ports::output::ICashTransactionRepository> transactionRepo_;
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<settings::LedgerSettings> settings_;
    std::shared_ptr<settings::IsaAllowanceSettings> isaSettings_;

    /**
     * @brief Структурная проверка, возвращает знаковый эффект на баланс ×10000
     */
    static int64_t validate(const ports::input::CashTransactionRequest& request) {
        using domain::TransactionType;

        if (!request.transactionType) {
            throw domain::ValidationException("Transaction type is required");
        }
        TransactionType type = *request.transactionType;
        if (domain::isMovementLinked(type)) {
            throw domain::ValidationException(
                "Transaction type '" + domain::toString(type) + "' is recorded by holding movements");
        }

        if (!request.transactionDate || request.transactionDate->empty()) {
            throw domain::ValidationException("Transaction date is required");
        }
        if (!domain::IsoDate::isValid(*request.transactionDate)) {
            throw domain::ValidationException("Transaction date must be in YYYY-MM-DD format");
        }

        if (!request.amount) {
            throw domain::ValidationException("Amount is required");
        }
        int64_t amount = domain::FixedPoint::scale(*request.amount);

        if (request.notes && request.notes->size() > MAX_NOTES_LENGTH) {
            throw domain::ValidationException("Notes must be 255 characters or fewer");
        }

        switch (type) {
            case TransactionType::DEPOSIT:
                if (amount <= 0) throw domain::ValidationException("Amount must be greater than zero");
                return amount;
            case TransactionType::WITHDRAWAL:
            case TransactionType::DRAWDOWN:
                if (amount <= 0) throw domain::ValidationException("Amount must be greater than zero");
                return -amount;
            case TransactionType::ADJUSTMENT:
                if (amount == 0) throw domain::ValidationException("Adjustment amount must not be zero");
                return amount;
            default:
                throw domain::ValidationException("Unsupported transaction type");
        }
    }
};

} // namespace ledger::application
