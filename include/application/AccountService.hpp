// include/application/AccountService.hpp
#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/output/IUserRepository.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "domain/FixedPoint.hpp"
#include "domain/exceptions/LedgerException.hpp"
#include <memory>
#include <iostream>

namespace ledger::application {

/**
 * @brief Пользователи и их счета
 *
 * Баланс счёта здесь никогда не меняется: новый счёт начинается с 0,
 * updateAccount трогает только реквизиты.
 */
class AccountService : public ports::input::IAccountService {
public:
    static constexpr std::size_t MAX_ACCOUNT_REF = 15;
    static constexpr std::size_t MAX_INITIALS = 5;
    static constexpr std::size_t MAX_NAME = 30;

    AccountService(
        std::shared_ptr<ports::output::IUserRepository> userRepo,
        std::shared_ptr<ports::output::IAccountRepository> accountRepo
    ) : userRepo_(std::move(userRepo))
      , accountRepo_(std::move(accountRepo))
    {
        std::clog << "[AccountService] Created" << std::endl;
    }

    domain::User createUser(const ports::input::CreateUserRequest& request) override {
        if (request.initials.empty()) {
            throw domain::ValidationException("Initials are required");
        }
        if (request.initials.size() > MAX_INITIALS) {
            throw domain::ValidationException("Initials must be 5 characters or fewer");
        }
        if (request.firstName.empty()) {
            throw domain::ValidationException("First name is required");
        }
        if (request.firstName.size() > MAX_NAME || request.lastName.size() > MAX_NAME) {
            throw domain::ValidationException("Names must be 30 characters or fewer");
        }
        if (request.provider.size() > MAX_INITIALS) {
            throw domain::ValidationException("Provider must be 5 characters or fewer");
        }

        domain::User user;
        user.initials = request.initials;
        user.firstName = request.firstName;
        user.lastName = request.lastName;
        user.provider = request.provider;

        auto saved = userRepo_->save(user);
        std::clog << "[AccountService] Created user " << saved.id << " (" << saved.initials << ")" << std::endl;
        return saved;
    }

    std::optional<domain::User> getUser(int64_t userId) override {
        return userRepo_->findById(userId);
    }

    std::vector<domain::User> listUsers() override {
        return userRepo_->findAll();
    }

    domain::Account createAccount(const ports::input::CreateAccountRequest& request) override {
        int64_t warnCash = validateDetails(request.accountRef, request.warnCash);

        if (!userRepo_->findById(request.userId)) {
            throw domain::NotFoundException("User not found");
        }
        if (accountRepo_->findByUserAndType(request.userId, request.accountType)) {
            throw domain::ConflictException(
                "User already has a " + domain::toString(request.accountType) + " account");
        }

        domain::Account account;
        account.userId = request.userId;
        account.accountType = request.accountType;
        account.accountRef = request.accountRef;
        account.cashBalance = 0;
        account.warnCash = warnCash;

        auto saved = accountRepo_->save(account);
        std::clog << "[AccountService] Created " << domain::toString(saved.accountType)
                  << " account " << saved.id << " for user " << saved.userId << std::endl;
        return saved;
    }

    domain::Account updateAccount(const ports::input::UpdateAccountRequest& request) override {
        int64_t warnCash = validateDetails(request.accountRef, request.warnCash);

        if (!accountRepo_->updateDetails(request.accountId, request.accountRef, warnCash)) {
            throw domain::NotFoundException("Account not found");
        }

        auto updated = accountRepo_->findById(request.accountId);
        if (!updated) {
            throw domain::NotFoundException("Account not found");
        }
        return *updated;
    }

    std::optional<domain::Account> getAccount(int64_t accountId) override {
        return accountRepo_->findById(accountId);
    }

    std::vector<domain::Account> listAccounts(int64_t userId) override {
        return accountRepo_->findByUserId(userId);
    }

    void deleteAccount(int64_t accountId) override {
        auto account = accountRepo_->findById(accountId);
        if (!account) {
            throw domain::NotFoundException("Account not found");
        }

        std::clog << "[AccountService] Deleting " << domain::toString(account->accountType)
                  << " account " << accountId
                  << " (cash=" << domain::FixedPoint::format(account->cashBalance) << ")" << std::endl;

        if (!accountRepo_->deleteCascade(accountId)) {
            throw domain::NotFoundException("Account not found");
        }

        std::clog << "[AccountService] Deleted account " << accountId << std::endl;
    }

private:
    std::shared_ptr<ports::output::IUserRepository> userRepo_;
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;

    /**
     * @return порог предупреждения ×10000
     */
    static int64_t validateDetails(const std::string& accountRef, double warnCash) {
        if (accountRef.size() > MAX_ACCOUNT_REF) {
            throw domain::ValidationException("Account reference must be 15 characters or fewer");
        }
        int64_t scaled = domain::FixedPoint::scale(warnCash);
        if (scaled < 0) {
            throw domain::ValidationException("Cash warning threshold must not be negative");
        }
        return scaled;
    }
};

} // namespace ledger::application
