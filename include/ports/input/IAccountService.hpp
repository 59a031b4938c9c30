#pragma once

#include "domain/Account.hpp"
#include "domain/User.hpp"
#include "domain/enums/AccountType.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace ledger::ports::input {

struct CreateUserRequest {
    std::string initials;
    std::string firstName;
    std::string lastName;
    std::string provider;
};

/**
 * @brief Запрос на создание счёта
 *
 * Баланс всегда начинается с 0 — деньги поступают через журнал.
 */
struct CreateAccountRequest {
    int64_t userId = 0;
    domain::AccountType accountType = domain::AccountType::TRADING;
    std::string accountRef;
    double warnCash = 0.0;
};

struct UpdateAccountRequest {
    int64_t accountId = 0;
    std::string accountRef;
    double warnCash = 0.0;
};

/**
 * @brief Пользователи и их счета
 */
class IAccountService {
public:
    virtual ~IAccountService() = default;

    virtual domain::User createUser(const CreateUserRequest& request) = 0;
    virtual std::optional<domain::User> getUser(int64_t userId) = 0;
    virtual std::vector<domain::User> listUsers() = 0;

    /**
     * @throws ValidationException, NotFoundException, ConflictException
     */
    virtual domain::Account createAccount(const CreateAccountRequest& request) = 0;

    /**
     * @brief Обновить реквизиты счёта (баланс не меняется)
     */
    virtual domain::Account updateAccount(const UpdateAccountRequest& request) = 0;

    virtual std::optional<domain::Account> getAccount(int64_t accountId) = 0;
    virtual std::vector<domain::Account> listAccounts(int64_t userId) = 0;

    /**
     * @brief Удалить счёт вместе с позициями, движениями и журналом
     * @throws NotFoundException
     */
    virtual void deleteAccount(int64_t accountId) = 0;
};

} // namespace ledger::ports::input
