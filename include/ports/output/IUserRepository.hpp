#pragma once

#include "domain/User.hpp"
#include <optional>
#include <vector>
#include <cstdint>

namespace ledger::ports::output {

class IUserRepository {
public:
    virtual ~IUserRepository() = default;

    virtual domain::User save(const domain::User& user) = 0;
    virtual std::optional<domain::User> findById(int64_t userId) = 0;
    virtual std::vector<domain::User> findAll() = 0;
};

} // namespace ledger::ports::output
