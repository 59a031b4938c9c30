#pragma once

#include "ports/output/IUserRepository.hpp"
#include "InMemoryDatabase.hpp"
#include <algorithm>
#include <memory>
#include <tuple>

namespace ledger::tests::mocks {

class InMemoryUserRepository : public ports::output::IUserRepository {
public:
    explicit InMemoryUserRepository(std::shared_ptr<InMemoryDatabase> db) : db_(std::move(db)) {}

    domain::User save(const domain::User& user) override {
        std::lock_guard<std::recursive_mutex> lock(db_->mutex());
        domain::User saved = user;
        saved.id = db_->tables().allocateId();
        db_->tables().users[saved.id] = saved;
        return saved;
    }

    std::optional<domain::User> findById(int64_t userId) override {
        std::lock_guard<std::recursive_mutex> lock(db_->mutex());
        auto& users = db_->tables().users;
        auto it = users.find(userId);
        if (it == users.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::User> findAll() override {
        std::lock_guard<std::recursive_mutex> lock(db_->mutex());
        std::vector<domain::User> result;
        for (const auto& [id, user] : db_->tables().users) {
            result.push_back(user);
        }
        std::sort(result.begin(), result.end(), [](const domain::User& a, const domain::User& b) {
            return std::tie(a.lastName, a.firstName, a.id) < std::tie(b.lastName, b.firstName, b.id);
        });
        return result;
    }

private:
    std::shared_ptr<InMemoryDatabase> db_;
};

} // namespace ledger::tests::mocks
