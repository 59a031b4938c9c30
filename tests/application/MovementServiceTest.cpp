#include <gtest/gtest.h>

#include "application/MovementService.hpp"
#include "mocks/InMemoryLedger.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace ledger;
using namespace ledger::tests::mocks;

namespace {

template <typename Fn>
std::string errorMessage(Fn&& fn) {
    try {
        fn();
    } catch (const domain::LedgerException& e) {
        return e.what();
    }
    return "";
}

} // namespace

class MovementServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        userId_ = ledger_.addUser("Alice");
        accountId_ = ledger_.addAccount(userId_, domain::AccountType::TRADING, 50000.0);
        investmentId_ = ledger_.addInvestment("Acme plc");
        holdingId_ = ledger_.addHolding(accountId_, investmentId_, 100, 5);

        service_ = std::make_shared<application::MovementService>(
            ledger_.holdings, ledger_.movements, ledger_.uowFactory,
            std::make_shared<settings::LedgerSettings>(50));
    }

    ports::input::MovementRequest buy(double quantity, double total, double deductible = 0.0) {
        ports::input::MovementRequest request;
        request.holdingId = holdingId_;
        request.movementType = domain::MovementType::BUY;
        request.movementDate = "2025-01-10";
        request.quantity = quantity;
        request.totalConsideration = total;
        request.deductibleCosts = deductible;
        return request;
    }

    ports::input::MovementRequest sell(double quantity, double total, double deductible = 0.0) {
        auto request = buy(quantity, total, deductible);
        request.movementType = domain::MovementType::SELL;
        return request;
    }

    ports::input::MovementRequest adjust(double newQuantity) {
        ports::input::MovementRequest request;
        request.holdingId = holdingId_;
        request.movementType = domain::MovementType::ADJUSTMENT;
        request.movementDate = "2025-01-10";
        request.newQuantity = newQuantity;
        return request;
    }

    std::vector<domain::CashTransaction> ledgerRows() {
        return ledger_.cashTransactions->findByAccountId(accountId_, 100, 0);
    }

    InMemoryLedger ledger_;
    std::shared_ptr<application::MovementService> service_;
    int64_t userId_ = 0;
    int64_t accountId_ = 0;
    int64_t investmentId_ = 0;
    int64_t holdingId_ = 0;
};

// ============================================
// BUY
// ============================================

TEST_F(MovementServiceTest, Buy_RecalculatesAverageFromBookCost) {
    auto result = service_->applyMovement(buy(50, 300, 10));

    // (100 × 5 + 290) / 150 = 5.26666…
    EXPECT_EQ(result.holding.quantity, 1500000);
    EXPECT_EQ(result.holding.averageCost, 52667);
    EXPECT_EQ(result.movement.bookCost, 2900000);
    EXPECT_EQ(result.movement.revisedAvgCost, 52667);

    auto stored = ledger_.holding(holdingId_);
    EXPECT_EQ(stored.quantity, 1500000);
    EXPECT_EQ(stored.averageCost, 52667);
}

TEST_F(MovementServiceTest, Buy_DebitsGrossConsideration) {
    auto result = service_->applyMovement(buy(50, 300, 10));

    EXPECT_EQ(result.account.cashBalance, 497000000);
    EXPECT_EQ(ledger_.cashOf(accountId_), 497000000);
}

TEST_F(MovementServiceTest, Buy_IntoEmptyHolding_AverageIsBookCostPerUnit) {
    auto otherInvestment = ledger_.addInvestment("Beta Trust");
    auto emptyHolding = ledger_.addHolding(accountId_, otherInvestment, 0, 0);

    auto request = buy(40, 100, 4);
    request.holdingId = emptyHolding;
    auto result = service_->applyMovement(request);

    EXPECT_EQ(result.holding.quantity, 400000);
    EXPECT_EQ(result.holding.averageCost, 24000);
}

TEST_F(MovementServiceTest, Buy_OtherHoldingsUnchanged) {
    auto otherInvestment = ledger_.addInvestment("Beta Trust");
    auto otherHolding = ledger_.addHolding(accountId_, otherInvestment, 10, 7.5);

    service_->applyMovement(buy(50, 300, 10));

    auto other = ledger_.holding(otherHolding);
    EXPECT_EQ(other.quantity, 100000);
    EXPECT_EQ(other.averageCost, 75000);
}

TEST_F(MovementServiceTest, Buy_InsufficientCash_NothingChanges) {
    ledger_.setCash(accountId_, 100.0);

    EXPECT_THROW(service_->applyMovement(buy(50, 290)), domain::InsufficientFundsException);

    EXPECT_EQ(errorMessage([&] { service_->applyMovement(buy(50, 290)); }), "Insufficient cash");
    EXPECT_EQ(ledger_.cashOf(accountId_), 1000000);
    EXPECT_EQ(ledger_.holding(holdingId_).quantity, 1000000);
    EXPECT_TRUE(ledgerRows().empty());
    EXPECT_TRUE(service_->listMovements(holdingId_).empty());
}

TEST_F(MovementServiceTest, Buy_ExactlyAllCash_Allowed) {
    ledger_.setCash(accountId_, 290.0);

    auto result = service_->applyMovement(buy(50, 290));

    EXPECT_EQ(result.account.cashBalance, 0);
}

// ============================================
// SELL
// ============================================

TEST_F(MovementServiceTest, Sell_AverageUnchanged_CreditsNetProceeds) {
    auto result = service_->applyMovement(sell(40, 220, 5.5));

    EXPECT_EQ(result.holding.quantity, 600000);
    EXPECT_EQ(result.holding.averageCost, 50000);
    EXPECT_EQ(result.account.cashBalance, 502145000);
    EXPECT_EQ(ledger_.cashOf(accountId_), 502145000);
}

TEST_F(MovementServiceTest, BuyThenSell_AverageCarriedIntoSell) {
    service_->applyMovement(buy(50, 300, 10));

    auto result = service_->applyMovement(sell(30, 200, 5.5));

    EXPECT_EQ(result.holding.quantity, 1200000);
    EXPECT_EQ(result.holding.averageCost, 52667);
    EXPECT_EQ(result.account.cashBalance, 498945000);
    EXPECT_EQ(result.movement.bookCost, 1580010);

    auto stored = ledger_.holding(holdingId_);
    EXPECT_EQ(stored.quantity, 1200000);
    EXPECT_EQ(stored.averageCost, 52667);
    EXPECT_EQ(ledger_.cashOf(accountId_), 498945000);
}

TEST_F(MovementServiceTest, Sell_BookCostIsDisposedCost) {
    auto result = service_->applyMovement(sell(40, 220, 5.5));

    EXPECT_EQ(result.movement.bookCost, 2000000);
    EXPECT_EQ(result.movement.movementValue, 2200000);
    EXPECT_EQ(result.movement.deductibleCosts, 55000);
    EXPECT_FALSE(result.movement.revisedAvgCost.has_value());
}

TEST_F(MovementServiceTest, Sell_FullDisposal_HoldingKeptAtZero) {
    auto result = service_->applyMovement(sell(100, 600));

    EXPECT_EQ(result.holding.quantity, 0);
    EXPECT_TRUE(result.holding.isClosed());

    auto stored = ledger_.holdings->findById(holdingId_);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->quantity, 0);
    EXPECT_EQ(stored->averageCost, 50000);
}

TEST_F(MovementServiceTest, Sell_MoreThanHeld_NothingChanges) {
    EXPECT_THROW(service_->applyMovement(sell(100.0001, 600)), domain::InsufficientQuantityException);

    EXPECT_EQ(ledger_.holding(holdingId_).quantity, 1000000);
    EXPECT_EQ(ledger_.cashOf(accountId_), 500000000);
    EXPECT_TRUE(ledgerRows().empty());
}

// ============================================
// ADJUSTMENT
// ============================================

TEST_F(MovementServiceTest, Adjustment_ChangesQuantityOnly) {
    auto result = service_->applyMovement(adjust(200));

    EXPECT_EQ(result.holding.quantity, 2000000);
    EXPECT_EQ(result.holding.averageCost, 50000);
    EXPECT_EQ(result.movement.quantity, 1000000);
    EXPECT_EQ(result.movement.movementValue, 0);
    EXPECT_EQ(result.movement.bookCost, 0);
    EXPECT_EQ(ledger_.cashOf(accountId_), 500000000);
    EXPECT_TRUE(ledgerRows().empty());
}

TEST_F(MovementServiceTest, Adjustment_Decrease_RecordsMagnitude) {
    auto result = service_->applyMovement(adjust(25));

    EXPECT_EQ(result.holding.quantity, 250000);
    EXPECT_EQ(result.movement.quantity, 750000);
}

TEST_F(MovementServiceTest, Adjustment_SameQuantity_Rejected) {
    EXPECT_EQ(errorMessage([&] { service_->applyMovement(adjust(100)); }),
              "New quantity is the same as the current quantity");
    EXPECT_TRUE(service_->listMovements(holdingId_).empty());
}

// ============================================
// VALIDATION
// ============================================

TEST_F(MovementServiceTest, Validation_MissingType) {
    auto request = buy(1, 1);
    request.movementType.reset();

    EXPECT_EQ(errorMessage([&] { service_->applyMovement(request); }), "Movement type is required");
}

TEST_F(MovementServiceTest, Validation_BadDate) {
    auto request = buy(1, 1);
    request.movementDate = "2025-02-30";

    EXPECT_EQ(errorMessage([&] { service_->applyMovement(request); }),
              "Movement date must be in YYYY-MM-DD format");
}

TEST_F(MovementServiceTest, Validation_QuantityMustBePositive) {
    EXPECT_EQ(errorMessage([&] { service_->applyMovement(buy(0, 10)); }),
              "Quantity must be greater than zero");
    EXPECT_EQ(errorMessage([&] { service_->applyMovement(sell(-1, 10)); }),
              "Quantity must be greater than zero");
}

TEST_F(MovementServiceTest, Validation_HugeQuantity_OutOfRange) {
    EXPECT_EQ(errorMessage([&] { service_->applyMovement(buy(1e16, 10)); }), "Value out of range");
    EXPECT_EQ(errorMessage([&] { service_->applyMovement(adjust(1e16)); }), "Value out of range");
    EXPECT_EQ(ledger_.holding(holdingId_).quantity, 1000000);
}

TEST_F(MovementServiceTest, Validation_DeductibleExceedsTotal) {
    EXPECT_EQ(errorMessage([&] { service_->applyMovement(buy(1, 10, 10.01)); }),
              "Deductible costs must not exceed total consideration");
}

TEST_F(MovementServiceTest, Validation_NotesTooLong) {
    auto request = buy(1, 1);
    request.notes = std::string(256, 'x');

    EXPECT_THROW(service_->applyMovement(request), domain::ValidationException);
}

TEST_F(MovementServiceTest, Validation_HappensBeforeStorageAccess) {
    auto request = buy(0, 10);
    request.holdingId = 999999;

    EXPECT_THROW(service_->applyMovement(request), domain::ValidationException);
    EXPECT_EQ(ledger_.uowFactory->begun(), 0);
}

TEST_F(MovementServiceTest, UnknownHolding_NotFound) {
    auto request = buy(1, 1);
    request.holdingId = 999999;

    EXPECT_THROW(service_->applyMovement(request), domain::NotFoundException);
    EXPECT_EQ(ledger_.uowFactory->begun(), 0);
}

// ============================================
// LEDGER ROWS AND HISTORY
// ============================================

TEST_F(MovementServiceTest, Buy_WritesLinkedLedgerRow) {
    auto request = buy(50, 300, 10);
    request.notes = "monthly";
    auto result = service_->applyMovement(request);

    auto rows = ledgerRows();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].transactionType, domain::TransactionType::BUY);
    EXPECT_EQ(rows[0].holdingMovementId, result.movement.id);
    EXPECT_EQ(rows[0].amount, -3000000);
    EXPECT_EQ(rows[0].balanceAfter, 497000000);
    EXPECT_EQ(rows[0].transactionDate, "2025-01-10");
    EXPECT_EQ(rows[0].notes, "monthly");
}

TEST_F(MovementServiceTest, Sell_WritesPositiveLedgerRow) {
    service_->applyMovement(sell(40, 220, 5.5));

    auto rows = ledgerRows();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].transactionType, domain::TransactionType::SELL);
    EXPECT_EQ(rows[0].amount, 2145000);
    EXPECT_EQ(rows[0].balanceAfter, 502145000);
}

TEST_F(MovementServiceTest, ListMovements_NewestFirstWithLimit) {
    auto early = sell(10, 60);
    early.movementDate = "2025-01-05";
    service_->applyMovement(early);
    service_->applyMovement(buy(5, 30));

    auto all = service_->listMovements(holdingId_);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].movementDate, "2025-01-10");
    EXPECT_EQ(all[1].movementDate, "2025-01-05");

    EXPECT_EQ(service_->listMovements(holdingId_, 1).size(), 1u);
    EXPECT_TRUE(service_->getMovement(all[1].id).has_value());
}

TEST_F(MovementServiceTest, ListMovements_UnknownHolding_NotFound) {
    EXPECT_THROW(service_->listMovements(999999), domain::NotFoundException);
}

// ============================================
// CONCURRENCY
// ============================================

TEST_F(MovementServiceTest, ConcurrentSells_EachSeesCommittedQuantity) {
    constexpr int kThreads = 8;
    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};
    std::atomic<int> unexpected{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            try {
                service_->applyMovement(sell(30, 150));
                ++succeeded;
            } catch (const domain::InsufficientQuantityException&) {
                ++rejected;
            } catch (const std::exception&) {
                ++unexpected;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(succeeded.load(), 3);
    EXPECT_EQ(rejected.load(), kThreads - 3);
    EXPECT_EQ(unexpected.load(), 0);

    EXPECT_EQ(ledger_.holding(holdingId_).quantity, 100000);
    EXPECT_EQ(ledger_.cashOf(accountId_), 504500000);
    EXPECT_EQ(service_->listMovements(holdingId_).size(), 3u);
    EXPECT_EQ(ledgerRows().size(), 3u);
}
