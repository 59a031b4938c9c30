#include <gtest/gtest.h>

#include "application/ReferenceDataService.hpp"
#include "mocks/InMemoryLedger.hpp"

using namespace ledger;
using namespace ledger::tests::mocks;

class ReferenceDataServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        service_ = std::make_shared<application::ReferenceDataService>(
            ledger_.currencies, ledger_.investments, ledger_.prices, ledger_.rates,
            std::make_shared<settings::LedgerSettings>(2));
    }

    ports::input::InvestmentRequest investmentRequest(const std::string& description, int64_t currencyId = 0) {
        ports::input::InvestmentRequest request;
        request.currencyId = currencyId ? currencyId : ledger_.gbpId();
        request.typeId = ledger_.db->shareTypeId();
        request.description = description;
        return request;
    }

    InMemoryLedger ledger_;
    std::shared_ptr<application::ReferenceDataService> service_;
};

// ============================================
// CURRENCIES
// ============================================

TEST_F(ReferenceDataServiceTest, CreateCurrency_NormalizesCode) {
    auto currency = service_->createCurrency({" usd ", "US Dollar"});

    EXPECT_GT(currency.id, 0);
    EXPECT_EQ(currency.code, "USD");
    EXPECT_TRUE(service_->getCurrency(currency.id).has_value());
}

TEST_F(ReferenceDataServiceTest, CreateCurrency_InvalidCode) {
    EXPECT_THROW(service_->createCurrency({"US", "Short"}), domain::ValidationException);
    EXPECT_THROW(service_->createCurrency({"US1", "Digit"}), domain::ValidationException);
    EXPECT_THROW(service_->createCurrency({"EUR", ""}), domain::ValidationException);
}

TEST_F(ReferenceDataServiceTest, CreateCurrency_DuplicateCode_Conflict) {
    service_->createCurrency({"USD", "US Dollar"});

    EXPECT_THROW(service_->createCurrency({"usd", "Again"}), domain::ConflictException);
    EXPECT_THROW(service_->createCurrency({"GBP", "Sterling"}), domain::ConflictException);
}

TEST_F(ReferenceDataServiceTest, UpdateCurrency_BaseCodeLocked) {
    try {
        service_->updateCurrency(ledger_.gbpId(), {"GBX", "Pence"});
        FAIL() << "Expected ConflictException";
    } catch (const domain::ConflictException& e) {
        EXPECT_STREQ(e.what(), "Base currency code cannot be changed");
    }

    auto renamed = service_->updateCurrency(ledger_.gbpId(), {"GBP", "Pound"});
    EXPECT_EQ(renamed.description, "Pound");
}

TEST_F(ReferenceDataServiceTest, DeleteCurrency_Base_Conflict) {
    try {
        service_->deleteCurrency(ledger_.gbpId());
        FAIL() << "Expected ConflictException";
    } catch (const domain::ConflictException& e) {
        EXPECT_STREQ(e.what(), "Base currency cannot be deleted");
    }
}

TEST_F(ReferenceDataServiceTest, DeleteCurrency_InUse_Conflict) {
    auto usd = service_->createCurrency({"USD", "US Dollar"});
    service_->createInvestment(investmentRequest("US Corp", usd.id));

    EXPECT_THROW(service_->deleteCurrency(usd.id), domain::ConflictException);
}

TEST_F(ReferenceDataServiceTest, DeleteCurrency_Unused_RemovesRates) {
    auto usd = service_->createCurrency({"USD", "US Dollar"});
    service_->upsertRate(usd.id, "2025-02-10", 1.25);

    service_->deleteCurrency(usd.id);

    EXPECT_FALSE(service_->getCurrency(usd.id).has_value());
    EXPECT_TRUE(ledger_.rates->findHistory(usd.id, 10).empty());
}

// ============================================
// INVESTMENTS
// ============================================

TEST_F(ReferenceDataServiceTest, CreateInvestment_CarriesCurrencyCode) {
    auto request = investmentRequest("  Acme plc ");
    request.publicId = "";

    auto investment = service_->createInvestment(request);

    EXPECT_EQ(investment.description, "Acme plc");
    EXPECT_EQ(investment.currencyCode, "GBP");
    EXPECT_FALSE(investment.publicId.has_value());
}

TEST_F(ReferenceDataServiceTest, CreateInvestment_UnknownReferences_NotFound) {
    EXPECT_THROW(service_->createInvestment(investmentRequest("Ghost", 999999)), domain::NotFoundException);

    auto request = investmentRequest("Ghost");
    request.typeId = 999999;
    EXPECT_THROW(service_->createInvestment(request), domain::NotFoundException);
}

TEST_F(ReferenceDataServiceTest, CreateInvestment_Validation) {
    EXPECT_THROW(service_->createInvestment(investmentRequest("")), domain::ValidationException);
    EXPECT_THROW(service_->createInvestment(investmentRequest(std::string(61, 'a'))), domain::ValidationException);

    auto request = investmentRequest("Long ID");
    request.publicId = std::string(21, '9');
    EXPECT_THROW(service_->createInvestment(request), domain::ValidationException);
}

TEST_F(ReferenceDataServiceTest, ListInvestments_ByDescription) {
    service_->createInvestment(investmentRequest("Zeta"));
    service_->createInvestment(investmentRequest("Alpha"));

    auto investments = service_->listInvestments();
    ASSERT_EQ(investments.size(), 2u);
    EXPECT_EQ(investments[0].description, "Alpha");
    EXPECT_EQ(service_->listInvestmentTypes().size(), 5u);
}

TEST_F(ReferenceDataServiceTest, DeleteInvestment_Held_Conflict) {
    auto investment = service_->createInvestment(investmentRequest("Acme plc"));
    auto userId = ledger_.addUser("Gail");
    auto accountId = ledger_.addAccount(userId, domain::AccountType::TRADING);
    ledger_.addHolding(accountId, investment.id, 1, 1);

    EXPECT_THROW(service_->deleteInvestment(investment.id), domain::ConflictException);
    EXPECT_TRUE(service_->getInvestment(investment.id).has_value());
}

TEST_F(ReferenceDataServiceTest, UpdateInvestment_Unknown_NotFound) {
    EXPECT_THROW(service_->updateInvestment(999999, investmentRequest("Nothing")), domain::NotFoundException);
}

// ============================================
// PRICES AND RATES
// ============================================

TEST_F(ReferenceDataServiceTest, UpsertPrice_LastWriteWins) {
    auto investment = service_->createInvestment(investmentRequest("Acme plc"));

    service_->upsertPrice(investment.id, "2025-02-10", 3.0);
    service_->upsertPrice(investment.id, "2025-02-10", 3.25);

    auto price = service_->priceOnDate(investment.id, "2025-02-10");
    ASSERT_TRUE(price.has_value());
    EXPECT_EQ(price->price, 32500);
    EXPECT_EQ(ledger_.prices->findHistory(investment.id, 10).size(), 1u);
}

TEST_F(ReferenceDataServiceTest, LatestPrice_NewestDate) {
    auto investment = service_->createInvestment(investmentRequest("Acme plc"));
    service_->upsertPrice(investment.id, "2025-02-10", 3.0);
    service_->upsertPrice(investment.id, "2025-01-10", 2.0);
    service_->upsertPrice(investment.id, "2024-12-10", 1.0);

    EXPECT_EQ(service_->latestPrice(investment.id)->priceDate, "2025-02-10");
    EXPECT_FALSE(service_->priceOnDate(investment.id, "2025-02-09").has_value());

    auto history = service_->priceHistory(investment.id);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[1].priceDate, "2025-01-10");
}

TEST_F(ReferenceDataServiceTest, UpsertPrice_Validation) {
    auto investment = service_->createInvestment(investmentRequest("Acme plc"));

    EXPECT_THROW(service_->upsertPrice(investment.id, "2025-13-01", 1.0), domain::ValidationException);
    EXPECT_THROW(service_->upsertPrice(investment.id, "2025-01-01", 0.0), domain::ValidationException);
    EXPECT_THROW(service_->upsertPrice(999999, "2025-01-01", 1.0), domain::NotFoundException);
}

TEST_F(ReferenceDataServiceTest, BaseCurrency_ImplicitRate) {
    auto latest = service_->latestRate(ledger_.gbpId());
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->rate, domain::FixedPoint::SCALE_FACTOR);

    auto onDate = service_->rateOnDate(ledger_.gbpId(), "2020-01-01");
    ASSERT_TRUE(onDate.has_value());
    EXPECT_EQ(onDate->rateDate, "2020-01-01");

    EXPECT_THROW(service_->upsertRate(ledger_.gbpId(), "2025-01-01", 1.0), domain::ValidationException);
}

TEST_F(ReferenceDataServiceTest, ForeignRate_AbsentIsNotAnError) {
    auto usd = service_->createCurrency({"USD", "US Dollar"});

    EXPECT_FALSE(service_->latestRate(usd.id).has_value());
    EXPECT_FALSE(service_->latestRate(999999).has_value());

    service_->upsertRate(usd.id, "2025-02-10", 1.2712);
    EXPECT_EQ(service_->rateOnDate(usd.id, "2025-02-10")->rate, 12712);
}
