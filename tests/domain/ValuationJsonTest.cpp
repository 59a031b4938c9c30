#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "domain/Valuation.hpp"

using namespace ledger::domain;

namespace {

UserValuation sampleValuation() {
    HoldingValuation priced;
    priced.holdingId = 7;
    priced.investmentId = 3;
    priced.description = "Acme plc";
    priced.publicId = "GB0000000001";
    priced.currencyCode = "GBP";
    priced.quantity = 10.0;
    priced.averageCost = 2.5;
    priced.hasPrice = true;
    priced.price = 3.0;
    priced.priceDate = "2025-01-10";
    priced.hasRate = true;
    priced.rate = 1.0;
    priced.valueLocal = 30.0;
    priced.valueBase = 30.0;

    HoldingValuation unpriced;
    unpriced.holdingId = 8;
    unpriced.description = "No Price Fund";
    unpriced.currencyCode = "USD";

    AccountValuation account;
    account.accountId = 2;
    account.accountType = "isa";
    account.accountRef = "ISA-1";
    account.cashBalance = 100.0;
    account.investmentsTotal = 30.0;
    account.accountTotal = 130.0;
    account.holdings = {priced, unpriced};

    UserValuation valuation;
    valuation.userId = 1;
    valuation.firstName = "Ann";
    valuation.lastName = "Smith";
    valuation.valuationDate = "2025-01-10";
    valuation.pointInTime = true;
    valuation.accounts = {account};
    valuation.totals = {30.0, 100.0, 130.0};
    return valuation;
}

} // namespace

TEST(ValuationJsonTest, UserValuation_SnakeCaseFields) {
    auto j = nlohmann::json::parse(sampleValuation().toJson());

    EXPECT_EQ(j["user"]["id"], 1);
    EXPECT_EQ(j["user"]["first_name"], "Ann");
    EXPECT_EQ(j["valuation_date"], "2025-01-10");
    EXPECT_TRUE(j["point_in_time"].get<bool>());
    EXPECT_DOUBLE_EQ(j["totals"]["grand_total"].get<double>(), 130.0);

    const auto& account = j["accounts"][0];
    EXPECT_EQ(account["account_type"], "isa");
    EXPECT_DOUBLE_EQ(account["account_total"].get<double>(), 130.0);
    ASSERT_EQ(account["holdings"].size(), 2u);
    EXPECT_EQ(account["holdings"][0]["public_id"], "GB0000000001");
}

TEST(ValuationJsonTest, MissingPriceAndRate_AreNull) {
    auto j = nlohmann::json::parse(sampleValuation().toJson());
    const auto& unpriced = j["accounts"][0]["holdings"][1];

    EXPECT_FALSE(unpriced["has_price"].get<bool>());
    EXPECT_TRUE(unpriced["price"].is_null());
    EXPECT_TRUE(unpriced["rate"].is_null());
    EXPECT_TRUE(unpriced["public_id"].is_null());
    EXPECT_DOUBLE_EQ(unpriced["value_base"].get<double>(), 0.0);
}

TEST(ValuationJsonTest, AllUsers_IsArray) {
    auto j = nlohmann::json::parse(toJson(std::vector<UserValuation>{sampleValuation(), sampleValuation()}));

    ASSERT_TRUE(j.is_array());
    EXPECT_EQ(j.size(), 2u);
    EXPECT_TRUE(nlohmann::json::parse(toJson(std::vector<UserValuation>{})).empty());
}
