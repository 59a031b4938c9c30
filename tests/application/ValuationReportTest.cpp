#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "application/ValuationReport.hpp"
#include "application/ValuationService.hpp"
#include "mocks/InMemoryLedger.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace ledger;
using namespace ledger::tests::mocks;

/// Перехватывает std::cout на время теста
class CoutCapture {
public:
    CoutCapture() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(previous_); }

    std::string text() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

class ValuationReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        userId_ = ledger_.addUser("Dave", "Brown");
        auto accountId = ledger_.addAccount(userId_, domain::AccountType::ISA, 250.0);
        auto acmeId = ledger_.addInvestment("Acme plc");
        ledger_.addHolding(accountId, acmeId, 10, 2);
        ledger_.addPrice(acmeId, "2025-02-10", 3.0);

        otherUserId_ = ledger_.addUser("Erin", "White");
    }

    std::shared_ptr<application::ValuationService> makeService() {
        return std::make_shared<application::ValuationService>(
            ledger_.users, ledger_.accounts, ledger_.holdings, ledger_.prices, ledger_.rates);
    }

    InMemoryLedger ledger_;
    int64_t userId_ = 0;
    int64_t otherUserId_ = 0;
};

TEST_F(ValuationReportTest, SingleUser_StdoutHoldsOnlyJson) {
    std::string expected;
    std::string captured;
    {
        CoutCapture capture;
        auto service = makeService();
        expected = service->valueUser(userId_).toJson() + "\n";

        application::ValuationReport report(service, std::cout);
        report.write(userId_, std::nullopt);
        captured = capture.text();
    }

    EXPECT_EQ(captured, expected);

    auto json = nlohmann::json::parse(captured);
    EXPECT_EQ(json["user"]["id"], userId_);
    EXPECT_DOUBLE_EQ(json["accounts"][0]["account_total"].get<double>(), 280.0);
}

TEST_F(ValuationReportTest, AllUsers_WritesJsonArray) {
    std::ostringstream out;
    application::ValuationReport report(makeService(), out);

    report.write(std::nullopt, std::string("2025-03-01"));

    auto json = nlohmann::json::parse(out.str());
    ASSERT_TRUE(json.is_array());
    ASSERT_EQ(json.size(), 2u);
    EXPECT_EQ(json[0]["user"]["id"], userId_);
    EXPECT_EQ(json[1]["user"]["id"], otherUserId_);
    EXPECT_EQ(json[0]["valuation_date"], "2025-03-01");
}

TEST_F(ValuationReportTest, OutputFile_LeavesStreamEmpty) {
    std::string path = ::testing::TempDir() + "ledger_valuation_report.json";
    std::ostringstream out;
    application::ValuationReport report(makeService(), out);

    report.write(userId_, std::nullopt, path);

    EXPECT_TRUE(out.str().empty());

    std::ifstream file(path);
    ASSERT_TRUE(file.good());
    auto json = nlohmann::json::parse(file);
    EXPECT_EQ(json["user"]["first_name"], "Dave");
    std::remove(path.c_str());
}

TEST_F(ValuationReportTest, UnknownUser_NothingWritten) {
    std::ostringstream out;
    application::ValuationReport report(makeService(), out);

    EXPECT_THROW(report.write(999, std::nullopt), domain::NotFoundException);
    EXPECT_TRUE(out.str().empty());
}
