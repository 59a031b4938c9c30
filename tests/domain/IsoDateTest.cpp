#include <gtest/gtest.h>

#include "domain/IsoDate.hpp"

using namespace ledger::domain;

TEST(IsoDateTest, IsValid_AcceptsRealDates) {
    EXPECT_TRUE(IsoDate::isValid("2024-02-29"));
    EXPECT_TRUE(IsoDate::isValid("2025-12-31"));
}

TEST(IsoDateTest, IsValid_RejectsMalformedOrImpossible) {
    EXPECT_FALSE(IsoDate::isValid(""));
    EXPECT_FALSE(IsoDate::isValid("2023-02-29"));
    EXPECT_FALSE(IsoDate::isValid("2024-13-01"));
    EXPECT_FALSE(IsoDate::isValid("2024-1-01"));
    EXPECT_FALSE(IsoDate::isValid("2024/01/01"));
    EXPECT_FALSE(IsoDate::isValid("abcd-ef-gh"));
}

TEST(IsoDateTest, Today_IsValidDate) {
    EXPECT_TRUE(IsoDate::isValid(IsoDate::today()));
}

TEST(IsoDateTest, PreviousDay_CrossesMonthAndYear) {
    EXPECT_EQ(IsoDate::parseUnchecked("2024-03-01").previousDay().toString(), "2024-02-29");
    EXPECT_EQ(IsoDate::parseUnchecked("2025-01-01").previousDay().toString(), "2024-12-31");
}

// ============================================
// UK TAX YEAR
// ============================================

TEST(IsoDateTest, TaxYear_LastDayBelongsToPreviousYear) {
    auto year = IsoDate::taxYearContaining("2026-04-05", 4, 6);

    EXPECT_EQ(year.start, "2025-04-06");
    EXPECT_EQ(year.end, "2026-04-05");
    EXPECT_EQ(year.label, "2025/2026");
}

TEST(IsoDateTest, TaxYear_StartDayOpensNewYear) {
    auto year = IsoDate::taxYearContaining("2026-04-06", 4, 6);

    EXPECT_EQ(year.start, "2026-04-06");
    EXPECT_EQ(year.end, "2027-04-05");
    EXPECT_EQ(year.label, "2026/2027");
}

TEST(IsoDateTest, TaxYear_CalendarYearStart) {
    auto year = IsoDate::taxYearContaining("2025-07-15", 1, 1);

    EXPECT_EQ(year.start, "2025-01-01");
    EXPECT_EQ(year.end, "2025-12-31");
}
