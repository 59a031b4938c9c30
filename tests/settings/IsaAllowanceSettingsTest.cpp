#include <gtest/gtest.h>

#include "settings/IsaAllowanceSettings.hpp"

#include <cstdlib>

using namespace ledger;

class IsaAllowanceSettingsTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnvironment(); }
    void TearDown() override { clearEnvironment(); }

    static void clearEnvironment() {
        unsetenv("LEDGER_ISA_ANNUAL_LIMIT");
        unsetenv("LEDGER_ISA_TAX_YEAR_START_MONTH");
        unsetenv("LEDGER_ISA_TAX_YEAR_START_DAY");
    }
};

TEST_F(IsaAllowanceSettingsTest, Unset_Defaults) {
    settings::IsaAllowanceSettings settings;

    EXPECT_EQ(settings.getAnnualLimit(), 200000000);
    EXPECT_EQ(settings.getTaxYearStartMonth(), 4);
    EXPECT_EQ(settings.getTaxYearStartDay(), 6);
}

TEST_F(IsaAllowanceSettingsTest, ValidValues_Used) {
    setenv("LEDGER_ISA_ANNUAL_LIMIT", "15000.50", 1);
    setenv("LEDGER_ISA_TAX_YEAR_START_MONTH", "1", 1);
    setenv("LEDGER_ISA_TAX_YEAR_START_DAY", "1", 1);

    settings::IsaAllowanceSettings settings;

    EXPECT_EQ(settings.getAnnualLimit(), 150005000);
    EXPECT_EQ(settings.getTaxYearStartMonth(), 1);
    EXPECT_EQ(settings.getTaxYearStartDay(), 1);
}

TEST_F(IsaAllowanceSettingsTest, NonNumericValues_FallBackToDefaults) {
    setenv("LEDGER_ISA_ANNUAL_LIMIT", "lots", 1);
    setenv("LEDGER_ISA_TAX_YEAR_START_MONTH", "April", 1);
    setenv("LEDGER_ISA_TAX_YEAR_START_DAY", "6th", 1);

    settings::IsaAllowanceSettings settings;

    EXPECT_EQ(settings.getAnnualLimit(), 200000000);
    EXPECT_EQ(settings.getTaxYearStartMonth(), 4);
    EXPECT_EQ(settings.getTaxYearStartDay(), 6);
}

TEST_F(IsaAllowanceSettingsTest, OutOfRangeValues_FallBackToDefaults) {
    setenv("LEDGER_ISA_ANNUAL_LIMIT", "-100", 1);
    setenv("LEDGER_ISA_TAX_YEAR_START_MONTH", "13", 1);
    setenv("LEDGER_ISA_TAX_YEAR_START_DAY", "99999999999", 1);

    settings::IsaAllowanceSettings settings;

    EXPECT_EQ(settings.getAnnualLimit(), 200000000);
    EXPECT_EQ(settings.getTaxYearStartMonth(), 4);
    EXPECT_EQ(settings.getTaxYearStartDay(), 6);
}
