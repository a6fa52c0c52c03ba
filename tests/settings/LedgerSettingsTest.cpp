/**
 * @file LedgerSettingsTest.cpp
 * @brief Unit tests for LedgerSettings and DbSettings
 */

#include <gtest/gtest.h>
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"

using namespace navledger;
using namespace navledger::settings;

TEST(LedgerSettingsTest, Defaults) {
    LedgerSettings settings;

    ASSERT_TRUE(settings.getRunningTotalEpoch().has_value());
    EXPECT_EQ(settings.getRunningTotalEpoch()->toString(), "01/19/2023");
    EXPECT_DOUBLE_EQ(settings.getPnlTolerance(), 0.01);
    EXPECT_DOUBLE_EQ(settings.getAccrualTolerance(), 0.10);
    EXPECT_DOUBLE_EQ(settings.getValuationTolerance(), 0.10);
    EXPECT_EQ(settings.getMaxCorrectionIterations(), 100);
    EXPECT_EQ(settings.getPnlConvention(), domain::PnlConvention::EXCLUDE_INTEREST_DIVIDENDS);
}

TEST(LedgerSettingsTest, FromJson_OverridesGivenKeysOnly) {
    auto settings = LedgerSettings::fromJson({
        {"running_total_epoch", "3/1/2024"},
        {"valuation_tolerance", 0.5},
        {"max_correction_iterations", 7},
        {"pnl_convention", "INCLUDE_INTEREST_DIVIDENDS"}
    });

    EXPECT_EQ(settings.getRunningTotalEpoch()->toString(), "03/01/2024");
    EXPECT_DOUBLE_EQ(settings.getValuationTolerance(), 0.5);
    EXPECT_EQ(settings.getMaxCorrectionIterations(), 7);
    EXPECT_EQ(settings.getPnlConvention(), domain::PnlConvention::INCLUDE_INTEREST_DIVIDENDS);
    EXPECT_DOUBLE_EQ(settings.getPnlTolerance(), 0.01);
}

TEST(LedgerSettingsTest, FromJson_NullOrNoneDisablesEpoch) {
    EXPECT_FALSE(LedgerSettings::fromJson({{"running_total_epoch", nullptr}})
                     .getRunningTotalEpoch().has_value());
    EXPECT_FALSE(LedgerSettings::fromJson({{"running_total_epoch", "none"}})
                     .getRunningTotalEpoch().has_value());
}

TEST(LedgerSettingsTest, FromJson_InvalidEpochThrows) {
    EXPECT_THROW(LedgerSettings::fromJson({{"running_total_epoch", "19.01.2023"}}),
                 domain::LedgerValidationError);
}

TEST(LedgerSettingsTest, FromJson_UnknownConventionThrows) {
    EXPECT_THROW(LedgerSettings::fromJson({{"pnl_convention", "SOMETIMES"}}), std::invalid_argument);
}

TEST(DbSettingsTest, DefaultsConnectionString) {
    DbSettings settings;

    EXPECT_EQ(settings.getConnectionString(),
              "host='localhost' port=5432 dbname='daily_accounting' user='navledger' "
              "password='navledger' connect_timeout=10");
}

TEST(DbSettingsTest, DatabaseSectionOverridesDefaults) {
    auto settings = DbSettings::fromJson({
        {"pnl_tolerance", 0.02},
        {"database", {{"host", "db.internal"}, {"port", 6432}, {"name", "nav"}, {"connect_timeout", 0}}}
    });

    EXPECT_EQ(settings.getHost(), "db.internal");
    EXPECT_EQ(settings.getPort(), 6432);
    EXPECT_EQ(settings.getName(), "nav");
    EXPECT_EQ(settings.getUser(), "navledger");
    EXPECT_EQ(settings.getConnectionString().find("connect_timeout"), std::string::npos);
}

TEST(DbSettingsTest, PasswordWithSpacesAndQuotesIsEscaped) {
    auto settings = DbSettings::fromJson({{"database", {{"password", "it's a \\secret"}}}});

    EXPECT_NE(settings.getConnectionString().find("password='it\\'s a \\\\secret'"), std::string::npos);
}

TEST(DbSettingsTest, InvalidPortThrows) {
    EXPECT_THROW(DbSettings::fromJson({{"database", {{"port", 0}}}}), domain::LedgerValidationError);
    EXPECT_THROW(DbSettings::fromJson({{"database", {{"port", 70000}}}}), domain::LedgerValidationError);
}

TEST(DbSettingsTest, NegativeConnectTimeoutThrows) {
    EXPECT_THROW(DbSettings::fromJson({{"database", {{"connect_timeout", -1}}}}),
                 domain::LedgerValidationError);
}
