/**
 * @file LedgerBuilderTest.cpp
 * @brief Unit tests for LedgerBuilder
 */

#include <gtest/gtest.h>
#include "application/LedgerBuilder.hpp"
#include "../mocks/TestRecords.hpp"
#include <memory>
#include <stdexcept>

using namespace navledger;
using namespace navledger::application;
using namespace navledger::tests;

class LedgerBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        builder_ = std::make_unique<LedgerBuilder>(std::nullopt);
    }

    const domain::LedgerRow& row(const std::vector<domain::LedgerRow>& rows, const std::string& date) {
        for (const auto& r : rows) {
            if (r.date == date) {
                return r;
            }
        }
        throw std::runtime_error("No ledger row for " + date);
    }

    LedgerInputs inputs_;
    std::unique_ptr<LedgerBuilder> builder_;
};

// ============================================================================
// EMPTY / ORDERING
// ============================================================================

TEST_F(LedgerBuilderTest, NoBrokerRecords_EmptyLedger) {
    inputs_.otherTransactions.push_back(otherTx("01/03/2023", 100.0));
    inputs_.valuationOverrides.push_back(valuation("01/03/2023", 5000.0));

    EXPECT_TRUE(builder_->build(inputs_).empty());
}

TEST_F(LedgerBuilderTest, DatesOrderedByCalendarValue) {
    inputs_.brokerRecords.push_back(brokerRecord("01/03/2023", 10.0, 1010.0));
    inputs_.brokerRecords.push_back(brokerRecord("12/30/2022", 0.0, 1000.0));
    inputs_.brokerRecords.push_back(brokerRecord("2/1/2023", 5.0, 1015.0));

    auto rows = builder_->build(inputs_);

    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].date, "12/30/2022");
    EXPECT_EQ(rows[1].date, "01/03/2023");
    EXPECT_EQ(rows[2].date, "02/01/2023");
}

TEST_F(LedgerBuilderTest, UnionOfBrokerAndOtherDates) {
    inputs_.brokerRecords.push_back(brokerRecord("01/03/2023", 10.0, 1000.0));
    inputs_.otherTransactions.push_back(otherTx("01/04/2023", 50.0, true));

    auto rows = builder_->build(inputs_);

    ASSERT_EQ(rows.size(), 2u);
    const auto& otherOnly = rows[1];
    EXPECT_EQ(otherOnly.date, "01/04/2023");
    EXPECT_FALSE(otherOnly.brokerPnl.has_value());
    EXPECT_FALSE(otherOnly.totalBroker.has_value());
    EXPECT_DOUBLE_EQ(otherOnly.totalPnl, 50.0);
    EXPECT_DOUBLE_EQ(otherOnly.endFundValue, 50.0);
}

TEST_F(LedgerBuilderTest, MalformedDatesAreSkipped) {
    inputs_.brokerRecords.push_back(brokerRecord("01/03/2023", 10.0, 1000.0));
    inputs_.brokerRecords.push_back(brokerRecord("13/45/2023", 10.0, 1000.0));
    inputs_.otherTransactions.push_back(otherTx("yesterday", 100.0));

    auto rows = builder_->build(inputs_);

    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].date, "01/03/2023");
    EXPECT_DOUBLE_EQ(rows[0].totalOther, 0.0);
}

// ============================================================================
// OTHER TRANSACTIONS
// ============================================================================

TEST_F(LedgerBuilderTest, OtherPnlAndOvernightSplitByFlags) {
    inputs_.brokerRecords.push_back(brokerRecord("01/15/2023", 1000.0, 50000.0));
    inputs_.otherTransactions.push_back(otherTx("01/15/2023", 500.0, true, false));
    inputs_.otherTransactions.push_back(otherTx("01/15/2023", -300.0, false, true));

    auto rows = builder_->build(inputs_);

    ASSERT_EQ(rows.size(), 1u);
    EXPECT_DOUBLE_EQ(rows[0].otherPnl, 500.0);
    EXPECT_DOUBLE_EQ(rows[0].overnight, -300.0);
    EXPECT_DOUBLE_EQ(rows[0].totalPnl, 1500.0);
    EXPECT_DOUBLE_EQ(rows[0].totalOther, 200.0);
    // 50000 + 200 - (-300)
    EXPECT_DOUBLE_EQ(rows[0].endFundValue, 50500.0);
}

TEST_F(LedgerBuilderTest, RunningOtherTotal_ResetsOnEpoch) {
    builder_ = std::make_unique<LedgerBuilder>(domain::CalendarDate(2023, 1, 19));
    for (const char* date : {"01/18/2023", "01/19/2023", "01/20/2023"}) {
        inputs_.brokerRecords.push_back(brokerRecord(date, 0.0, 1000.0));
    }
    inputs_.otherTransactions.push_back(otherTx("01/18/2023", 100.0));
    inputs_.otherTransactions.push_back(otherTx("01/19/2023", 50.0));
    inputs_.otherTransactions.push_back(otherTx("01/20/2023", 25.0));

    auto rows = builder_->build(inputs_);

    EXPECT_DOUBLE_EQ(row(rows, "01/18/2023").totalOther, 100.0);
    EXPECT_DOUBLE_EQ(row(rows, "01/19/2023").totalOther, 50.0);
    EXPECT_DOUBLE_EQ(row(rows, "01/20/2023").totalOther, 75.0);
}

TEST_F(LedgerBuilderTest, RunningOtherTotal_NoEpochAccumulates) {
    for (const char* date : {"01/18/2023", "01/19/2023"}) {
        inputs_.brokerRecords.push_back(brokerRecord(date, 0.0, 1000.0));
    }
    inputs_.otherTransactions.push_back(otherTx("01/18/2023", 100.0));
    inputs_.otherTransactions.push_back(otherTx("01/19/2023", 50.0));

    auto rows = builder_->build(inputs_);

    EXPECT_DOUBLE_EQ(row(rows, "01/19/2023").totalOther, 150.0);
}

// ============================================================================
// CARRY-FORWARD AND PERIODS
// ============================================================================

TEST_F(LedgerBuilderTest, CarryForward_IncludesPreviousOvernight) {
    inputs_.brokerRecords.push_back(brokerRecord("01/03/2023", 100.0, 1000.0));
    inputs_.brokerRecords.push_back(brokerRecord("01/04/2023", 50.0, 1050.0));
    inputs_.brokerRecords.push_back(brokerRecord("01/05/2023", -20.0, 1030.0));
    inputs_.otherTransactions.push_back(otherTx("01/04/2023", 200.0, false, true));

    auto rows = builder_->build(inputs_);
    ASSERT_EQ(rows.size(), 3u);

    // Первый день: стартовая стоимость равна конечной
    EXPECT_DOUBLE_EQ(rows[0].startFundValue, 1000.0);
    EXPECT_DOUBLE_EQ(rows[0].endFundValue, 1000.0);

    EXPECT_DOUBLE_EQ(rows[1].startFundValue, 1000.0);
    EXPECT_DOUBLE_EQ(rows[1].endFundValue, 1050.0);
    EXPECT_DOUBLE_EQ(rows[1].overnight, 200.0);

    EXPECT_DOUBLE_EQ(rows[2].startFundValue, 1250.0);
    EXPECT_DOUBLE_EQ(rows[2].endFundValue, 1230.0);

    for (size_t i = 1; i < rows.size(); ++i) {
        EXPECT_DOUBLE_EQ(rows[i - 1].endFundValue + rows[i - 1].overnight, rows[i].startFundValue);
    }
}

TEST_F(LedgerBuilderTest, FirstDateIsValuationDate_NavAndReturns) {
    inputs_.brokerRecords.push_back(brokerRecord("01/03/2023", 100.0, 1000.0));
    inputs_.brokerRecords.push_back(brokerRecord("01/04/2023", 50.0, 1050.0));

    auto rows = builder_->build(inputs_);

    EXPECT_TRUE(rows[0].valuationDate);
    EXPECT_DOUBLE_EQ(rows[0].periodStartingNav.value(), 1000.0);
    EXPECT_DOUBLE_EQ(rows[0].startFundValueWithCumPnl.value(), 1000.0);
    EXPECT_DOUBLE_EQ(rows[0].endFundValueWithCumPnl.value(), 1100.0);
    EXPECT_DOUBLE_EQ(rows[0].periodCumulativePnl.value(), 100.0);
    EXPECT_DOUBLE_EQ(rows[0].dailyReturn.value(), 0.1);
    EXPECT_DOUBLE_EQ(rows[0].periodCumulativeReturn.value(), 0.1);

    EXPECT_FALSE(rows[1].valuationDate);
    EXPECT_DOUBLE_EQ(rows[1].periodStartingNav.value(), 1000.0);
    EXPECT_DOUBLE_EQ(rows[1].startFundValueWithCumPnl.value(), 1100.0);
    EXPECT_DOUBLE_EQ(rows[1].endFundValueWithCumPnl.value(), 1150.0);
    EXPECT_DOUBLE_EQ(rows[1].periodCumulativePnl.value(), 150.0);
    EXPECT_DOUBLE_EQ(rows[1].dailyReturn.value(), 50.0 / 1100.0);
    EXPECT_DOUBLE_EQ(rows[1].periodCumulativeReturn.value(), 0.15);
}

TEST_F(LedgerBuilderTest, NewMonth_ResetsPeriodFromCarryForward) {
    inputs_.brokerRecords.push_back(brokerRecord("01/30/2023", 10.0, 1000.0));
    inputs_.brokerRecords.push_back(brokerRecord("01/31/2023", 20.0, 1020.0));
    inputs_.brokerRecords.push_back(brokerRecord("02/01/2023", 30.0, 1050.0));

    auto rows = builder_->build(inputs_);
    const auto& february = row(rows, "02/01/2023");

    EXPECT_TRUE(february.valuationDate);
    EXPECT_DOUBLE_EQ(february.startFundValue, 1020.0);
    EXPECT_DOUBLE_EQ(february.periodStartingNav.value(), 1020.0);
    EXPECT_DOUBLE_EQ(february.startFundValueWithCumPnl.value(), 1020.0);
    EXPECT_DOUBLE_EQ(february.periodCumulativePnl.value(), 30.0);
    EXPECT_DOUBLE_EQ(february.periodCumulativeReturn.value(), 30.0 / 1020.0);
    EXPECT_DOUBLE_EQ(row(rows, "01/31/2023").periodCumulativePnl.value(), 30.0);
}

TEST_F(LedgerBuilderTest, OverrideValue_ReplacesStartAndStartsPeriod) {
    inputs_.brokerRecords.push_back(brokerRecord("01/03/2023", 0.0, 1000.0));
    inputs_.brokerRecords.push_back(brokerRecord("01/16/2023", 40.0, 1040.0));
    inputs_.brokerRecords.push_back(brokerRecord("01/17/2023", 10.0, 1050.0));
    inputs_.valuationOverrides.push_back(valuation("01/16/2023", 5000.0));

    auto rows = builder_->build(inputs_);
    const auto& overridden = row(rows, "01/16/2023");

    EXPECT_TRUE(overridden.valuationDate);
    EXPECT_DOUBLE_EQ(overridden.startFundValue, 5000.0);
    EXPECT_DOUBLE_EQ(overridden.periodStartingNav.value(), 5000.0);
    EXPECT_DOUBLE_EQ(overridden.periodCumulativePnl.value(), 40.0);

    // Следующий день переносит конечную стоимость, а не значение оценки
    EXPECT_DOUBLE_EQ(row(rows, "01/17/2023").startFundValue, 1040.0);
    EXPECT_DOUBLE_EQ(row(rows, "01/17/2023").periodStartingNav.value(), 5000.0);
}

TEST_F(LedgerBuilderTest, OverrideWithoutValue_OnlyMarksValuationDate) {
    inputs_.brokerRecords.push_back(brokerRecord("01/03/2023", 0.0, 1000.0));
    inputs_.brokerRecords.push_back(brokerRecord("01/10/2023", 25.0, 1025.0));
    inputs_.valuationOverrides.push_back(valuation("01/10/2023", std::nullopt));

    auto rows = builder_->build(inputs_);
    const auto& marked = row(rows, "01/10/2023");

    EXPECT_TRUE(marked.valuationDate);
    EXPECT_DOUBLE_EQ(marked.startFundValue, 1000.0);
    EXPECT_DOUBLE_EQ(marked.periodStartingNav.value(), 1000.0);
    EXPECT_DOUBLE_EQ(marked.periodCumulativePnl.value(), 25.0);
}

TEST_F(LedgerBuilderTest, ZeroDenominator_ReturnsAreNull) {
    inputs_.brokerRecords.push_back(brokerRecord("01/03/2023", 0.0, 0.0));
    inputs_.brokerRecords.push_back(brokerRecord("01/04/2023", 100.0, 100.0));

    auto rows = builder_->build(inputs_);

    EXPECT_DOUBLE_EQ(rows[0].periodStartingNav.value(), 0.0);
    EXPECT_FALSE(rows[0].dailyReturn.has_value());
    EXPECT_FALSE(rows[0].periodCumulativeReturn.has_value());
    EXPECT_FALSE(rows[1].dailyReturn.has_value());
    EXPECT_FALSE(rows[1].periodCumulativeReturn.has_value());
    EXPECT_DOUBLE_EQ(rows[1].endFundValueWithCumPnl.value(), 100.0);
}

TEST_F(LedgerBuilderTest, NullBrokerPnl_CountsAsZero) {
    inputs_.brokerRecords.push_back(brokerRecord("01/03/2023", std::nullopt, 1000.0));
    inputs_.otherTransactions.push_back(otherTx("01/03/2023", 15.0, true));

    auto rows = builder_->build(inputs_);

    EXPECT_FALSE(rows[0].brokerPnl.has_value());
    EXPECT_DOUBLE_EQ(rows[0].totalPnl, 15.0);
}

TEST_F(LedgerBuilderTest, Rebuild_IsDeterministic) {
    inputs_.brokerRecords.push_back(brokerRecord("01/03/2023", 100.0, 1000.0));
    inputs_.brokerRecords.push_back(brokerRecord("01/04/2023", 50.0, 1050.0));
    inputs_.brokerRecords.push_back(brokerRecord("02/01/2023", 5.0, 1060.0));
    inputs_.otherTransactions.push_back(otherTx("01/04/2023", 200.0, true, true));
    inputs_.valuationOverrides.push_back(valuation("01/04/2023", 1200.0));

    auto first = builder_->build(inputs_);
    auto second = builder_->build(inputs_);

    EXPECT_EQ(first, second);
}
