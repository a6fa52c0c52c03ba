/**
 * @file PeriodTrackerTest.cpp
 * @brief Unit tests for PeriodTracker
 */

#include <gtest/gtest.h>
#include "application/PeriodTracker.hpp"

using namespace navledger;
using namespace navledger::application;
using domain::CalendarDate;

namespace {

std::vector<CalendarDate> dates(std::initializer_list<const char*> texts) {
    std::vector<CalendarDate> result;
    for (const auto* text : texts) {
        result.push_back(*CalendarDate::parse(text));
    }
    return result;
}

} // namespace

TEST(PeriodTrackerTest, FirstDateOfEachMonth) {
    auto result = PeriodTracker::firstDatesOfMonth(
        dates({"01/03/2023", "01/04/2023", "02/01/2023", "02/02/2023", "03/15/2023"}));

    ASSERT_EQ(result.size(), 3u);
    EXPECT_TRUE(result.count(*CalendarDate::parse("01/03/2023")));
    EXPECT_TRUE(result.count(*CalendarDate::parse("02/01/2023")));
    EXPECT_TRUE(result.count(*CalendarDate::parse("03/15/2023")));
}

TEST(PeriodTrackerTest, UnsortedInput_UsesEarliestDateOfMonth) {
    auto result = PeriodTracker::firstDatesOfMonth(
        dates({"01/20/2023", "12/30/2022", "01/05/2023", "12/02/2022"}));

    ASSERT_EQ(result.size(), 2u);
    EXPECT_TRUE(result.count(*CalendarDate::parse("12/02/2022")));
    EXPECT_TRUE(result.count(*CalendarDate::parse("01/05/2023")));
}

TEST(PeriodTrackerTest, SameMonthDifferentYears_AreSeparatePeriods) {
    auto result = PeriodTracker::firstDatesOfMonth(dates({"01/10/2022", "01/12/2023"}));

    EXPECT_EQ(result.size(), 2u);
}

TEST(PeriodTrackerTest, OverrideDatesAreAdded) {
    std::set<CalendarDate> overrides = {
        *CalendarDate::parse("01/16/2023"),
        *CalendarDate::parse("06/01/2023")     // вне известных дат
    };

    auto result = PeriodTracker::valuationDates(dates({"01/03/2023", "01/16/2023", "01/17/2023"}), overrides);

    ASSERT_EQ(result.size(), 3u);
    EXPECT_TRUE(result.count(*CalendarDate::parse("01/03/2023")));
    EXPECT_TRUE(result.count(*CalendarDate::parse("01/16/2023")));
    EXPECT_TRUE(result.count(*CalendarDate::parse("06/01/2023")));
    EXPECT_FALSE(result.count(*CalendarDate::parse("01/17/2023")));
}

TEST(PeriodTrackerTest, EmptyInput) {
    EXPECT_TRUE(PeriodTracker::valuationDates({}, {}).empty());
}
