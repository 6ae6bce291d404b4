#include <gtest/gtest.h>
#include <stdexcept>
#include "stamp_clock.hh"

namespace {

// -----------------------------------------------------------------------------
// Calendar arithmetic
// -----------------------------------------------------------------------------
TEST(CalendarDateTest, DaysRoundTripAcrossLeapYear) {
    CalendarDate date = CalendarDate::Parse("28.02.2024");
    CalendarDate next = date.AddDays(1);
    EXPECT_EQ(next, (CalendarDate{2024, 2, 29}));
    EXPECT_EQ(next.AddDays(1), (CalendarDate{2024, 3, 1}));
    EXPECT_EQ(CalendarDate::FromDays(0), (CalendarDate{1970, 1, 1}));
}

TEST(CalendarDateTest, YearEndRollsIntoJanuary) {
    CalendarDate date{2025, 12, 31};
    EXPECT_EQ(date.AddDays(1), (CalendarDate{2026, 1, 1}));
}

TEST(CalendarDateTest, ParsesBothFormats) {
    EXPECT_EQ(CalendarDate::Parse("05.03.2025"), (CalendarDate{2025, 3, 5}));
    EXPECT_EQ(CalendarDate::Parse("2025-03-05"), (CalendarDate{2025, 3, 5}));
    EXPECT_THROW(CalendarDate::Parse("31.02.2025"), std::invalid_argument);
    EXPECT_THROW(CalendarDate::Parse("March 5"), std::invalid_argument);
}

TEST(CalendarDateTest, ExtractsDateFromFolderName) {
    CalendarDate date;
    ASSERT_TRUE(CalendarDate::ExtractFromName("Incident 14.07.2025 north site", date));
    EXPECT_EQ(date, (CalendarDate{2025, 7, 14}));
    EXPECT_FALSE(CalendarDate::ExtractFromName("no date here", date));
    EXPECT_EQ(date.ToString(), "14.07.2025");
}

TEST(ClockTimeTest, ParsesAndRejects) {
    EXPECT_EQ(ParseClockTime("08:30:15"), 8 * 3600 + 30 * 60 + 15);
    EXPECT_EQ(ParseClockTime("30:00:00", true), 30 * 3600);
    EXPECT_THROW(ParseClockTime("30:00:00"), std::invalid_argument);
    EXPECT_THROW(ParseClockTime("08:61:00"), std::invalid_argument);
    EXPECT_THROW(ParseClockTime("8.30"), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// Rollover: 23:50:00 + 20 minutes lands on 00:10:00 of the next day
// -----------------------------------------------------------------------------
TEST(StampClockTest, RolloverPastMidnight) {
    StampClock clock(CalendarDate{2025, 3, 5}, 23 * 3600 + 50 * 60);
    clock.Advance(20 * 60);

    ClockReading now = clock.Now();
    EXPECT_EQ(now.date, (CalendarDate{2025, 3, 6}));
    EXPECT_EQ(now.Hours(), 0);
    EXPECT_EQ(now.Minutes(), 10);
    EXPECT_EQ(now.Seconds(), 0);
}

TEST(StampClockTest, MultiDayAdvanceKeepsTimeOfDay) {
    StampClock clock(CalendarDate{2025, 3, 5}, 6 * 3600);
    clock.Advance(2 * 86400 + 90);
    ClockReading now = clock.Now();
    EXPECT_EQ(now.date, (CalendarDate{2025, 3, 7}));
    EXPECT_NEAR(now.seconds_of_day, 6 * 3600 + 90, 1e-9);
}

TEST(StampClockTest, NegativeShiftMovesToPreviousDay) {
    StampClock clock(CalendarDate{2025, 3, 1}, 600);
    clock.Shift(-1200);
    ClockReading now = clock.Now();
    EXPECT_EQ(now.date, (CalendarDate{2025, 2, 28}));
    EXPECT_EQ(now.Hours(), 23);
    EXPECT_EQ(now.Minutes(), 50);
}

TEST(StampClockTest, RefusesToRunBackwards) {
    StampClock clock(CalendarDate{2025, 3, 5}, 0);
    EXPECT_THROW(clock.Advance(-1.0), std::invalid_argument);
    EXPECT_DOUBLE_EQ(clock.Elapsed(), 0.0);
}

} // namespace
