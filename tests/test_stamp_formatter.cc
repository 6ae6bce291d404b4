#include <gtest/gtest.h>
#include <stdexcept>
#include "stamp_formatter.hh"

namespace {

ClockReading At(const CalendarDate& date, int h, int m, int s) {
    StampClock clock(date, h * 3600 + m * 60 + s);
    return clock.Now();
}

TEST(StampFormatterTest, RussianLayout) {
    StampFormatter formatter;
    EXPECT_EQ(formatter.Format(At({2025, 3, 5}, 14, 7, 9)), "05 мар. 2025 г. 14:07:09");
    EXPECT_EQ(formatter.Format(At({2024, 12, 31}, 0, 0, 0)), "31 дек. 2024 г. 00:00:00");
}

TEST(StampFormatterTest, EnglishLayout) {
    StampFormatter formatter("en");
    EXPECT_EQ(formatter.Format(At({2025, 7, 14}, 9, 30, 5)), "14 Jul. 2025 09:30:05");
}

TEST(StampFormatterTest, FractionalSecondsAreTruncated) {
    StampFormatter formatter("en");
    StampClock clock(CalendarDate{2025, 1, 2}, 59.9);
    EXPECT_EQ(formatter.Format(clock.Now()), "02 Jan. 2025 00:00:59");
}

TEST(StampFormatterTest, MonthNamesOverride) {
    StampFormatter formatter("en");
    formatter.SetMonthNames({"I", "II", "III", "IV", "V", "VI",
                             "VII", "VIII", "IX", "X", "XI", "XII"});
    formatter.SetDateSuffix("y");
    EXPECT_EQ(formatter.Format(At({2025, 11, 1}, 23, 59, 59)), "01 XI. 2025y 23:59:59");

    EXPECT_THROW(formatter.SetMonthNames({"Jan", "Feb"}), std::invalid_argument);
}

TEST(StampFormatterTest, UnknownLocaleRejected) {
    EXPECT_THROW(StampFormatter("de"), std::invalid_argument);
}

} // namespace
