#include "chronicle/core/Date.hh"
#include <gtest/gtest.h>

using namespace chronicle;

TEST(DateTest, EpochIsDayZero) {
    auto day = dateToDays("2200.01.01");
    ASSERT_TRUE(day.has_value());
    EXPECT_EQ(*day, 0);
}

TEST(DateTest, MonthsAndYearsHaveFixedLength) {
    EXPECT_EQ(dateToDays("2200.02.01"), 30);
    EXPECT_EQ(dateToDays("2201.01.01"), 360);
    EXPECT_EQ(dateToDays("2230.06.15"), 30 * 360 + 5 * 30 + 14);
}

TEST(DateTest, DatesBeforeEpochAreNegative) {
    EXPECT_EQ(dateToDays("2199.12.30"), -1);
    EXPECT_EQ(daysToDate(-1), "2199.12.30");
}

TEST(DateTest, RejectsMalformedDates) {
    EXPECT_FALSE(dateToDays("").has_value());
    EXPECT_FALSE(dateToDays("2200.01").has_value());
    EXPECT_FALSE(dateToDays("2200.01.01.01").has_value());
    EXPECT_FALSE(dateToDays("2200.xx.01").has_value());
    EXPECT_FALSE(dateToDays("2200..01").has_value());
}

TEST(DateTest, RejectsOutOfRangeFields) {
    EXPECT_FALSE(dateToDays("2200.13.01").has_value());
    EXPECT_FALSE(dateToDays("2200.00.10").has_value());
    EXPECT_FALSE(dateToDays("2200.01.31").has_value());
    EXPECT_FALSE(dateToDays("2200.13.40").has_value());
    EXPECT_FALSE(dateToDays("2200.01.00").has_value());
    EXPECT_EQ(dateToDays("2200.12.30"), 359);
}

TEST(DateTest, RejectsYearsOutsideTheDayRange) {
    EXPECT_FALSE(dateToDays("99999999.01.01").has_value());
    EXPECT_FALSE(dateToDays("-99999999.01.01").has_value());
    EXPECT_EQ(dateToDays("1.01.01"), daysFromYmd(1, 1, 1));
}

TEST(DateTest, FormatsWithPadding) {
    EXPECT_EQ(daysToDate(0), "2200.01.01");
    EXPECT_EQ(daysToDate(389), "2201.02.30");
}

TEST(DateTest, DaysFromYmdMatchesParsing) {
    static_assert(daysFromYmd(2200, 1, 1) == 0);
    EXPECT_EQ(dateToDays("2245.11.03"), daysFromYmd(2245, 11, 3));
    for (Day day : {0, 29, 30, 359, 360, 12345}) {
        EXPECT_EQ(dateToDays(daysToDate(day)), day);
    }
}
