/**
 * @file test_time_utils.cpp
 * @brief Unit tests for the calendar helpers
 */

#include <gtest/gtest.h>

#include "upifinder/core/TimeUtils.hpp"

using namespace UPIFINDER;

// Test: Days from civil matches known dates
TEST(TimeUtilsTest, DaysFromCivil)
{
    EXPECT_EQ(DaysFromCivil(1970, 1, 1), 0);
    EXPECT_EQ(DaysFromCivil(1970, 1, 2), 1);
    EXPECT_EQ(DaysFromCivil(1969, 12, 31), -1);
    EXPECT_EQ(DaysFromCivil(1980, 1, 6), 3657);
    EXPECT_EQ(DaysFromCivil(2000, 3, 1), 11017);
}

// Test: Seconds are counted from the requested epoch
TEST(TimeUtilsTest, SecondsSinceEpochs)
{
    CivilTime t;
    t.year = 1980;
    t.month = 1;
    t.day = 6;
    EXPECT_EQ(SecondsSince(t, kGPSEpoch), 0);
    EXPECT_EQ(SecondsSince(t, kUnixEpoch), 315964800);

    t.hour = 1;
    t.second = 5;
    EXPECT_EQ(SecondsSince(t, kGPSEpoch), 3605);
}

// Test: Compact timestamps decode to UTC
TEST(TimeUtilsTest, ParseCompactTimestamp)
{
    auto t = ParseCompactTimestamp("20180601120530");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(Clock::to_time_t(*t), 1527854730);
    EXPECT_EQ(FormatTime(*t), "2018-06-01 12:05:30");
    EXPECT_EQ(FormatTime(*t, true), "2018-06-01T12:05:30Z");
}

// Test: Malformed compact timestamps are refused
TEST(TimeUtilsTest, ParseCompactTimestampRejects)
{
    EXPECT_FALSE(ParseCompactTimestamp("").has_value());
    EXPECT_FALSE(ParseCompactTimestamp("2018060112053").has_value());
    EXPECT_FALSE(ParseCompactTimestamp("201806011205300").has_value());
    EXPECT_FALSE(ParseCompactTimestamp("2018060112053a").has_value());
    EXPECT_FALSE(ParseCompactTimestamp("20180230120000").has_value());
    EXPECT_FALSE(ParseCompactTimestamp("20180601240000").has_value());
    EXPECT_TRUE(ParseCompactTimestamp("20160229000000").has_value());
}

// Test: ISO dates parse to midnight
TEST(TimeUtilsTest, ParseDate)
{
    auto d = ParseDate("2018-06-04");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(FormatTime(*d), "2018-06-04 00:00:00");

    EXPECT_FALSE(ParseDate("2018/06/04").has_value());
    EXPECT_FALSE(ParseDate("2018-6-4").has_value());
    EXPECT_FALSE(ParseDate("2018-13-01").has_value());
}

// Test: Day of year is one based
TEST(TimeUtilsTest, ToCivilDayOfYear)
{
    unsigned yday = 0;
    CivilTime c = ToCivil(*ParseDate("2018-01-01"), &yday);
    EXPECT_EQ(c.year, 2018);
    EXPECT_EQ(yday, 1u);

    ToCivil(*ParseDate("2016-12-31"), &yday);
    EXPECT_EQ(yday, 366u);
}

// Test: Durations print their significant units
TEST(TimeUtilsTest, FormatDuration)
{
    using std::chrono::seconds;
    EXPECT_EQ(FormatDuration(seconds(0)), "0s");
    EXPECT_EQ(FormatDuration(seconds(45)), "45s");
    EXPECT_EQ(FormatDuration(seconds(125)), "2m5s");
    EXPECT_EQ(FormatDuration(seconds(3605)), "1h0m5s");
    EXPECT_EQ(FormatDuration(seconds(-10)), "-10s");
}
