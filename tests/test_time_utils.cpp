#include <gtest/gtest.h>
#include <core/time_utils.hpp>

TEST(TimeUtils, ParseDurationUnits) {
    EXPECT_EQ(parse_duration_ms("30s"), 30 * 1000);
    EXPECT_EQ(parse_duration_ms("15m"), 15 * 60 * 1000);
    EXPECT_EQ(parse_duration_ms("2h"), 2 * 60 * 60 * 1000);
}

TEST(TimeUtils, ParseDurationTrimsWhitespace) {
    EXPECT_EQ(parse_duration_ms(" 5m \n"), 5 * 60 * 1000);
}

TEST(TimeUtils, ParseDurationRejectsBareNumber) {
    EXPECT_FALSE(parse_duration_ms("900").has_value());
}

TEST(TimeUtils, ParseDurationRejectsGarbage) {
    EXPECT_FALSE(parse_duration_ms("").has_value());
    EXPECT_FALSE(parse_duration_ms("abc").has_value());
    EXPECT_FALSE(parse_duration_ms("10d").has_value());
    EXPECT_FALSE(parse_duration_ms("1h30m").has_value());
    EXPECT_FALSE(parse_duration_ms("-5m").has_value());
}

TEST(TimeUtils, FormatRemainingExpired) {
    EXPECT_EQ(format_remaining(0), "expired");
    EXPECT_EQ(format_remaining(-1000), "expired");
}

TEST(TimeUtils, FormatRemainingRoundsMinutesUp) {
    // 14m01s left still reads as 15m
    EXPECT_EQ(format_remaining(14 * 60 * 1000 + 1000), "15m");
    EXPECT_EQ(format_remaining(1), "1m");
    EXPECT_EQ(format_remaining(15 * 60 * 1000), "15m");
}

TEST(TimeUtils, FormatRemainingHours) {
    EXPECT_EQ(format_remaining(60 * 60 * 1000), "1h");
    EXPECT_EQ(format_remaining(65 * 60 * 1000), "1h 5m");
    EXPECT_EQ(format_remaining(2 * 60 * 60 * 1000), "2h");
}

TEST(TimeUtils, FormatElapsed) {
    EXPECT_EQ(format_elapsed(350), "350ms");
    EXPECT_EQ(format_elapsed(1200), "1.2s");
    EXPECT_EQ(format_elapsed(125000), "2m5s");
}

TEST(TimeUtils, FormatElapsedNegativeClampsToZero) {
    EXPECT_EQ(format_elapsed(-5), "0ms");
}
