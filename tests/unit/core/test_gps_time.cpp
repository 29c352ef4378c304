#include <gtest/gtest.h>

#include <cstdint>

#include "digistream/core/GpsTime.hpp"

using DIGISTREAM::Core::GpsTime;

namespace {
constexpr uint64_t NS = 1000000000ULL;
constexpr uint64_t UNIX_2000 = 946684800ULL;       // 2000-01-01 00:00:00 UTC
constexpr uint64_t UNIX_SAMPLE = 1700000000ULL;    // 2023-11-14 22:13:20 UTC
}

class GpsTimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        sample = GpsTime(23, 318, 22, 13, 20, 123, 456, 789);
    }

    GpsTime sample;
};

TEST_F(GpsTimeTest, DefaultIsStartOfEpochYear) {
    GpsTime time;
    EXPECT_EQ(time.year, 0);
    EXPECT_EQ(time.day, 1);
    EXPECT_EQ(time.hour, 0);
    EXPECT_EQ(time.nanosecond, 0);
    EXPECT_TRUE(time.isValid());
}

TEST_F(GpsTimeTest, FromUnixNsAtYear2000) {
    auto time = GpsTime::fromUnixNs(UNIX_2000 * NS);
    ASSERT_TRUE(time.has_value());
    EXPECT_EQ(*time, GpsTime());
}

TEST_F(GpsTimeTest, FromUnixNsSplitsSubSecondParts) {
    auto time = GpsTime::fromUnixNs(UNIX_SAMPLE * NS + 123456789ULL);
    ASSERT_TRUE(time.has_value());
    EXPECT_EQ(*time, sample);
}

TEST_F(GpsTimeTest, FromUnixNsRejectsTimesBefore2000) {
    EXPECT_FALSE(GpsTime::fromUnixNs(0).has_value());
    EXPECT_FALSE(GpsTime::fromUnixNs(UNIX_2000 * NS - 1).has_value());
}

TEST_F(GpsTimeTest, ToUnixNsInvertsFromUnixNs) {
    EXPECT_EQ(sample.toUnixNs(), UNIX_SAMPLE * NS + 123456789ULL);
    EXPECT_EQ(GpsTime().toUnixNs(), UNIX_2000 * NS);
}

// Last day of a leap year is day 366
TEST_F(GpsTimeTest, LeapYearHas366Days) {
    GpsTime leap(24, 366, 23, 59, 59, 999, 999, 999);
    EXPECT_TRUE(leap.isValid());

    auto next = GpsTime::fromUnixNs(leap.toUnixNs() + 1);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->year, 25);
    EXPECT_EQ(next->day, 1);

    GpsTime common(23, 366, 0, 0, 0, 0, 0, 0);
    EXPECT_FALSE(common.isValid());
}

TEST_F(GpsTimeTest, IsValidChecksEveryField) {
    EXPECT_TRUE(sample.isValid());

    GpsTime time = sample;
    time.day = 0;
    EXPECT_FALSE(time.isValid());

    time = sample;
    time.hour = 24;
    EXPECT_FALSE(time.isValid());

    time = sample;
    time.minute = 60;
    EXPECT_FALSE(time.isValid());

    time = sample;
    time.second = 60;
    EXPECT_FALSE(time.isValid());

    time = sample;
    time.millisecond = 1000;
    EXPECT_FALSE(time.isValid());

    time = sample;
    time.microsecond = 1000;
    EXPECT_FALSE(time.isValid());

    time = sample;
    time.nanosecond = 1000;
    EXPECT_FALSE(time.isValid());
}

TEST_F(GpsTimeTest, ToStringFormat) {
    EXPECT_EQ(sample.toString(), "2023-318 22:13:20.123456789");
    EXPECT_EQ(GpsTime().toString(), "2000-001 00:00:00.000000000");
}

TEST_F(GpsTimeTest, EqualityComparesAllFields) {
    GpsTime other = sample;
    EXPECT_EQ(other, sample);
    other.nanosecond = 1;
    EXPECT_NE(other, sample);
}

TEST_F(GpsTimeTest, NowIsValidAndRecent) {
    GpsTime now = GpsTime::now();
    EXPECT_TRUE(now.isValid());
    EXPECT_GE(now.year, 24);
}
