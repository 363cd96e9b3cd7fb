#include <flowsched/core/types.hpp>

#include <gtest/gtest.h>

using namespace flowsched::core;

TEST(TypesTest, DurationFromSecondsRoundsToNearestNanosecond) {
    EXPECT_EQ(duration_from_seconds(1.5).nanoseconds(), 1'500'000'000);
    EXPECT_EQ(duration_from_seconds(1e-9 * 0.6).nanoseconds(), 1);
    EXPECT_EQ(duration_from_seconds(1e-9 * 0.4).nanoseconds(), 0);
}

TEST(TypesTest, DurationFromSecondsCeilNeverRoundsDown) {
    EXPECT_EQ(duration_from_seconds_ceil(1e-9 * 0.4).nanoseconds(), 1);
    EXPECT_EQ(duration_from_seconds_ceil(2.0).nanoseconds(), 2'000'000'000);
}

TEST(TypesTest, DurationArithmetic) {
    auto a = duration_from_seconds(2.0);
    auto b = duration_from_seconds(0.5);

    EXPECT_DOUBLE_EQ((a + b).seconds(), 2.5);
    EXPECT_DOUBLE_EQ((a - b).seconds(), 1.5);
    EXPECT_DOUBLE_EQ(duration_to_seconds(a + b), 2.5);
    EXPECT_LT(b, a);
    EXPECT_EQ(Duration{}.nanoseconds(), 0);
}

TEST(TypesTest, TimePointArithmetic) {
    auto t0 = time_from_seconds(3.0);
    auto t1 = t0 + duration_from_seconds(1.25);

    EXPECT_DOUBLE_EQ(time_to_seconds(t1), 4.25);
    EXPECT_DOUBLE_EQ((t1 - t0).seconds(), 1.25);
    EXPECT_DOUBLE_EQ(time_to_seconds(TimePoint{}), 0.0);
    EXPECT_LT(t0, t1);
}

TEST(TypesTest, InfinityIsLaterThanAnyFiniteTime) {
    auto inf = TimePoint::infinity();

    EXPECT_TRUE(inf.is_infinite());
    EXPECT_FALSE(time_from_seconds(1e9).is_infinite());
    EXPECT_GT(inf, time_from_seconds(1e9));
    EXPECT_EQ(inf, TimePoint::infinity());
}

TEST(TypesTest, LargestConvertibleTimeStaysBelowInfinity) {
    double limit = time_to_seconds(TimePoint::infinity());

    EXPECT_GT(limit, 9.2e9);
    EXPECT_LT(time_from_seconds(9e9), TimePoint::infinity());
    EXPECT_GT(time_from_seconds(9e9), time_from_seconds(1e9));
}
