/// @file tests/overlap/test_vidya.cpp
/// @brief Tests for the Variable Index Dynamic Average.

#include "tai/overlap.hpp"

#include "common/sample_data.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

using namespace tai;

TEST(Vidya, TrendingSeriesIsSeededEma) {
    // Strictly rising: |CMO| = 1 everywhere, so VIDYA is an EMA seeded at 0.
    const auto close = sample::ramp(30);
    const auto v = vidya(close, {.length = 14});
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->name, "VIDYA_14");
    EXPECT_EQ(v->category, Category::Overlap);
    EXPECT_EQ(sample::first_valid(v->values), 14);

    const double alpha = 2.0 / 15.0;
    double prev = 0.0;
    for (std::size_t i = 14; i < close.size(); ++i) {
        prev = alpha * close[i] + prev * (1.0 - alpha);
        EXPECT_NEAR((*v)[i], prev, 1e-9) << "i=" << i;
    }
}

TEST(Vidya, DriftBeyondOneLeavesNoValue) {
    // The scan starts at `length`, where a drift-2 oscillator is not yet
    // defined; that null rides the carry to the end.
    const auto data = sample::random_walk(40, 11);
    const auto v = vidya(data.close, {.length = 5, .drift = 2});
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->size(), 40u);
    EXPECT_EQ(v->null_count(), 40u);

    const auto ramped = vidya(sample::ramp(30), {.length = 5, .drift = 3});
    ASSERT_TRUE(ramped.has_value());
    EXPECT_EQ(ramped->null_count(), 30u);
}

TEST(Vidya, DriftOneStartsAtLength) {
    const auto v = vidya(sample::ramp(30), {.length = 5, .drift = 1});
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(sample::first_valid(v->values), 5);
}

TEST(Vidya, FlatWindowPoisonsTheScan) {
    // 0/0 oscillator on a flat market: nothing after the start is defined.
    const auto v = vidya(std::vector<double>(40, 100.0), {.length = 10});
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->null_count(), 40u);
}

TEST(Vidya, StaysWithinPriceRangeOnRandomWalk) {
    const auto data = sample::random_walk(300, 7);
    const auto v = vidya(data.close, {.length = 10});
    ASSERT_TRUE(v.has_value());
    // The zero seed decays; late values must sit between 0 and the max close.
    double hi = 0.0;
    for (double c : data.close) hi = std::max(hi, c);
    for (std::size_t i = 10; i < v->size(); ++i) {
        ASSERT_FALSE(is_null((*v)[i]));
        EXPECT_GE((*v)[i], 0.0);
        EXPECT_LE((*v)[i], hi);
    }
}

TEST(Vidya, ShortInputIsNullopt) {
    EXPECT_FALSE(vidya(sample::ramp(5), {.length = 14}).has_value());
}
