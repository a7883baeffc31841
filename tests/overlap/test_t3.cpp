/// @file tests/overlap/test_t3.cpp
/// @brief Tests for Tillson's T3.
///
/// Test categories:
///   - Label formatting with the volume factor
///   - Warm-up of 6·(n − 1) nulls from the chained EMAs
///   - All-null output when the warm-up exceeds the input
///   - Coefficients sum to one (constant input passes through)
///   - Out-of-range volume factor falls back to 0.7

#include "tai/overlap.hpp"

#include "common/sample_data.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace tai;

namespace {
const Options kBundled{.talib = false};
}

TEST(T3, DefaultLabel) {
    const auto t = t3(sample::ramp(100), {}, kBundled);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->name, "T3_10_0.7");
    EXPECT_EQ(t->category, Category::Overlap);
}

TEST(T3, ChainedWarmupLength) {
    const auto data = sample::random_walk(30);
    const auto t = t3(data.close, {.length = 5}, kBundled);
    ASSERT_TRUE(t.has_value());
    ASSERT_EQ(t->size(), 30u);
    EXPECT_EQ(sample::first_valid(t->values), 24);
}

TEST(T3, WarmupLongerThanInputIsAllNull) {
    const auto data = sample::random_walk(30);
    const auto t = t3(data.close, {.length = 14, .a = 0.7}, kBundled);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->name, "T3_14_0.7");
    EXPECT_EQ(t->size(), 30u);
    EXPECT_EQ(t->null_count(), 30u);
}

TEST(T3, ConstantInputPassesThrough) {
    const auto t = t3(std::vector<double>(80, 50.0), {.length = 4, .a = 0.5}, kBundled);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->name, "T3_4_0.5");
    for (std::size_t i = 18; i < t->size(); ++i) {
        EXPECT_NEAR((*t)[i], 50.0, 1e-9);
    }
}

TEST(T3, OutOfRangeVolumeFactorUsesDefault) {
    const auto hi = t3(sample::ramp(100), {.length = 5, .a = 1.5}, kBundled);
    const auto lo = t3(sample::ramp(100), {.length = 5, .a = 0.0}, kBundled);
    ASSERT_TRUE(hi.has_value());
    ASSERT_TRUE(lo.has_value());
    EXPECT_EQ(hi->name, "T3_5_0.7");
    EXPECT_EQ(lo->name, "T3_5_0.7");
}

TEST(T3, ShortInputIsNullopt) {
    EXPECT_FALSE(t3(sample::ramp(4), {.length = 5}).has_value());
}
