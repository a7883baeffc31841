/// @file tests/trend/test_dpo.cpp
/// @brief Tests for the Detrended Price Oscillator.

#include "tai/trend.hpp"

#include "common/sample_data.hpp"

#include <gtest/gtest.h>

using namespace tai;

// On x[i] = i + 1 with length 4: SMA4[i] = i − 0.5 and t = 3.

TEST(Dpo, CenteredReadsAhead) {
    const auto d = dpo(sample::ramp(10), {.length = 4});
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->name, "DPO_4");
    EXPECT_EQ(d->category, Category::Trend);
    for (std::size_t i = 0; i <= 6; ++i) EXPECT_NEAR((*d)[i], -1.5, 1e-12) << "i=" << i;
    for (std::size_t i = 7; i < 10; ++i) EXPECT_TRUE(is_null((*d)[i])) << "i=" << i;
}

TEST(Dpo, TrailingFormLooksBack) {
    const auto d = dpo(sample::ramp(10), {.length = 4, .centered = false});
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(sample::first_valid(d->values), 6);
    for (std::size_t i = 6; i < 10; ++i) EXPECT_NEAR((*d)[i], 4.5, 1e-12);
}

TEST(Dpo, NoLookaheadForcesTrailingForm) {
    Options opts;
    opts.lookahead = false;
    const auto d = dpo(sample::ramp(10), {.length = 4}, opts);
    ASSERT_TRUE(d.has_value());
    EXPECT_TRUE(is_null((*d)[0]));
    EXPECT_NEAR((*d)[9], 4.5, 1e-12);
}

TEST(Dpo, DefaultLengthAndShortInput) {
    const auto d = dpo(sample::ramp(40));
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->name, "DPO_20");
    EXPECT_FALSE(dpo(sample::ramp(19)).has_value());
}
