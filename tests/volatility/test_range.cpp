/// @file tests/volatility/test_range.cpp
/// @brief Tests for True Range, ATR, NATR and Price Distance.

#include "tai/volatility.hpp"

#include "common/sample_data.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace tai;

namespace {

const Options kBundled{.talib = false};

/// Bars with high − low ≡ 2 around a unit ramp, so TR ≡ 2 after bar 0.
struct Channel {
    std::vector<double> high, low, close;
};

Channel unit_channel(std::size_t n, double start = 100.0) {
    Channel c;
    c.close = sample::ramp(n, start);
    for (double x : c.close) {
        c.high.push_back(x + 1.0);
        c.low.push_back(x - 1.0);
    }
    return c;
}

} // namespace

// ─── MaMode ───────────────────────────────────────────────────────────────────

TEST(MaModeParse, NamesRoundTrip) {
    EXPECT_EQ(parse_ma_mode("RMA"), MaMode::Rma);
    EXPECT_EQ(parse_ma_mode("ema"), MaMode::Ema);
    EXPECT_EQ(parse_ma_mode("sma"), MaMode::Sma);
    EXPECT_FALSE(parse_ma_mode("hma").has_value());
    EXPECT_STREQ(to_string(MaMode::Ema), "ema");
}

// ─── true_range ───────────────────────────────────────────────────────────────

TEST(TrueRange, GapsCountAgainstPreviousClose) {
    const std::vector<double> high {10, 12, 11};
    const std::vector<double> low  { 8,  9,  9};
    const std::vector<double> close{ 9, 11, 10};
    const auto tr = true_range(high, low, close, {}, kBundled);
    ASSERT_TRUE(tr.has_value());
    EXPECT_EQ(tr->name, "TRUERANGE_1");
    EXPECT_EQ(tr->category, Category::Volatility);
    EXPECT_TRUE(is_null((*tr)[0]));
    EXPECT_DOUBLE_EQ((*tr)[1], 3.0);
    EXPECT_DOUBLE_EQ((*tr)[2], 2.0);
}

TEST(TrueRange, DriftSetsLeadingNulls) {
    const auto c = unit_channel(10);
    const auto tr = true_range(c.high, c.low, c.close, {.drift = 3}, kBundled);
    ASSERT_TRUE(tr.has_value());
    EXPECT_EQ(tr->name, "TRUERANGE_3");
    EXPECT_EQ(sample::first_valid(tr->values), 3);
    // |high − close[−3]| = |x + 1 − (x − 3)| = 4
    EXPECT_DOUBLE_EQ((*tr)[5], 4.0);
}

TEST(TrueRange, MisalignedInputIsNullopt) {
    const std::vector<double> a{1, 2, 3};
    const std::vector<double> b{1, 2};
    EXPECT_FALSE(true_range(a, b, a).has_value());
}

// ─── atr ──────────────────────────────────────────────────────────────────────

TEST(Atr, LabelsFollowModeAndPercent) {
    const auto c = unit_channel(40);
    EXPECT_EQ(atr(c.high, c.low, c.close)->name, "ATRr_14");
    EXPECT_EQ(atr(c.high, c.low, c.close, {.mamode = MaMode::Ema})->name, "ATRe_14");
    EXPECT_EQ(atr(c.high, c.low, c.close, {.mamode = MaMode::Sma})->name, "ATRs_14");
    EXPECT_EQ(atr(c.high, c.low, c.close, {.percent = true})->name, "ATRr_14p");
}

TEST(Atr, ConstantRangeAfterWarmup) {
    const auto c = unit_channel(40);
    for (const Options& opts : {Options{}, kBundled}) {
        const auto a = atr(c.high, c.low, c.close, {}, opts);
        ASSERT_TRUE(a.has_value());
        EXPECT_EQ(sample::first_valid(a->values), 14);
        EXPECT_NEAR((*a)[39], 2.0, 1e-9);
    }
}

TEST(Atr, PercentOfClose) {
    const auto c = unit_channel(40, 200.0);
    const auto a = atr(c.high, c.low, c.close, {.percent = true}, kBundled);
    ASSERT_TRUE(a.has_value());
    EXPECT_NEAR((*a)[39], 2.0 * 100.0 / c.close[39], 1e-9);
}

TEST(Atr, ShortInputIsNullopt) {
    const auto c = unit_channel(10);
    EXPECT_FALSE(atr(c.high, c.low, c.close).has_value());
}

// ─── natr ─────────────────────────────────────────────────────────────────────

TEST(Natr, ScaledByClose) {
    const auto c = unit_channel(40);
    const auto n = natr(c.high, c.low, c.close, {}, kBundled);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->name, "NATR_14");
    EXPECT_EQ(sample::first_valid(n->values), 14);
    EXPECT_NEAR((*n)[39], 100.0 * 2.0 / c.close[39], 1e-9);
}

// ─── pdist ────────────────────────────────────────────────────────────────────

TEST(Pdist, TwiceRangePlusGapMinusBody) {
    const std::vector<double> open {10, 11};
    const std::vector<double> high {12, 13};
    const std::vector<double> low  { 9, 10};
    const std::vector<double> close{11, 12};
    const auto p = pdist(open, high, low, close);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->name, "PDIST");
    EXPECT_TRUE(is_null((*p)[0]));
    // 2·3 + |11 − 11| − |12 − 11| = 5
    EXPECT_NEAR((*p)[1], 5.0, 1e-12);
}
