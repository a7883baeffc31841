/// @file tests/core/test_series.cpp
/// @brief Tests for the series utilities: validation, offset, fill, labels
///        and the elementwise helpers.

#include "tai/series.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>

using namespace tai;

// ─── verify_series / argument normalisation ──────────────────────────────────

TEST(VerifySeries, RejectsEmptyAndShortInput) {
    const std::vector<double> x{1.0, 2.0, 3.0};
    EXPECT_FALSE(verify_series({}, 0));
    EXPECT_FALSE(verify_series(x, 4));
    EXPECT_TRUE(verify_series(x, 3));
    EXPECT_TRUE(verify_series(x, -5));
}

TEST(PositiveOr, FallsBackOnNonPositiveOrNonFinite) {
    EXPECT_EQ(positive_or(0, 10), 10);
    EXPECT_EQ(positive_or(-3, 10), 10);
    EXPECT_EQ(positive_or(7, 10), 7);
    EXPECT_DOUBLE_EQ(positive_or(0.0, 2.0), 2.0);
    EXPECT_DOUBLE_EQ(positive_or(std::numeric_limits<double>::infinity(), 2.0), 2.0);
    EXPECT_DOUBLE_EQ(positive_or(NaN, 2.0), 2.0);
    EXPECT_DOUBLE_EQ(positive_or(1.5, 2.0), 1.5);
    EXPECT_EQ(get_drift(0), 1);
    EXPECT_EQ(get_drift(3), 3);
}

// ─── shift ────────────────────────────────────────────────────────────────────

TEST(Shift, PositiveDelaysNegativeAdvances) {
    const std::vector<double> x{1.0, 2.0, 3.0, 4.0};

    const auto late = shift(x, 1);
    EXPECT_TRUE(is_null(late[0]));
    EXPECT_DOUBLE_EQ(late[1], 1.0);
    EXPECT_DOUBLE_EQ(late[3], 3.0);

    const auto early = shift(x, -2);
    EXPECT_DOUBLE_EQ(early[0], 3.0);
    EXPECT_DOUBLE_EQ(early[1], 4.0);
    EXPECT_TRUE(is_null(early[2]));
    EXPECT_TRUE(is_null(early[3]));
}

TEST(Shift, OffsetAtLeastLengthGivesAllNull) {
    const std::vector<double> x{1.0, 2.0, 3.0};
    for (double v : shift(x, 3))  EXPECT_TRUE(is_null(v));
    for (double v : shift(x, -7)) EXPECT_TRUE(is_null(v));
}

TEST(Shift, OffsetThenInverseRestoresAlignment) {
    const std::vector<double> x{5.0, 6.0, 7.0, 8.0, 9.0};
    const auto back = shift(shift(x, 2), -2);
    ASSERT_EQ(back.size(), x.size());
    for (std::size_t i = 0; i < 3; ++i) EXPECT_DOUBLE_EQ(back[i], x[i]);
    EXPECT_TRUE(is_null(back[3]));
    EXPECT_TRUE(is_null(back[4]));
}

// ─── fill / post_process ──────────────────────────────────────────────────────

TEST(Fill, ForwardLeavesLeadingNullsAlone) {
    std::vector<double> x{NaN, 1.0, NaN, NaN, 4.0, NaN};
    fill_forward(x);
    EXPECT_TRUE(is_null(x[0]));
    EXPECT_DOUBLE_EQ(x[2], 1.0);
    EXPECT_DOUBLE_EQ(x[3], 1.0);
    EXPECT_DOUBLE_EQ(x[5], 4.0);
}

TEST(Fill, BackwardLeavesTrailingNullsAlone) {
    std::vector<double> x{NaN, 1.0, NaN, 4.0, NaN};
    fill_backward(x);
    EXPECT_DOUBLE_EQ(x[0], 1.0);
    EXPECT_DOUBLE_EQ(x[2], 4.0);
    EXPECT_TRUE(is_null(x[4]));
}

TEST(PostProcess, OffsetThenConstantFill) {
    Options opts;
    opts.offset = 1;
    opts.fillna = 0.0;
    const auto out = post_process({1.0, 2.0, 3.0}, opts);
    EXPECT_DOUBLE_EQ(out[0], 0.0);
    EXPECT_DOUBLE_EQ(out[1], 1.0);
    EXPECT_DOUBLE_EQ(out[2], 2.0);
}

TEST(PostProcess, ConstantFillWinsOverFillMethod) {
    Options opts;
    opts.fillna      = -1.0;
    opts.fill_method = FillMethod::Forward;
    const auto out = post_process({1.0, NaN, 3.0}, opts);
    EXPECT_DOUBLE_EQ(out[1], -1.0);
}

TEST(PostProcess, MakeSeriesCarriesNameAndCategory) {
    const auto s = make_series("X_3", Category::Trend, {1.0, NaN}, {});
    EXPECT_EQ(s.name, "X_3");
    EXPECT_EQ(s.category, Category::Trend);
    EXPECT_EQ(s.size(), 2u);
    EXPECT_EQ(s.null_count(), 1u);
}

// ─── Labels ───────────────────────────────────────────────────────────────────

TEST(FormatParam, KeepsDecimalPoint) {
    EXPECT_EQ(format_param(0.7), "0.7");
    EXPECT_EQ(format_param(2.0), "2.0");
    EXPECT_EQ(format_param(100.0), "100.0");
    EXPECT_EQ(format_param(1.25), "1.25");
}

// ─── Elementwise helpers ──────────────────────────────────────────────────────

TEST(Diff, LaggedDifference) {
    const auto d = diff(std::vector<double>{1.0, 4.0, 9.0, 16.0}, 2);
    EXPECT_TRUE(is_null(d[0]));
    EXPECT_TRUE(is_null(d[1]));
    EXPECT_DOUBLE_EQ(d[2], 8.0);
    EXPECT_DOUBLE_EQ(d[3], 12.0);
}

TEST(NonZeroRange, AddsEpsilonWhenAnyDifferenceIsZero) {
    const double eps = std::numeric_limits<double>::epsilon();
    const auto r = non_zero_range(std::vector<double>{1.0, 3.0},
                                  std::vector<double>{1.0, 1.0});
    EXPECT_DOUBLE_EQ(r[0], eps);
    EXPECT_DOUBLE_EQ(r[1], 2.0 + eps);

    const auto plain = non_zero_range(std::vector<double>{2.0, 3.0},
                                      std::vector<double>{1.0, 1.0});
    EXPECT_DOUBLE_EQ(plain[0], 1.0);
    EXPECT_DOUBLE_EQ(plain[1], 2.0);
}

TEST(SignedSeries, SignOfChangeWithInitial) {
    const auto s = signed_series(std::vector<double>{5.0, 6.0, 6.0, 2.0}, 1.0);
    EXPECT_DOUBLE_EQ(s[0], 1.0);
    EXPECT_DOUBLE_EQ(s[1], 1.0);
    EXPECT_DOUBLE_EQ(s[2], 0.0);
    EXPECT_DOUBLE_EQ(s[3], -1.0);
}

TEST(Correlation, PerfectAndDegenerate) {
    const std::vector<double> a{1.0, 2.0, 3.0, 4.0, NaN};
    const std::vector<double> b{2.0, 4.0, 6.0, 8.0, 100.0};
    const std::vector<double> c{-1.0, -2.0, -3.0, -4.0, 0.0};
    const std::vector<double> flat{3.0, 3.0, 3.0, 3.0, 3.0};
    EXPECT_NEAR(correlation(a, b), 1.0, 1e-12);
    EXPECT_NEAR(correlation(a, c), -1.0, 1e-12);
    EXPECT_TRUE(is_null(correlation(a, flat)));
    EXPECT_TRUE(is_null(correlation(std::vector<double>{1.0}, std::vector<double>{1.0})));
}

// ─── FillMethod parsing ───────────────────────────────────────────────────────

TEST(FillMethodParse, AcceptsPandasSpellings) {
    EXPECT_EQ(parse_fill_method("ffill"), FillMethod::Forward);
    EXPECT_EQ(parse_fill_method("PAD"), FillMethod::Forward);
    EXPECT_EQ(parse_fill_method("bfill"), FillMethod::Backward);
    EXPECT_EQ(parse_fill_method("backfill"), FillMethod::Backward);
    EXPECT_FALSE(parse_fill_method("linear").has_value());
}
