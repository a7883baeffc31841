/// @file tests/catalog/test_catalog.cpp
/// @brief Tests for name-based indicator dispatch.

#include "tai/catalog.hpp"
#include "tai/log.hpp"
#include "tai/overlap.hpp"

#include "common/sample_data.hpp"

#include <gtest/gtest.h>
#include <set>
#include <string>

using namespace tai;

namespace {

class CatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Bad-parameter cases log at warn; keep the test output clean.
        log::set_level(log::Level::Off);
        data_ = sample::random_walk(200);
    }
    void TearDown() override { log::set_level(log::Level::Warn); }

    OhlcvColumns data_;
};

} // namespace

// ─── entries / find ───────────────────────────────────────────────────────────

TEST(Catalog, ListsEveryIndicatorOnce) {
    const auto& list = catalog::entries();
    EXPECT_EQ(list.size(), 28u);

    std::set<std::string_view> names;
    for (const auto& e : list) {
        EXPECT_TRUE(names.insert(e.name).second) << e.name;
        EXPECT_FALSE(e.description.empty()) << e.name;
    }
}

TEST(Catalog, FindByName) {
    const auto* e = catalog::find("vidya");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->category, Category::Overlap);
    EXPECT_EQ(catalog::find("bbands")->category, Category::Volatility);
    EXPECT_EQ(catalog::find("nvi")->category, Category::Volume);
    EXPECT_EQ(catalog::find("dpo")->category, Category::Trend);
    EXPECT_EQ(catalog::find("smi")->category, Category::Momentum);
    EXPECT_EQ(catalog::find("macd"), nullptr);
}

// ─── compute ──────────────────────────────────────────────────────────────────

TEST_F(CatalogTest, EveryIndicatorRunsWithDefaults) {
    for (const auto& e : catalog::entries()) {
        const auto f = catalog::compute(e.name, data_);
        ASSERT_TRUE(f.has_value()) << e.name;
        EXPECT_EQ(f->category, e.category) << e.name;
        ASSERT_FALSE(f->columns.empty()) << e.name;
        EXPECT_EQ(f->rows(), data_.size()) << e.name;
    }
}

TEST_F(CatalogTest, StringParametersReachTheIndicator) {
    const auto f = catalog::compute("t3", data_, {{"length", "5"}});
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->name, "T3_5_0.7");
    ASSERT_EQ(f->columns.size(), 1u);

    const auto direct = t3(data_.close, {.length = 5});
    ASSERT_TRUE(direct.has_value());
    for (std::size_t i = 0; i < direct->size(); ++i) {
        if (is_null((*direct)[i])) {
            EXPECT_TRUE(is_null(f->columns[0][i]));
        } else {
            EXPECT_DOUBLE_EQ(f->columns[0][i], (*direct)[i]);
        }
    }
}

TEST_F(CatalogTest, OptionsKeysApply) {
    const auto f = catalog::compute("sma", data_, {{"length", "10"}, {"fillna", "0"}});
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->columns[0].null_count(), 0u);
    EXPECT_DOUBLE_EQ(f->columns[0][0], 0.0);
}

TEST_F(CatalogTest, EnumAndBoolValues) {
    const auto a = catalog::compute("atr", data_, {{"mamode", "ema"}, {"percent", "true"}});
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->name, "ATRe_14p");

    const auto b = catalog::compute("bbands", data_, {{"length", "20"}, {"std", "2.5"}});
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->name, "BBANDS_20_2.5");
    EXPECT_EQ(b->columns.size(), 5u);
}

TEST_F(CatalogTest, ChannelKeysReachTheIndicator) {
    const auto k = catalog::compute("kc", data_, {{"mamode", "sma"}, {"tr", "false"}});
    ASSERT_TRUE(k.has_value());
    EXPECT_EQ(k->name, "KCs_20_2");

    const auto t = catalog::compute("thermo", data_, {{"long", "3"}, {"short", "0.25"}});
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->name, "THERMO_20_3_0.25");

    const auto h = catalog::compute("hwc", data_, {{"channel_eval", "yes"}, {"na", "0.3"}});
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->columns.size(), 5u);

    const auto r = catalog::compute("rvi", data_, {{"thirds", "true"}});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->name, "RVIt_14");

    const auto a = catalog::compute("aberration", data_, {{"atr_length", "10"}});
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->name, "ABER_5_10");

    EXPECT_FALSE(catalog::compute("accbands", data_, {{"c", "wide"}}).has_value());
}

TEST_F(CatalogTest, UnknownNameIsNullopt) {
    EXPECT_FALSE(catalog::compute("macd", data_).has_value());
}

TEST_F(CatalogTest, UnparsableValueIsNullopt) {
    EXPECT_FALSE(catalog::compute("sma", data_, {{"length", "ten"}}).has_value());
    EXPECT_FALSE(catalog::compute("atr", data_, {{"mamode", "hma"}}).has_value());
    EXPECT_FALSE(catalog::compute("dpo", data_, {{"centered", "maybe"}}).has_value());
    EXPECT_FALSE(catalog::compute("sma", data_, {{"fill_method", "zero"}}).has_value());
}

TEST_F(CatalogTest, FillValueMustBeFinite) {
    EXPECT_FALSE(catalog::compute("sma", data_, {{"fillna", "nan"}}).has_value());
    EXPECT_FALSE(catalog::compute("sma", data_, {{"fillna", "inf"}}).has_value());
    EXPECT_FALSE(catalog::compute("sma", data_, {{"fillna", "-inf"}}).has_value());

    const auto filled = catalog::compute("sma", data_, {{"fillna", "-1.5"}});
    ASSERT_TRUE(filled.has_value());
    EXPECT_EQ(filled->columns[0].null_count(), 0u);
    EXPECT_DOUBLE_EQ(filled->columns[0][0], -1.5);
}

TEST_F(CatalogTest, UnrelatedKeysIgnored) {
    EXPECT_TRUE(catalog::compute("roc", data_, {{"colour", "red"}}).has_value());
}

TEST_F(CatalogTest, TooShortInputIsNullopt) {
    const auto tiny = sample::random_walk(3);
    EXPECT_FALSE(catalog::compute("bbands", tiny).has_value());
}

// ─── parse_assignment ─────────────────────────────────────────────────────────

TEST(ParseAssignment, SplitsOnFirstEquals) {
    const auto kv = catalog::parse_assignment("fill_method=ffill");
    ASSERT_TRUE(kv.has_value());
    EXPECT_EQ(kv->first, "fill_method");
    EXPECT_EQ(kv->second, "ffill");

    const auto eq = catalog::parse_assignment("a=b=c");
    ASSERT_TRUE(eq.has_value());
    EXPECT_EQ(eq->second, "b=c");
}

TEST(ParseAssignment, RejectsMissingKeyOrEquals) {
    EXPECT_FALSE(catalog::parse_assignment("length").has_value());
    EXPECT_FALSE(catalog::parse_assignment("=5").has_value());
}
