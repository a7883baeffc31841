/// @file src/volatility/channels.cpp
/// @brief Aberration, Acceleration Bands, Keltner and Holt-Winters channels.

#include "tai/log.hpp"
#include "tai/series.hpp"
#include "tai/volatility.hpp"
#include "tai/window.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace tai {

namespace {

[[nodiscard]] bool aligned_hlc(std::span<const double> high,
                               std::span<const double> low,
                               std::span<const double> close,
                               int length) noexcept {
    return verify_series(high, length) && verify_series(low, length) &&
           verify_series(close, length) &&
           high.size() == close.size() && low.size() == close.size();
}

/// `opts` without offset and fill, for an indicator computed as an input to
/// another one.
[[nodiscard]] Options formula_only(const Options& opts) noexcept {
    Options inner = opts;
    inner.offset = 0;
    inner.fillna.reset();
    inner.fill_method.reset();
    return inner;
}

[[nodiscard]] double weight_or(double value, double fallback) noexcept {
    return (std::isfinite(value) && value > 0.0 && value <= 1.0) ? value : fallback;
}

Frame band_frame(std::string name) {
    return Frame{.name = std::move(name), .category = Category::Volatility, .columns = {}};
}

} // namespace

// ─── aberration ───────────────────────────────────────────────────────────────

std::optional<Frame>
aberration(std::span<const double> high, std::span<const double> low,
           std::span<const double> close, AberrationParams params,
           const Options& opts) noexcept {
    const int length     = positive_or(params.length, constants::ABERRATION_LENGTH);
    const int atr_length = positive_or(params.atr_length, constants::ABERRATION_ATR_LENGTH);
    if (!aligned_hlc(high, low, close, std::max(length, atr_length))) {
        log::debug("aberration: need {} aligned values for high, low and close",
                   std::max(length, atr_length));
        return std::nullopt;
    }

    auto range = atr(high, low, close, {.length = atr_length}, formula_only(opts));
    if (!range) return std::nullopt;

    std::vector<double> typical(close.size(), NaN);
    for (std::size_t i = 0; i < close.size(); ++i) {
        typical[i] = (high[i] + low[i] + close[i]) / 3.0;
    }
    std::vector<double> zg = sma_values(typical, length);

    std::vector<double> sg(close.size(), NaN);
    std::vector<double> xg(close.size(), NaN);
    for (std::size_t i = 0; i < close.size(); ++i) {
        sg[i] = zg[i] + (*range)[i];
        xg[i] = zg[i] - (*range)[i];
    }

    const std::string props = fmt::format("_{}_{}", length, atr_length);
    Frame frame = band_frame("ABER" + props);
    frame.columns.push_back(make_series("ABER_ZG" + props, Category::Volatility, std::move(zg), opts));
    frame.columns.push_back(make_series("ABER_SG" + props, Category::Volatility, std::move(sg), opts));
    frame.columns.push_back(make_series("ABER_XG" + props, Category::Volatility, std::move(xg), opts));
    frame.columns.push_back(make_series("ABER_ATR" + props, Category::Volatility,
                                        std::move(range->values), opts));
    return frame;
}

// ─── accbands ─────────────────────────────────────────────────────────────────

std::optional<Frame>
accbands(std::span<const double> high, std::span<const double> low,
         std::span<const double> close, AccbandsParams params,
         const Options& opts) noexcept {
    const int    length = positive_or(params.length, constants::ACCBANDS_LENGTH);
    const double c      = positive_or(params.c, constants::ACCBANDS_C);
    if (!aligned_hlc(high, low, close, length)) {
        log::debug("accbands: need {} aligned values for high, low and close", length);
        return std::nullopt;
    }

    const std::vector<double> hl = non_zero_range(high, low);
    std::vector<double> low_leg(close.size(), NaN);
    std::vector<double> high_leg(close.size(), NaN);
    for (std::size_t i = 0; i < close.size(); ++i) {
        const double r = c * hl[i] / (high[i] + low[i]);
        low_leg[i]  = low[i] * (1.0 - r);
        high_leg[i] = high[i] * (1.0 + r);
    }

    const std::string props = fmt::format("_{}", length);
    Frame frame = band_frame("ACCBANDS" + props);
    frame.columns.push_back(make_series("ACCBL" + props, Category::Volatility,
                                        ma_values(low_leg, length, params.mamode, opts), opts));
    frame.columns.push_back(make_series("ACCBM" + props, Category::Volatility,
                                        ma_values(close, length, params.mamode, opts), opts));
    frame.columns.push_back(make_series("ACCBU" + props, Category::Volatility,
                                        ma_values(high_leg, length, params.mamode, opts), opts));
    return frame;
}

// ─── kc ───────────────────────────────────────────────────────────────────────

std::optional<Frame>
kc(std::span<const double> high, std::span<const double> low,
   std::span<const double> close, KcParams params, const Options& opts) noexcept {
    const int    length = positive_or(params.length, constants::KC_LENGTH);
    const double scalar = positive_or(params.scalar, constants::KC_SCALAR);
    if (!aligned_hlc(high, low, close, length)) {
        log::debug("kc: need {} aligned values for high, low and close", length);
        return std::nullopt;
    }

    std::vector<double> range;
    if (params.tr) {
        auto tr = true_range(high, low, close, {}, formula_only(opts));
        if (!tr) return std::nullopt;
        range = std::move(tr->values);
    } else {
        range = non_zero_range(high, low);
    }

    std::vector<double> basis = ma_values(close, length, params.mamode, opts);
    const std::vector<double> band = ma_values(range, length, params.mamode, opts);

    std::vector<double> lower(close.size(), NaN);
    std::vector<double> upper(close.size(), NaN);
    for (std::size_t i = 0; i < close.size(); ++i) {
        lower[i] = basis[i] - scalar * band[i];
        upper[i] = basis[i] + scalar * band[i];
    }

    const std::string props =
        fmt::format("{}_{}_{}", to_string(params.mamode)[0], length, scalar);
    Frame frame = band_frame("KC" + props);
    frame.columns.push_back(make_series("KCL" + props, Category::Volatility, std::move(lower), opts));
    frame.columns.push_back(make_series("KCB" + props, Category::Volatility, std::move(basis), opts));
    frame.columns.push_back(make_series("KCU" + props, Category::Volatility, std::move(upper), opts));
    return frame;
}

// ─── hwc ──────────────────────────────────────────────────────────────────────

std::optional<Frame>
hwc(std::span<const double> close, HwcParams params, const Options& opts) noexcept {
    const double na     = weight_or(params.na, constants::HWC_NA);
    const double nb     = weight_or(params.nb, constants::HWC_NB);
    const double nc     = weight_or(params.nc, constants::HWC_NC);
    const double nd     = weight_or(params.nd, constants::HWC_ND);
    const double scalar = positive_or(params.scalar, constants::HWC_SCALAR);
    if (!verify_series(close, 1)) {
        log::debug("hwc: close is empty");
        return std::nullopt;
    }

    const std::size_t m = close.size();
    std::vector<double> mid(m, NaN), upper(m, NaN), lower(m, NaN);
    std::vector<double> width(m, NaN), position(m, NaN);

    double last_a = 0.0, last_v = 0.0, last_var = 0.0;
    double last_f = close[0], last_price = close[0], last_result = close[0];

    for (std::size_t i = 0; i < m; ++i) {
        const double f = (1.0 - na) * (last_f + last_v + 0.5 * last_a) + na * close[i];
        const double v = (1.0 - nb) * (last_v + last_a) + nb * (f - last_f);
        const double a = (1.0 - nc) * last_a + nc * (v - last_v);
        mid[i] = f + v + 0.5 * a;

        // The band at i uses the variance known before this bar.
        const double miss = last_price - last_result;
        const double var  = (1.0 - nd) * last_var + nd * miss * miss;
        const double dev  = scalar * std::sqrt(last_var);
        upper[i] = mid[i] + dev;
        lower[i] = mid[i] - dev;

        width[i] = upper[i] - lower[i];
        if (width[i] != 0.0) position[i] = (close[i] - lower[i]) / width[i];

        last_price  = close[i];
        last_a      = a;
        last_f      = f;
        last_v      = v;
        last_var    = var;
        last_result = mid[i];
    }

    const std::string props = fmt::format("_{}", scalar);
    Frame frame = band_frame("HWC" + props);
    frame.columns.push_back(make_series("HWM" + props, Category::Volatility, std::move(mid), opts));
    frame.columns.push_back(make_series("HWU" + props, Category::Volatility, std::move(upper), opts));
    frame.columns.push_back(make_series("HWL" + props, Category::Volatility, std::move(lower), opts));
    if (params.channel_eval) {
        frame.columns.push_back(make_series("HWW" + props, Category::Volatility, std::move(width), opts));
        frame.columns.push_back(make_series("HWPCT" + props, Category::Volatility,
                                            std::move(position), opts));
    }
    return frame;
}

} // namespace tai
