/// @file src/volatility/dispersion.cpp
/// @brief Mass Index, Relative Volatility Index and Elder's Thermometer.

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

/// One-source RVI: the sample deviation carried on up moves, smoothed, over
/// the same carried on every move.
std::vector<double> rvi_values(std::span<const double> source, int length,
                               double scalar, MaMode mode, int drift,
                               const Options& opts) noexcept {
    const std::vector<double> sd   = rolling_stdev(source, length, 1);
    const std::vector<double> move = diff(source, drift);

    std::vector<double> up(source.size(), NaN);
    std::vector<double> down(source.size(), NaN);
    for (std::size_t i = 0; i < source.size(); ++i) {
        // An undefined move counts as neither up nor down.
        up[i]   = (move[i] > 0.0 ? 1.0 : 0.0) * sd[i];
        down[i] = (move[i] < 0.0 ? 1.0 : 0.0) * sd[i];
    }

    const std::vector<double> up_avg   = ma_values(up, length, mode, opts);
    const std::vector<double> down_avg = ma_values(down, length, mode, opts);

    std::vector<double> out(source.size(), NaN);
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = scalar * up_avg[i] / (up_avg[i] + down_avg[i]);
    }
    return out;
}

} // namespace

// ─── massi ────────────────────────────────────────────────────────────────────

std::optional<Series>
massi(std::span<const double> high, std::span<const double> low,
      MassiParams params, const Options& opts) noexcept {
    int fast = positive_or(params.fast, constants::MASSI_FAST);
    int slow = positive_or(params.slow, constants::MASSI_SLOW);
    if (slow < fast) std::swap(fast, slow);
    if (!verify_series(high, slow) || !verify_series(low, slow) ||
        high.size() != low.size()) {
        log::debug("massi: need {} aligned values for high and low", slow);
        return std::nullopt;
    }

    const std::vector<double> hl    = non_zero_range(high, low);
    const std::vector<double> once  = ema_values(hl, fast, opts.presma, opts.adjust);
    const std::vector<double> twice = ema_values(once, fast, opts.presma, opts.adjust);

    std::vector<double> ratio(hl.size(), NaN);
    for (std::size_t i = 0; i < ratio.size(); ++i) {
        ratio[i] = once[i] / twice[i];
    }

    return make_series(fmt::format("MASSI_{}_{}", fast, slow), Category::Volatility,
                       rolling_sum(ratio, slow), opts);
}

// ─── rvi ──────────────────────────────────────────────────────────────────────

std::optional<Series>
rvi(std::span<const double> close, std::span<const double> high,
    std::span<const double> low, RviParams params, const Options& opts) noexcept {
    const int    length = positive_or(params.length, constants::RVI_LENGTH);
    const double scalar = positive_or(params.scalar, constants::RVI_SCALAR);
    const int    drift  = get_drift(params.drift);
    if (!verify_series(close, length)) {
        log::debug("rvi: need {} values, got {}", length, close.size());
        return std::nullopt;
    }

    const bool needs_hl = params.refined || params.thirds;
    if (needs_hl && (high.size() != close.size() || low.size() != close.size())) {
        log::debug("rvi: refined and thirds need high and low aligned with close");
        return std::nullopt;
    }

    std::vector<double> values;
    const char* mode = "";
    if (needs_hl) {
        const auto hi = rvi_values(high, length, scalar, params.mamode, drift, opts);
        const auto lo = rvi_values(low, length, scalar, params.mamode, drift, opts);
        values.assign(close.size(), NaN);
        if (params.refined) {
            mode = "r";
            for (std::size_t i = 0; i < values.size(); ++i) {
                values[i] = 0.5 * (hi[i] + lo[i]);
            }
        } else {
            mode = "t";
            const auto cl = rvi_values(close, length, scalar, params.mamode, drift, opts);
            for (std::size_t i = 0; i < values.size(); ++i) {
                values[i] = (hi[i] + lo[i] + cl[i]) / 3.0;
            }
        }
    } else {
        values = rvi_values(close, length, scalar, params.mamode, drift, opts);
    }

    return make_series(fmt::format("RVI{}_{}", mode, length), Category::Volatility,
                       std::move(values), opts);
}

// ─── thermo ───────────────────────────────────────────────────────────────────

std::optional<Frame>
thermo(std::span<const double> high, std::span<const double> low,
       ThermoParams params, const Options& opts) noexcept {
    const int    length = positive_or(params.length, constants::THERMO_LENGTH);
    const double lf     = positive_or(params.long_factor, constants::THERMO_LONG);
    const double sf     = positive_or(params.short_factor, constants::THERMO_SHORT);
    const int    drift  = get_drift(params.drift);
    if (!verify_series(high, length) || !verify_series(low, length) ||
        high.size() != low.size()) {
        log::debug("thermo: need {} aligned values for high and low", length);
        return std::nullopt;
    }

    const std::vector<double> prev_high = shift(high, drift);
    const std::vector<double> prev_low  = shift(low, drift);

    std::vector<double> temp(high.size(), NaN);
    for (std::size_t i = 0; i < temp.size(); ++i) {
        if (is_null(prev_high[i]) || is_null(prev_low[i])) continue;
        temp[i] = std::max(std::abs(prev_low[i] - low[i]),
                           std::abs(high[i] - prev_high[i]));
    }
    std::vector<double> avg = ma_values(temp, length, params.mamode, opts);

    // Signals are 0 wherever the thermometer or its average is undefined.
    std::vector<double> go_long(temp.size(), 0.0);
    std::vector<double> go_short(temp.size(), 0.0);
    for (std::size_t i = 0; i < temp.size(); ++i) {
        if (temp[i] < avg[i] * lf) go_long[i] = 1.0;
        if (temp[i] > avg[i] * sf) go_short[i] = 1.0;
    }

    const std::string props = fmt::format("_{}_{}_{}", length, lf, sf);
    Frame frame{.name = "THERMO" + props, .category = Category::Volatility, .columns = {}};
    frame.columns.push_back(make_series("THERMO" + props, Category::Volatility, std::move(temp), opts));
    frame.columns.push_back(make_series("THERMOma" + props, Category::Volatility, std::move(avg), opts));
    frame.columns.push_back(make_series("THERMOl" + props, Category::Volatility, std::move(go_long), opts));
    frame.columns.push_back(make_series("THERMOs" + props, Category::Volatility, std::move(go_short), opts));
    return frame;
}

} // namespace tai
