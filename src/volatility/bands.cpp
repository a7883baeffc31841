/// @file src/volatility/bands.cpp
/// @brief Bollinger Bands, Donchian Channels and the Ulcer Index.

#include "tai/log.hpp"
#include "tai/series.hpp"
#include "tai/talib.hpp"
#include "tai/volatility.hpp"
#include "tai/window.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace tai {

// ─── bbands ───────────────────────────────────────────────────────────────────

std::optional<Frame>
bbands(std::span<const double> close, BbandsParams params, const Options& opts) noexcept {
    const int    length = positive_or(params.length, constants::BBANDS_LENGTH);
    const double width  = positive_or(params.stddev, constants::BBANDS_STD);
    const int    ddof   = (params.ddof >= 0 && params.ddof < length) ? params.ddof : 0;
    if (!verify_series(close, length)) {
        log::debug("bbands: need {} values, got {}", length, close.size());
        return std::nullopt;
    }

    std::vector<double> lower, mid, upper;

    // TA_BBANDS uses the population deviation around an SMA.
    if (opts.talib && params.mamode == MaMode::Sma && ddof == 0) {
        if (auto bands = talib::bbands(close, length, width)) {
            lower = std::move((*bands)[0]);
            mid   = std::move((*bands)[1]);
            upper = std::move((*bands)[2]);
        }
    }

    if (mid.empty()) {
        switch (params.mamode) {
            case MaMode::Sma: mid = sma_values(close, length); break;
            case MaMode::Ema: mid = ema_values(close, length, opts.presma, opts.adjust); break;
            case MaMode::Rma: mid = rma_values(close, length); break;
        }
        const std::vector<double> sd = rolling_stdev(close, length, ddof);
        lower.assign(close.size(), NaN);
        upper.assign(close.size(), NaN);
        for (std::size_t i = 0; i < close.size(); ++i) {
            lower[i] = mid[i] - width * sd[i];
            upper[i] = mid[i] + width * sd[i];
        }
    }

    const std::vector<double> spread = non_zero_range(upper, lower);
    const std::vector<double> above  = non_zero_range(close, lower);
    std::vector<double> bandwidth(close.size(), NaN);
    std::vector<double> percent(close.size(), NaN);
    for (std::size_t i = 0; i < close.size(); ++i) {
        bandwidth[i] = 100.0 * spread[i] / mid[i];
        percent[i]   = above[i] / spread[i];
    }

    const std::string props = fmt::format("_{}_{}", length, format_param(width));
    Frame frame{.name = "BBANDS" + props, .category = Category::Volatility, .columns = {}};
    frame.columns.push_back(make_series("BBL" + props, Category::Volatility, std::move(lower), opts));
    frame.columns.push_back(make_series("BBM" + props, Category::Volatility, std::move(mid), opts));
    frame.columns.push_back(make_series("BBU" + props, Category::Volatility, std::move(upper), opts));
    frame.columns.push_back(make_series("BBB" + props, Category::Volatility, std::move(bandwidth), opts));
    frame.columns.push_back(make_series("BBP" + props, Category::Volatility, std::move(percent), opts));
    return frame;
}

// ─── donchian ─────────────────────────────────────────────────────────────────

std::optional<Frame>
donchian(std::span<const double> high, std::span<const double> low,
         DonchianParams params, const Options& opts) noexcept {
    const int ll = positive_or(params.lower_length, constants::DONCHIAN_LENGTH);
    const int ul = positive_or(params.upper_length, constants::DONCHIAN_LENGTH);
    const int need = std::max(ll, ul);
    if (!verify_series(high, need) || !verify_series(low, need) ||
        high.size() != low.size()) {
        log::debug("donchian: need {} aligned values for high and low", need);
        return std::nullopt;
    }

    std::vector<double> lower = rolling_min(low, ll);
    std::vector<double> upper = rolling_max(high, ul);
    std::vector<double> mid(high.size(), NaN);
    for (std::size_t i = 0; i < mid.size(); ++i) {
        mid[i] = 0.5 * (lower[i] + upper[i]);
    }

    const std::string props = fmt::format("_{}_{}", ll, ul);
    Frame frame{.name = "DC" + props, .category = Category::Volatility, .columns = {}};
    frame.columns.push_back(make_series("DCL" + props, Category::Volatility, std::move(lower), opts));
    frame.columns.push_back(make_series("DCM" + props, Category::Volatility, std::move(mid), opts));
    frame.columns.push_back(make_series("DCU" + props, Category::Volatility, std::move(upper), opts));
    return frame;
}

// ─── ui ───────────────────────────────────────────────────────────────────────

std::optional<Series>
ui(std::span<const double> close, UiParams params, const Options& opts) noexcept {
    const int    length = positive_or(params.length, constants::UI_LENGTH);
    const double scalar = positive_or(params.scalar, constants::UI_SCALAR);
    if (!verify_series(close, length)) {
        log::debug("ui: need {} values, got {}", length, close.size());
        return std::nullopt;
    }

    // Squared percentage drawdown from the rolling high.
    const std::vector<double> highest = rolling_max(close, length);
    std::vector<double> d2(close.size(), NaN);
    for (std::size_t i = 0; i < close.size(); ++i) {
        const double down = scalar * (close[i] - highest[i]) / highest[i];
        d2[i] = down * down;
    }

    const std::vector<double> agg = params.everget ? sma_values(d2, length)
                                                   : rolling_sum(d2, length);
    std::vector<double> values(close.size(), NaN);
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = std::sqrt(agg[i] / static_cast<double>(length));
    }

    return make_series(fmt::format("UI{}_{}", params.everget ? "e" : "", length),
                       Category::Volatility, std::move(values), opts);
}

} // namespace tai
