/// @file src/momentum/pgo.cpp
/// @brief Pretty Good Oscillator.

#include "tai/log.hpp"
#include "tai/momentum.hpp"
#include "tai/series.hpp"
#include "tai/volatility.hpp"
#include "tai/window.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace tai {

std::optional<Series>
pgo(std::span<const double> high, std::span<const double> low,
    std::span<const double> close, PgoParams params, const Options& opts) noexcept {
    const int length = positive_or(params.length, constants::PGO_LENGTH);
    if (!verify_series(high, length) || !verify_series(low, length) ||
        !verify_series(close, length)) {
        log::debug("pgo: need {} values for high, low and close", length);
        return std::nullopt;
    }

    // Intermediate ATR without offset or fill.
    Options inner;
    inner.talib  = opts.talib;
    inner.presma = opts.presma;
    const auto range = atr(high, low, close, AtrParams{.length = length}, inner);
    if (!range) {
        return std::nullopt;
    }

    const std::vector<double> mean = sma_values(close, length);
    const std::vector<double> scale = ema_values(range->values, length,
                                                 opts.presma, opts.adjust);

    const std::size_t n = std::min({close.size(), mean.size(), scale.size()});
    std::vector<double> values(close.size(), NaN);
    for (std::size_t i = 0; i < n; ++i) {
        values[i] = (close[i] - mean[i]) / scale[i];
    }

    return make_series(fmt::format("PGO_{}", length), Category::Momentum,
                       std::move(values), opts);
}

} // namespace tai
