/// @file src/overlap/moving_average.cpp
/// @brief SMA, EMA, RMA and FWMA.

#include "tai/log.hpp"
#include "tai/overlap.hpp"
#include "tai/series.hpp"
#include "tai/talib.hpp"
#include "tai/window.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace tai {

// ─── sma ──────────────────────────────────────────────────────────────────────

std::optional<Series>
sma(std::span<const double> close, SmaParams params, const Options& opts) noexcept {
    const int length = positive_or(params.length, constants::SMA_LENGTH);
    if (!verify_series(close, length)) {
        log::debug("sma: need {} values, got {}", length, close.size());
        return std::nullopt;
    }

    std::optional<std::vector<double>> values;
    if (opts.talib) {
        values = talib::sma(close, length);
    }
    if (!values) {
        values = sma_values(close, length);
    }

    return make_series(fmt::format("SMA_{}", length), Category::Overlap,
                       std::move(*values), opts);
}

// ─── ema ──────────────────────────────────────────────────────────────────────

std::optional<Series>
ema(std::span<const double> close, EmaParams params, const Options& opts) noexcept {
    const int length = positive_or(params.length, constants::EMA_LENGTH);
    if (!verify_series(close, length)) {
        log::debug("ema: need {} values, got {}", length, close.size());
        return std::nullopt;
    }

    std::optional<std::vector<double>> values;
    if (opts.talib) {
        values = talib::ema(close, length);
    }
    if (!values) {
        values = ema_values(close, length, opts.presma, opts.adjust);
    }

    return make_series(fmt::format("EMA_{}", length), Category::Overlap,
                       std::move(*values), opts);
}

// ─── rma ──────────────────────────────────────────────────────────────────────

std::optional<Series>
rma(std::span<const double> close, RmaParams params, const Options& opts) noexcept {
    const int length = positive_or(params.length, constants::RMA_LENGTH);
    if (!verify_series(close, length)) {
        log::debug("rma: need {} values, got {}", length, close.size());
        return std::nullopt;
    }

    return make_series(fmt::format("RMA_{}", length), Category::Overlap,
                       rma_values(close, length), opts);
}

// ─── fwma ─────────────────────────────────────────────────────────────────────

std::optional<Series>
fwma(std::span<const double> close, FwmaParams params, const Options& opts) noexcept {
    const int length = positive_or(params.length, constants::FWMA_LENGTH);
    if (!verify_series(close, length)) {
        log::debug("fwma: need {} values, got {}", length, close.size());
        return std::nullopt;
    }

    // Weights run oldest → newest, so ascending Fibonacci favours recent bars.
    std::vector<double> weights = fibonacci(length, true);
    if (!params.asc) {
        std::reverse(weights.begin(), weights.end());
    }

    return make_series(fmt::format("FWMA_{}", length), Category::Overlap,
                       rolling_weighted(close, weights), opts);
}

} // namespace tai
