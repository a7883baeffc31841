/// @file src/momentum/cmo_roc.cpp
/// @brief Chande Momentum Oscillator and Rate of Change.

#include "tai/log.hpp"
#include "tai/momentum.hpp"
#include "tai/series.hpp"
#include "tai/talib.hpp"
#include "tai/window.hpp"

#include <fmt/format.h>

#include <utility>

namespace tai {

namespace {

/// TA-Lib scales both oscillators by a fixed 100.
void rescale_from_percent(std::vector<double>& values, double scalar) noexcept {
    if (scalar == 100.0) return;
    for (double& v : values) v *= scalar / 100.0;
}

} // namespace

// ─── cmo ──────────────────────────────────────────────────────────────────────

std::optional<Series>
cmo(std::span<const double> close, CmoParams params, const Options& opts) noexcept {
    const int    length = positive_or(params.length, constants::CMO_LENGTH);
    const double scalar = positive_or(params.scalar, constants::CMO_SCALAR);
    const int    drift  = get_drift(params.drift);
    if (!verify_series(close, length)) {
        log::debug("cmo: need {} values, got {}", length, close.size());
        return std::nullopt;
    }

    std::string name = fmt::format("CMO_{}", length);

    if (opts.talib) {
        if (auto values = talib::cmo(close, length)) {
            rescale_from_percent(*values, scalar);
            return make_series(std::move(name), Category::Momentum,
                               std::move(*values), opts);
        }
        log::debug("cmo: TA-Lib unavailable, smoothing gains/losses with RMA");
    }

    const std::vector<double> mom = diff(close, drift);
    std::vector<double> gains(mom.size(), NaN);
    std::vector<double> losses(mom.size(), NaN);
    for (std::size_t i = 0; i < mom.size(); ++i) {
        if (is_null(mom[i])) continue;
        gains[i]  = mom[i] > 0.0 ?  mom[i] : 0.0;
        losses[i] = mom[i] < 0.0 ? -mom[i] : 0.0;
    }

    // talib=true without the library still follows TA-Lib's Wilder smoothing.
    const std::vector<double> up   = opts.talib ? rma_values(gains, length)
                                                : rolling_sum(gains, length);
    const std::vector<double> down = opts.talib ? rma_values(losses, length)
                                                : rolling_sum(losses, length);

    std::vector<double> values(close.size(), NaN);
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = scalar * (up[i] - down[i]) / (up[i] + down[i]);
    }

    return make_series(std::move(name), Category::Momentum, std::move(values), opts);
}

// ─── roc ──────────────────────────────────────────────────────────────────────

std::optional<Series>
roc(std::span<const double> close, RocParams params, const Options& opts) noexcept {
    const int    length = positive_or(params.length, constants::ROC_LENGTH);
    const double scalar = positive_or(params.scalar, constants::ROC_SCALAR);
    if (!verify_series(close, length)) {
        log::debug("roc: need {} values, got {}", length, close.size());
        return std::nullopt;
    }

    std::string name = fmt::format("ROC_{}", length);

    if (opts.talib) {
        if (auto values = talib::roc(close, length)) {
            rescale_from_percent(*values, scalar);
            return make_series(std::move(name), Category::Momentum,
                               std::move(*values), opts);
        }
    }

    const auto n = static_cast<std::size_t>(length);
    std::vector<double> values(close.size(), NaN);
    for (std::size_t i = n; i < close.size(); ++i) {
        values[i] = scalar * (close[i] - close[i - n]) / close[i - n];
    }

    return make_series(std::move(name), Category::Momentum, std::move(values), opts);
}

} // namespace tai
