/// @file src/momentum/tsi_smi.cpp
/// @brief True Strength Index and the SMI Ergodic indicator built on it.

#include "tai/log.hpp"
#include "tai/momentum.hpp"
#include "tai/series.hpp"
#include "tai/window.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace tai {

namespace {

struct TsiColumns {
    std::vector<double> tsi;
    std::vector<double> signal;
};

/// scalar · EMA_fast(EMA_slow(Δ)) / EMA_fast(EMA_slow(|Δ|)), plus its EMA.
TsiColumns tsi_columns(std::span<const double> close, int fast, int slow,
                       int signal, double scalar, int drift,
                       const Options& opts) noexcept {
    const std::vector<double> d = diff(close, drift);
    std::vector<double> abs_d(d.size(), NaN);
    std::transform(d.begin(), d.end(), abs_d.begin(),
                   [](double v) { return std::abs(v); });

    const auto smooth = [&](std::span<const double> x) {
        const std::vector<double> s = ema_values(x, slow, opts.presma, opts.adjust);
        return ema_values(s, fast, opts.presma, opts.adjust);
    };
    const std::vector<double> num = smooth(d);
    const std::vector<double> den = smooth(abs_d);

    TsiColumns out;
    out.tsi.assign(close.size(), NaN);
    for (std::size_t i = 0; i < close.size(); ++i) {
        out.tsi[i] = scalar * num[i] / den[i];
    }
    out.signal = ema_values(out.tsi, signal, opts.presma, opts.adjust);
    return out;
}

} // namespace

// ─── tsi ──────────────────────────────────────────────────────────────────────

std::optional<Frame>
tsi(std::span<const double> close, TsiParams params, const Options& opts) noexcept {
    const int    fast   = positive_or(params.fast, constants::TSI_FAST);
    const int    slow   = positive_or(params.slow, constants::TSI_SLOW);
    const int    signal = positive_or(params.signal, constants::TSI_SIGNAL);
    const double scalar = positive_or(params.scalar, constants::TSI_SCALAR);
    const int    drift  = get_drift(params.drift);
    if (!verify_series(close, std::max({fast, slow, signal}))) {
        log::debug("tsi: need {} values, got {}",
                   std::max({fast, slow, signal}), close.size());
        return std::nullopt;
    }

    TsiColumns cols = tsi_columns(close, fast, slow, signal, scalar, drift, opts);
    const std::string props = fmt::format("_{}_{}_{}", fast, slow, signal);

    Frame frame{.name = "TSI" + props, .category = Category::Momentum, .columns = {}};
    frame.columns.push_back(make_series("TSI" + props, Category::Momentum,
                                        std::move(cols.tsi), opts));
    frame.columns.push_back(make_series("TSIs" + props, Category::Momentum,
                                        std::move(cols.signal), opts));
    return frame;
}

// ─── smi ──────────────────────────────────────────────────────────────────────

std::optional<Frame>
smi(std::span<const double> close, SmiParams params, const Options& opts) noexcept {
    int          fast   = positive_or(params.fast, constants::SMI_FAST);
    int          slow   = positive_or(params.slow, constants::SMI_SLOW);
    const int    signal = positive_or(params.signal, constants::SMI_SIGNAL);
    const double scalar = positive_or(params.scalar, constants::SMI_SCALAR);
    if (slow < fast) std::swap(fast, slow);
    if (!verify_series(close, std::max({fast, slow, signal}))) {
        log::debug("smi: need {} values, got {}",
                   std::max({fast, slow, signal}), close.size());
        return std::nullopt;
    }

    TsiColumns cols = tsi_columns(close, fast, slow, signal, scalar,
                                  constants::DRIFT, opts);
    std::vector<double> osc(close.size(), NaN);
    for (std::size_t i = 0; i < osc.size(); ++i) {
        osc[i] = cols.tsi[i] - cols.signal[i];
    }

    std::string props = fmt::format("_{}_{}_{}", fast, slow, signal);
    if (scalar != 1.0) props += "_" + format_param(scalar);

    Frame frame{.name = "SMI" + props, .category = Category::Momentum, .columns = {}};
    frame.columns.push_back(make_series("SMI" + props, Category::Momentum,
                                        std::move(cols.tsi), opts));
    frame.columns.push_back(make_series("SMIs" + props, Category::Momentum,
                                        std::move(cols.signal), opts));
    frame.columns.push_back(make_series("SMIo" + props, Category::Momentum,
                                        std::move(osc), opts));
    return frame;
}

} // namespace tai
