/// @file src/volatility/range.cpp
/// @brief True Range, ATR, NATR and Price Distance.

#include "tai/log.hpp"
#include "tai/series.hpp"
#include "tai/talib.hpp"
#include "tai/volatility.hpp"
#include "tai/window.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>
#include <utility>

namespace tai {

// ─── MaMode ───────────────────────────────────────────────────────────────────

std::optional<MaMode> parse_ma_mode(std::string_view name) noexcept {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "rma") return MaMode::Rma;
    if (lower == "ema") return MaMode::Ema;
    if (lower == "sma") return MaMode::Sma;
    return std::nullopt;
}

const char* to_string(MaMode mode) noexcept {
    switch (mode) {
        case MaMode::Rma: return "rma";
        case MaMode::Ema: return "ema";
        case MaMode::Sma: return "sma";
    }
    return "rma";
}

namespace {

[[nodiscard]] bool verify_hlc(std::span<const double> high,
                              std::span<const double> low,
                              std::span<const double> close,
                              int length) noexcept {
    return verify_series(high, length) && verify_series(low, length) &&
           verify_series(close, length) &&
           high.size() == close.size() && low.size() == close.size();
}

std::vector<double> true_range_values(std::span<const double> high,
                                      std::span<const double> low,
                                      std::span<const double> close,
                                      int drift) noexcept {
    const std::vector<double> hl = non_zero_range(high, low);
    const std::vector<double> prev = shift(close, drift);

    std::vector<double> out(close.size(), NaN);
    for (std::size_t i = static_cast<std::size_t>(drift); i < close.size(); ++i) {
        out[i] = std::max({std::abs(hl[i]),
                           std::abs(high[i] - prev[i]),
                           std::abs(prev[i] - low[i])});
        if (is_null(hl[i]) || is_null(prev[i])) out[i] = NaN;
    }
    return out;
}

} // namespace

// Rma with presma is Wilder's recursion seeded on the SMA of the first
// `length` values, which is what TA_ATR computes.
std::vector<double> ma_values(std::span<const double> x, int length,
                              MaMode mode, const Options& opts) noexcept {
    switch (mode) {
        case MaMode::Ema: return ema_values(x, length, opts.presma, opts.adjust);
        case MaMode::Sma: return sma_values(x, length);
        case MaMode::Rma: break;
    }
    return opts.presma ? wilder_values(x, length) : rma_values(x, length);
}

// ─── true_range ───────────────────────────────────────────────────────────────

std::optional<Series>
true_range(std::span<const double> high, std::span<const double> low,
           std::span<const double> close, TrueRangeParams params,
           const Options& opts) noexcept {
    const int drift = get_drift(params.drift);
    if (!verify_hlc(high, low, close, drift)) {
        log::debug("true_range: high, low and close must be aligned and longer than {}",
                   drift);
        return std::nullopt;
    }

    std::optional<std::vector<double>> values;
    if (opts.talib && drift == 1) {
        values = talib::trange(high, low, close);
    }
    if (!values) {
        values = true_range_values(high, low, close, drift);
    }

    return make_series(fmt::format("TRUERANGE_{}", drift), Category::Volatility,
                       std::move(*values), opts);
}

// ─── atr ──────────────────────────────────────────────────────────────────────

std::optional<Series>
atr(std::span<const double> high, std::span<const double> low,
    std::span<const double> close, AtrParams params, const Options& opts) noexcept {
    const int length = positive_or(params.length, constants::ATR_LENGTH);
    const int drift  = get_drift(params.drift);
    if (!verify_hlc(high, low, close, length)) {
        log::debug("atr: need {} aligned values for high, low and close", length);
        return std::nullopt;
    }

    std::optional<std::vector<double>> values;
    if (opts.talib && params.mamode == MaMode::Rma && drift == 1) {
        values = talib::atr(high, low, close, length);
    }
    if (!values) {
        const std::vector<double> tr = true_range_values(high, low, close, drift);
        values = ma_values(tr, length, params.mamode, opts);
    }

    if (params.percent) {
        for (std::size_t i = 0; i < values->size(); ++i) {
            (*values)[i] *= 100.0 / close[i];
        }
    }

    return make_series(fmt::format("ATR{}_{}{}", to_string(params.mamode)[0], length,
                                   params.percent ? "p" : ""),
                       Category::Volatility, std::move(*values), opts);
}

// ─── natr ─────────────────────────────────────────────────────────────────────

std::optional<Series>
natr(std::span<const double> high, std::span<const double> low,
     std::span<const double> close, NatrParams params, const Options& opts) noexcept {
    const int    length = positive_or(params.length, constants::NATR_LENGTH);
    const double scalar = positive_or(params.scalar, constants::NATR_SCALAR);
    const int    drift  = get_drift(params.drift);
    if (!verify_hlc(high, low, close, length)) {
        log::debug("natr: need {} aligned values for high, low and close", length);
        return std::nullopt;
    }

    std::string name = fmt::format("NATR_{}", length);

    // TA_NATR smooths with Wilder; other modes stay on the bundled path.
    if (opts.talib && params.mamode == MaMode::Rma && drift == 1) {
        if (auto values = talib::natr(high, low, close, length)) {
            if (scalar != 100.0) {
                for (double& v : *values) v *= scalar / 100.0;
            }
            return make_series(std::move(name), Category::Volatility,
                               std::move(*values), opts);
        }
    }

    const std::vector<double> tr = true_range_values(high, low, close, drift);
    std::vector<double> values = ma_values(tr, length, params.mamode, opts);
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] *= scalar / close[i];
    }

    return make_series(std::move(name), Category::Volatility, std::move(values), opts);
}

// ─── pdist ────────────────────────────────────────────────────────────────────

std::optional<Series>
pdist(std::span<const double> open, std::span<const double> high,
      std::span<const double> low, std::span<const double> close,
      PdistParams params, const Options& opts) noexcept {
    const int drift = get_drift(params.drift);
    if (!verify_hlc(high, low, close, 1) || open.size() != close.size()) {
        log::debug("pdist: open, high, low and close must be non-empty and aligned");
        return std::nullopt;
    }

    const std::vector<double> hl  = non_zero_range(high, low);
    const std::vector<double> gap = non_zero_range(open, shift(close, drift));
    const std::vector<double> oc  = non_zero_range(close, open);

    std::vector<double> values(close.size(), NaN);
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = 2.0 * hl[i] + std::abs(gap[i]) - std::abs(oc[i]);
    }

    return make_series("PDIST", Category::Volatility, std::move(values), opts);
}

} // namespace tai
