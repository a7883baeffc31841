#pragma once

/// @file include/tai/trend.hpp
/// @brief Trend indicators.

#include "tai/constants.hpp"
#include "tai/options.hpp"
#include "tai/types.hpp"

#include <optional>
#include <span>

namespace tai {

struct DpoParams {
    int  length   = constants::DPO_LENGTH;
    bool centered = true;  ///< Compare close with the SMA t bars ahead
};

/// Detrend Price Oscillator.
///
/// With t = ⌊n/2⌋ + 1:
///   centered:     DPO[i] = close[i] − SMA[i + t]   (uses future bars)
///   non-centered: DPO[i] = close[i] − SMA[i − t]
///
/// `opts.lookahead == false` forces the non-centered form.
[[nodiscard]] std::optional<Series>
dpo(std::span<const double> close, DpoParams params = {},
    const Options& opts = {}) noexcept;

} // namespace tai
