#pragma once

/// @file include/tai/overlap.hpp
/// @brief Overlap indicators: moving averages drawn on the price scale.
///
/// # Module: Overlap
///
/// | Function | Label            | Minimum length |
/// |----------|------------------|----------------|
/// | sma      | SMA_{n}          | n              |
/// | ema      | EMA_{n}          | n              |
/// | rma      | RMA_{n}          | n              |
/// | fwma     | FWMA_{n}         | n              |
/// | t3       | T3_{n}_{a}       | n              |
/// | vidya    | VIDYA_{n}        | n              |
///
/// ## Guarantees
/// - `nullopt` when `close` is empty or shorter than the minimum length
/// - Otherwise a Series of len(close) tagged Category::Overlap
/// - Non-positive parameters fall back to constants.hpp defaults

#include "tai/constants.hpp"
#include "tai/options.hpp"
#include "tai/types.hpp"

#include <optional>
#include <span>

namespace tai {

struct SmaParams {
    int length = constants::SMA_LENGTH;
};

struct EmaParams {
    int length = constants::EMA_LENGTH;
};

struct RmaParams {
    int length = constants::RMA_LENGTH;
};

struct FwmaParams {
    int  length = constants::FWMA_LENGTH;
    bool asc    = true;  ///< Heaviest Fibonacci weight on the most recent value
};

struct T3Params {
    int    length = constants::T3_LENGTH;
    double a      = constants::T3_A;  ///< Volume factor, 0 < a < 1
};

struct VidyaParams {
    int length = constants::VIDYA_LENGTH;
    int drift  = constants::DRIFT;
};

/// Simple Moving Average. TA-Lib path: TA_SMA.
[[nodiscard]] std::optional<Series>
sma(std::span<const double> close, SmaParams params = {},
    const Options& opts = {}) noexcept;

/// Exponential Moving Average, α = 2/(n+1). Seed controlled by
/// `opts.presma`, weighting by `opts.adjust`. TA-Lib path: TA_EMA.
[[nodiscard]] std::optional<Series>
ema(std::span<const double> close, EmaParams params = {},
    const Options& opts = {}) noexcept;

/// Wilder's Moving Average, α = 1/n.
[[nodiscard]] std::optional<Series>
rma(std::span<const double> close, RmaParams params = {},
    const Options& opts = {}) noexcept;

/// Fibonacci's Weighted Moving Average.
[[nodiscard]] std::optional<Series>
fwma(std::span<const double> close, FwmaParams params = {},
     const Options& opts = {}) noexcept;

/// Tim Tillson's T3: six chained EMAs combined with polynomial coefficients
/// in `a`. TA-Lib path: TA_T3.
///
/// # Formula
///   c1 = −a³, c2 = 3a² + 3a³, c3 = −6a² − 3a − 3a³, c4 = a³ + 3a² + 3a + 1
///   T3 = c1·e6 + c2·e5 + c3·e4 + c4·e3
[[nodiscard]] std::optional<Series>
t3(std::span<const double> close, T3Params params = {},
   const Options& opts = {}) noexcept;

/// Variable Index Dynamic Average: an EMA whose smoothing factor is scaled by
/// |CMO| (see recurrence.hpp). The scan starts at `length`; a drift above 1
/// leaves the oscillator null there, which nulls the whole result.
[[nodiscard]] std::optional<Series>
vidya(std::span<const double> close, VidyaParams params = {},
      const Options& opts = {}) noexcept;

} // namespace tai
