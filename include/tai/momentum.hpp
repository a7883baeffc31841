#pragma once

/// @file include/tai/momentum.hpp
/// @brief Momentum indicators: oscillators measuring the speed of price change.
///
/// # Module: Momentum
///
/// | Function | Output                          | Minimum length     |
/// |----------|---------------------------------|--------------------|
/// | cmo      | CMO_{n}                         | n                  |
/// | roc      | ROC_{n}                         | n                  |
/// | tsi      | TSI_{f}_{s}_{g}, TSIs_…         | max(f, s, g)       |
/// | smi      | SMI_…, SMIs_…, SMIo_…           | max(f, s, g)       |
/// | pgo      | PGO_{n}                         | n (high/low/close) |

#include "tai/constants.hpp"
#include "tai/options.hpp"
#include "tai/types.hpp"

#include <optional>
#include <span>

namespace tai {

struct CmoParams {
    int    length = constants::CMO_LENGTH;
    double scalar = constants::CMO_SCALAR;
    int    drift  = constants::DRIFT;
};

struct RocParams {
    int    length = constants::ROC_LENGTH;
    double scalar = constants::ROC_SCALAR;
};

struct TsiParams {
    int    fast   = constants::TSI_FAST;
    int    slow   = constants::TSI_SLOW;
    int    signal = constants::TSI_SIGNAL;
    double scalar = constants::TSI_SCALAR;
    int    drift  = constants::DRIFT;
};

struct SmiParams {
    int    fast   = constants::SMI_FAST;
    int    slow   = constants::SMI_SLOW;
    int    signal = constants::SMI_SIGNAL;
    double scalar = constants::SMI_SCALAR;
};

struct PgoParams {
    int length = constants::PGO_LENGTH;
};

/// Chande Momentum Oscillator.
///
/// # Formula
///   CMO = scalar · (P − N) / (P + N)
/// where P and N aggregate the positive and negative drift-differences over
/// `length` bars: Wilder-smoothed when `opts.talib` is set (TA-Lib's
/// definition; TA_CMO itself is used when the backend is available),
/// rolling sums otherwise.
[[nodiscard]] std::optional<Series>
cmo(std::span<const double> close, CmoParams params = {},
    const Options& opts = {}) noexcept;

/// Rate of Change: scalar · (x − x[−n]) / x[−n]. TA-Lib path: TA_ROC.
[[nodiscard]] std::optional<Series>
roc(std::span<const double> close, RocParams params = {},
    const Options& opts = {}) noexcept;

/// True Strength Index and its signal line.
///
/// # Formula
///   d   = close − close[−drift]
///   TSI = scalar · EMA_f(EMA_s(d)) / EMA_f(EMA_s(|d|))
///   signal = EMA_g(TSI)
[[nodiscard]] std::optional<Frame>
tsi(std::span<const double> close, TsiParams params = {},
    const Options& opts = {}) noexcept;

/// SMI Ergodic Indicator: TSI, its signal line, and the oscillator
/// (TSI − signal). `fast` and `slow` are swapped when slow < fast.
[[nodiscard]] std::optional<Frame>
smi(std::span<const double> close, SmiParams params = {},
    const Options& opts = {}) noexcept;

/// Pretty Good Oscillator: distance of close from its SMA in units of an
/// EMA-smoothed ATR.
[[nodiscard]] std::optional<Series>
pgo(std::span<const double> high, std::span<const double> low,
    std::span<const double> close, PgoParams params = {},
    const Options& opts = {}) noexcept;

} // namespace tai
