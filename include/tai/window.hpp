#pragma once

/// @file include/tai/window.hpp
/// @brief Windowed Transform Library: the stateless rolling and exponential
///        transforms nearly every indicator is built from.
///
/// # Module: Window
///
/// ## Formulas
///   rolling_sum[i]  = Σ x[i−n+1 .. i]                (needs n non-null values)
///   rolling_mean[i] = rolling_sum[i] / n
///   ewm (adjust=false):  y[i] = (1−α)·y[i−1] + α·x[i]
///   ewm (adjust=true):   y[i] = Σ w_j x[i−j] / Σ w_j,   w_j = (1−α)^j
///   rolling_weighted[i] = Σ w_j x[i−n+1+j] / Σ w_j     (w oldest-first)
///
/// ## Edge Cases
/// - n ≤ 0 or n > len(x): all-null output of len(x)
/// - Leading nulls are skipped by the exponential transforms; the first
///   output appears once enough non-null observations have been seen
/// - A rolling window of all-zero non-negative terms sums to exactly 0
///
/// ## Guarantees
/// - Output length always equals input length
/// - No function reads outside the input or mutates it

#include <span>
#include <vector>

namespace tai {

// ─── Rolling window ──────────────────────────────────────────────────────────

[[nodiscard]] std::vector<double> rolling_sum(std::span<const double> x,
                                              int n) noexcept;

[[nodiscard]] std::vector<double> rolling_mean(std::span<const double> x,
                                               int n) noexcept;

[[nodiscard]] std::vector<double> rolling_min(std::span<const double> x,
                                              int n) noexcept;

[[nodiscard]] std::vector<double> rolling_max(std::span<const double> x,
                                              int n) noexcept;

/// Rolling standard deviation with `ddof` delta degrees of freedom
/// (0 = population, 1 = sample).
[[nodiscard]] std::vector<double> rolling_stdev(std::span<const double> x,
                                                int n,
                                                int ddof = 0) noexcept;

/// Fixed-weight rolling combination. `weights` are applied oldest-first and
/// the dot product is divided by their sum.
[[nodiscard]] std::vector<double> rolling_weighted(std::span<const double> x,
                                                   std::span<const double> weights) noexcept;

// ─── Exponential smoothing ───────────────────────────────────────────────────

/// Exponentially weighted mean with smoothing factor `alpha` ∈ (0, 1].
/// Emits null until `min_periods` non-null observations have been seen.
[[nodiscard]] std::vector<double> ewm_mean(std::span<const double> x,
                                           double alpha,
                                           bool adjust,
                                           int min_periods = 0) noexcept;

/// Simple moving average over `n`.
[[nodiscard]] std::vector<double> sma_values(std::span<const double> x,
                                             int n) noexcept;

/// Exponential moving average, α = 2/(n+1).
///
/// With `presma` the recursion is seeded by the mean of the first `n`
/// non-null observations, placed on the n-th of them; every earlier position
/// is null. Without it the recursion starts at the first observation.
/// Chained passes therefore each add n−1 warm-up positions when `presma` is
/// set.
[[nodiscard]] std::vector<double> ema_values(std::span<const double> x,
                                             int n,
                                             bool presma = true,
                                             bool adjust = false) noexcept;

/// Wilder's moving average: ewm_mean(x, 1/n, adjust=true, min_periods=n).
[[nodiscard]] std::vector<double> rma_values(std::span<const double> x,
                                             int n) noexcept;

/// Wilder smoothing seeded by the simple mean of the first `n` non-null
/// values (the TA-Lib ATR form).
[[nodiscard]] std::vector<double> wilder_values(std::span<const double> x,
                                                int n) noexcept;

// ─── Weights ─────────────────────────────────────────────────────────────────

/// First `n` Fibonacci numbers starting 1, 1, 2, 3, ...; normalised to sum 1
/// when `weighted`. n ≤ 0 gives an empty vector.
[[nodiscard]] std::vector<double> fibonacci(int n, bool weighted = false) noexcept;

} // namespace tai
