#pragma once

/// @file include/tai/recurrence.hpp
/// @brief Recurrence Evaluator: the one order-dependent scan in the library.
///
/// # Module: Recurrence
///
/// ## Formula
/// For i ≥ start:
///   out[i] = α · k[i] · x[i] + out[i−1] · (1 − α · k[i])
/// with out[start−1] = 0 as the seed.
///
/// `k` is a per-position efficiency in [0, 1] (VIDYA passes |CMO|), so the
/// effective smoothing factor α·k shrinks in quiet markets and grows in
/// trending ones.
///
/// ## Edge Cases
/// - start ≤ 0 is treated as 1 (the seed needs a preceding cell)
/// - start ≥ len(x): nothing is computed; the output is all null
/// - A null k[i] or x[i] poisons out[i] and, through the carry, every later
///   position. The scan is never restarted.
/// - A computed value of exactly 0 stays 0. Whether a cell was computed is
///   tracked explicitly, not inferred from its value.
///
/// ## Guarantees
/// - Single forward pass, O(n), preallocated output
/// - Deterministic: identical inputs give bit-identical outputs

#include <span>
#include <vector>

namespace tai {

/// Run the adaptive smoothing recurrence. `x` and `k` must have equal length;
/// otherwise the output is all null of len(x).
[[nodiscard]] std::vector<double> adaptive_smooth(std::span<const double> x,
                                                  std::span<const double> k,
                                                  double alpha,
                                                  int start) noexcept;

} // namespace tai
