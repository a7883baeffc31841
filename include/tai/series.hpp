#pragma once

/// @file include/tai/series.hpp
/// @brief Series utilities: validation, offset, fill, labelling, and the
///        elementwise helpers the indicators share.
///
/// # Module: Series Utilities
///
/// ## Responsibility
/// Everything an indicator does before and after its formula:
///   - validate inputs (present, long enough)
///   - normalise drift and offset arguments
///   - shift the raw result, then fill remaining nulls
///   - build the label string from the indicator name and parameters
///
/// ## Guarantees
/// - All functions are `noexcept` and allocate a fresh output
/// - Output length always equals input length
/// - Inputs are never mutated

#include "tai/options.hpp"
#include "tai/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace tai {

// ─── Validation / argument normalisation ─────────────────────────────────────

/// True when `x` is non-empty and holds at least `min_length` observations.
[[nodiscard]] bool verify_series(std::span<const double> x,
                                 int min_length) noexcept;

/// Differencing lag: `drift` if positive, else 1.
[[nodiscard]] int get_drift(int drift) noexcept;

/// Returns `value` if it is strictly positive, else `fallback`.
[[nodiscard]] int positive_or(int value, int fallback) noexcept;

/// Returns `value` if it is finite and strictly positive, else `fallback`.
[[nodiscard]] double positive_or(double value, double fallback) noexcept;

// ─── Offset / fill ───────────────────────────────────────────────────────────

/// Shift by `k` positions: positive delays, negative advances. Vacated
/// positions are null.
[[nodiscard]] std::vector<double> shift(std::span<const double> x,
                                        int k) noexcept;

/// Replace nulls with `value`.
void fill_constant(std::vector<double>& x, double value) noexcept;

/// Carry the last non-null value forward over nulls. Leading nulls remain.
void fill_forward(std::vector<double>& x) noexcept;

/// Pull the next non-null value back over nulls. Trailing nulls remain.
void fill_backward(std::vector<double>& x) noexcept;

/// Apply `opts.offset`, then `opts.fillna`, then `opts.fill_method`.
[[nodiscard]] std::vector<double> post_process(std::vector<double> values,
                                               const Options& opts) noexcept;

/// Post-process `values` and wrap them into a labelled Series.
[[nodiscard]] Series make_series(std::string name,
                                 Category category,
                                 std::vector<double> values,
                                 const Options& opts) noexcept;

// ─── Labels ──────────────────────────────────────────────────────────────────

/// Render a floating-point parameter for a label: shortest round-trip form,
/// with ".0" appended to integral values ("0.7", "2.0", "1.5").
[[nodiscard]] std::string format_param(double value);

// ─── Elementwise helpers ─────────────────────────────────────────────────────

/// x[i] − x[i − lag]; the first `lag` positions are null.
[[nodiscard]] std::vector<double> diff(std::span<const double> x,
                                       int lag) noexcept;

/// a − b, with machine epsilon added to every element when any difference is
/// exactly zero (keeps range denominators away from zero).
[[nodiscard]] std::vector<double> non_zero_range(std::span<const double> a,
                                                 std::span<const double> b) noexcept;

/// Sign (+1, 0, −1) of the lag-`lag` difference; position 0 holds `initial`.
[[nodiscard]] std::vector<double> signed_series(std::span<const double> x,
                                                double initial,
                                                int lag = 1) noexcept;

/// Pearson correlation over positions where both series are non-null.
/// Returns NaN when fewer than two such positions exist or either side is
/// constant.
[[nodiscard]] double correlation(std::span<const double> a,
                                 std::span<const double> b) noexcept;

} // namespace tai
