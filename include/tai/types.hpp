#pragma once

/// @file include/tai/types.hpp
/// @brief Shared value types for the TAI indicator library.
///
/// Every module includes this file. It defines the result containers returned
/// by indicator functions and the OHLCV bar layout consumed by the loader and
/// the catalog.
///
/// A missing observation is a quiet NaN. There is no separate mask: NaN is
/// the only null an indicator ever emits or expects.

#include <cmath>
#include <cstddef>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tai {

// ─── Null ─────────────────────────────────────────────────────────────────────

/// The null observation.
inline constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

[[nodiscard]] inline bool is_null(double x) noexcept { return std::isnan(x); }

// ─── Category ─────────────────────────────────────────────────────────────────

/// Organisational tag attached to every indicator output.
enum class Category {
    Momentum,
    Overlap,
    Trend,
    Volume,
    Volatility,
};

/// Lower-case category name ("momentum", "overlap", ...).
[[nodiscard]] const char* to_string(Category c) noexcept;

// ─── Series ───────────────────────────────────────────────────────────────────

/// One labelled output sequence, aligned position-for-position with the input.
struct Series {
    std::string         name;      ///< e.g. "T3_10_0.7"
    Category            category;  ///< Organisational grouping
    std::vector<double> values;    ///< Same length as the input; NaN = null

    [[nodiscard]] std::size_t size() const noexcept { return values.size(); }
    [[nodiscard]] double operator[](std::size_t i) const noexcept { return values[i]; }

    /// Number of null entries.
    [[nodiscard]] std::size_t null_count() const noexcept;
};

// ─── Frame ────────────────────────────────────────────────────────────────────

/// A multi-output indicator result (e.g. Bollinger Bands, SMI).
struct Frame {
    std::string         name;
    Category            category;
    std::vector<Series> columns;

    /// Column with the given label, or nullptr.
    [[nodiscard]] const Series* find(std::string_view label) const noexcept;

    /// Length of the columns (all columns share it). 0 for an empty frame.
    [[nodiscard]] std::size_t rows() const noexcept;
};

// ─── OHLCV ────────────────────────────────────────────────────────────────────

/// A single OHLCV bar of market data.
struct OHLCV {
    double timestamp;  ///< Bar index or Unix epoch seconds
    double open;
    double high;
    double low;
    double close;
    double volume;
};

/// Column-wise view of a bar sequence, the layout the indicators consume.
struct OhlcvColumns {
    std::vector<double> timestamp;
    std::vector<double> open;
    std::vector<double> high;
    std::vector<double> low;
    std::vector<double> close;
    std::vector<double> volume;

    [[nodiscard]] std::size_t size() const noexcept { return close.size(); }
};

/// Transpose bars into columns.
[[nodiscard]] OhlcvColumns to_columns(std::span<const OHLCV> bars);

} // namespace tai
