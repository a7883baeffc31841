#pragma once

/// @file include/tai/options.hpp
/// @brief The options bag every indicator accepts after its parameters.
///
/// Options carry the post-processing applied uniformly to a raw result
/// (offset, then constant fill, then method fill) and a handful of
/// computation-path switches.

#include <optional>
#include <string_view>

namespace tai {

/// Named fill method for remaining nulls.
enum class FillMethod {
    Forward,   ///< "ffill" / "pad": carry the last non-null value forward
    Backward,  ///< "bfill" / "backfill": pull the next non-null value back
};

/// Parse a fill-method name. Returns nullopt for unknown names.
[[nodiscard]] std::optional<FillMethod>
parse_fill_method(std::string_view name) noexcept;

[[nodiscard]] const char* to_string(FillMethod m) noexcept;

/// Post-processing and path selection shared by all indicators.
struct Options {
    /// Shift applied to the result: positive delays, negative advances.
    int offset = 0;

    /// Replace remaining nulls with this constant.
    std::optional<double> fillna{};

    /// Replace remaining nulls using a fill method (applied after `fillna`).
    std::optional<FillMethod> fill_method{};

    /// Prefer the TA-Lib computation where the indicator offers one and the
    /// backend is available. Also selects TA-Lib-style smoothing in the
    /// bundled CMO.
    bool talib = true;

    /// Seed exponential smoothing with the mean of the first `length` values.
    bool presma = true;

    /// Normalise exponential weights (see ewm_mean).
    bool adjust = false;

    /// DPO only: false forbids the centered (look-ahead) form.
    bool lookahead = true;
};

} // namespace tai
