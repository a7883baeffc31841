#pragma once

/// @file include/tai/volume.hpp
/// @brief Volume indicators: cumulative indices that react to volume changes.
///
/// Both indices accumulate ROC(close, n) in percent, but only on bars where
/// volume moved in their direction (up for PVI, down for NVI). Position 0
/// holds `initial`; bars that do not qualify add nothing.

#include "tai/constants.hpp"
#include "tai/options.hpp"
#include "tai/types.hpp"

#include <optional>
#include <span>

namespace tai {

struct PviParams {
    int    length  = constants::PVI_LENGTH;
    double initial = constants::PVI_INITIAL;
};

struct NviParams {
    int    length  = constants::NVI_LENGTH;
    double initial = constants::NVI_INITIAL;
};

/// Positive Volume Index.
[[nodiscard]] std::optional<Series>
pvi(std::span<const double> close, std::span<const double> volume,
    PviParams params = {}, const Options& opts = {}) noexcept;

/// Negative Volume Index.
[[nodiscard]] std::optional<Series>
nvi(std::span<const double> close, std::span<const double> volume,
    NviParams params = {}, const Options& opts = {}) noexcept;

} // namespace tai
