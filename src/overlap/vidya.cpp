/// @file src/overlap/vidya.cpp
/// @brief Variable Index Dynamic Average.

#include "tai/log.hpp"
#include "tai/overlap.hpp"
#include "tai/recurrence.hpp"
#include "tai/series.hpp"
#include "tai/window.hpp"

#include <fmt/format.h>

#include <cmath>
#include <utility>

namespace tai {

std::optional<Series>
vidya(std::span<const double> close, VidyaParams params, const Options& opts) noexcept {
    const int length = positive_or(params.length, constants::VIDYA_LENGTH);
    const int drift  = get_drift(params.drift);
    if (!verify_series(close, length)) {
        log::debug("vidya: need {} values, got {}", length, close.size());
        return std::nullopt;
    }

    // |CMO| over plain rolling sums, unscaled.
    const std::vector<double> mom = diff(close, drift);
    std::vector<double> pos(mom.size(), NaN);
    std::vector<double> neg(mom.size(), NaN);
    for (std::size_t i = 0; i < mom.size(); ++i) {
        if (is_null(mom[i])) continue;
        pos[i] = mom[i] > 0.0 ?  mom[i] : 0.0;
        neg[i] = mom[i] < 0.0 ? -mom[i] : 0.0;
    }
    const std::vector<double> pos_sum = rolling_sum(pos, length);
    const std::vector<double> neg_sum = rolling_sum(neg, length);

    std::vector<double> k(close.size(), NaN);
    for (std::size_t i = 0; i < k.size(); ++i) {
        k[i] = std::abs((pos_sum[i] - neg_sum[i]) / (pos_sum[i] + neg_sum[i]));
    }

    // The scan always starts at `length`. With drift > 1 the oscillator is
    // still undefined there, and that null is carried through every later cell.
    const double alpha = 2.0 / (static_cast<double>(length) + 1.0);
    std::vector<double> values = adaptive_smooth(close, k, alpha, length);

    return make_series(fmt::format("VIDYA_{}", length), Category::Overlap,
                       std::move(values), opts);
}

} // namespace tai
