/// @file src/volume/volume_index.cpp
/// @brief Positive and Negative Volume Index.
///
/// Both indices start at `initial` and accumulate the close's rate of change
/// only on bars where volume moved in their direction: PVI on rising volume,
/// NVI on falling volume. Flat-volume bars and the ROC warm-up add 0.

#include "tai/log.hpp"
#include "tai/series.hpp"
#include "tai/volume.hpp"

#include <fmt/format.h>

#include <utility>

namespace tai {

namespace {

/// `direction` is +1 for PVI and −1 for NVI.
std::vector<double> volume_index(std::span<const double> close,
                                 std::span<const double> volume,
                                 int length, double initial,
                                 double direction) noexcept {
    const std::vector<double> sign = signed_series(volume, 1.0);
    const auto n = static_cast<std::size_t>(length);

    std::vector<double> values(close.size(), NaN);
    double total = 0.0;
    for (std::size_t i = 0; i < close.size(); ++i) {
        double step = 0.0;
        if (i == 0) {
            step = initial;
        } else if (i >= n && i < sign.size() && sign[i] == direction) {
            const double r = 100.0 * (close[i] - close[i - n]) / close[i - n];
            if (!is_null(r)) step = r;
        }
        total += step;
        values[i] = total;
    }
    return values;
}

} // namespace

std::optional<Series>
pvi(std::span<const double> close, std::span<const double> volume,
    PviParams params, const Options& opts) noexcept {
    const int    length  = positive_or(params.length, constants::PVI_LENGTH);
    const double initial = positive_or(params.initial, constants::PVI_INITIAL);
    if (!verify_series(close, length) || !verify_series(volume, length)) {
        log::debug("pvi: need {} values for close and volume", length);
        return std::nullopt;
    }

    return make_series(fmt::format("PVI_{}", length), Category::Volume,
                       volume_index(close, volume, length, initial, 1.0), opts);
}

std::optional<Series>
nvi(std::span<const double> close, std::span<const double> volume,
    NviParams params, const Options& opts) noexcept {
    const int    length  = positive_or(params.length, constants::NVI_LENGTH);
    const double initial = positive_or(params.initial, constants::NVI_INITIAL);
    if (!verify_series(close, length) || !verify_series(volume, length)) {
        log::debug("nvi: need {} values for close and volume", length);
        return std::nullopt;
    }

    return make_series(fmt::format("NVI_{}", length), Category::Volume,
                       volume_index(close, volume, length, initial, -1.0), opts);
}

} // namespace tai
