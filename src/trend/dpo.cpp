/// @file src/trend/dpo.cpp
/// @brief Detrended Price Oscillator.

#include "tai/log.hpp"
#include "tai/series.hpp"
#include "tai/trend.hpp"
#include "tai/window.hpp"

#include <fmt/format.h>

#include <utility>

namespace tai {

std::optional<Series>
dpo(std::span<const double> close, DpoParams params, const Options& opts) noexcept {
    const int length = positive_or(params.length, constants::DPO_LENGTH);
    // Centering reads the SMA t bars ahead; without lookahead fall back to
    // the trailing form.
    const bool centered = params.centered && opts.lookahead;
    if (!verify_series(close, length)) {
        log::debug("dpo: need {} values, got {}", length, close.size());
        return std::nullopt;
    }

    const std::vector<double> ma = sma_values(close, length);
    const auto t = static_cast<std::ptrdiff_t>(length / 2 + 1);
    const auto n = static_cast<std::ptrdiff_t>(close.size());

    std::vector<double> values(close.size(), NaN);
    for (std::ptrdiff_t i = 0; i < n; ++i) {
        const std::ptrdiff_t j = centered ? i + t : i - t;
        if (j < 0 || j >= n) continue;
        values[static_cast<std::size_t>(i)] =
            close[static_cast<std::size_t>(i)] - ma[static_cast<std::size_t>(j)];
    }

    return make_series(fmt::format("DPO_{}", length), Category::Trend,
                       std::move(values), opts);
}

} // namespace tai
