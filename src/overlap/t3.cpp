/// @file src/overlap/t3.cpp
/// @brief Tillson T3 moving average.

#include "tai/log.hpp"
#include "tai/overlap.hpp"
#include "tai/series.hpp"
#include "tai/talib.hpp"
#include "tai/window.hpp"

#include <fmt/format.h>

#include <array>
#include <utility>

namespace tai {

namespace {

struct T3Coefficients {
    double c1, c2, c3, c4;
};

[[nodiscard]] constexpr T3Coefficients t3_coefficients(double a) noexcept {
    const double a2 = a * a;
    const double a3 = a2 * a;
    return {
        .c1 = -a3,
        .c2 = 3.0 * a2 + 3.0 * a3,
        .c3 = -6.0 * a2 - 3.0 * a - 3.0 * a3,
        .c4 = a3 + 3.0 * a2 + 3.0 * a + 1.0,
    };
}

} // namespace

std::optional<Series>
t3(std::span<const double> close, T3Params params, const Options& opts) noexcept {
    const int length = positive_or(params.length, constants::T3_LENGTH);
    const double a = (params.a > 0.0 && params.a < 1.0) ? params.a : constants::T3_A;
    if (!verify_series(close, length)) {
        log::debug("t3: need {} values, got {}", length, close.size());
        return std::nullopt;
    }

    std::string name = fmt::format("T3_{}_{}", length, format_param(a));

    if (opts.talib) {
        if (auto values = talib::t3(close, length, a)) {
            return make_series(std::move(name), Category::Overlap,
                               std::move(*values), opts);
        }
    }

    // e[0] = EMA(close), e[j] = EMA(e[j−1]).
    std::array<std::vector<double>, 6> e;
    e[0] = ema_values(close, length, opts.presma, opts.adjust);
    for (std::size_t j = 1; j < e.size(); ++j) {
        e[j] = ema_values(e[j - 1], length, opts.presma, opts.adjust);
    }

    const T3Coefficients c = t3_coefficients(a);
    std::vector<double> values(close.size(), NaN);
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = c.c1 * e[5][i] + c.c2 * e[4][i] + c.c3 * e[3][i] + c.c4 * e[2][i];
    }

    return make_series(std::move(name), Category::Overlap, std::move(values), opts);
}

} // namespace tai
