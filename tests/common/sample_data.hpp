#pragma once

/// @file tests/common/sample_data.hpp
/// @brief Deterministic OHLCV fixtures shared by the unit tests.

#include "tai/types.hpp"

#include <algorithm>
#include <cstddef>
#include <random>
#include <span>
#include <vector>

namespace tai::sample {

/// Seeded random walk. Bars are internally consistent: low ≤ open, close ≤ high.
inline OhlcvColumns random_walk(std::size_t n, unsigned seed = 42) {
    std::mt19937 rng(seed);
    std::normal_distribution<double>       step(0.0, 1.0);
    std::uniform_real_distribution<double> wick(0.05, 1.0);
    std::uniform_real_distribution<double> vol(1.0e5, 2.0e5);

    OhlcvColumns out;
    double price = 100.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double open  = price;
        const double close = std::max(1.0, price + step(rng));
        out.timestamp.push_back(static_cast<double>(i));
        out.open.push_back(open);
        out.close.push_back(close);
        out.high.push_back(std::max(open, close) + wick(rng));
        out.low.push_back(std::max(0.5, std::min(open, close) - wick(rng)));
        out.volume.push_back(vol(rng));
        price = close;
    }
    return out;
}

/// start, start + step, start + 2·step, ...
inline std::vector<double> ramp(std::size_t n, double start = 1.0, double step = 1.0) {
    std::vector<double> out(n);
    for (std::size_t i = 0; i < n; ++i) out[i] = start + step * static_cast<double>(i);
    return out;
}

/// Index of the first non-null value, or -1.
inline long first_valid(std::span<const double> x) {
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (!is_null(x[i])) return static_cast<long>(i);
    }
    return -1;
}

} // namespace tai::sample
