/// @file src/window/recurrence.cpp
/// @brief Adaptive smoothing scan.

#include "tai/recurrence.hpp"
#include "tai/types.hpp"

namespace tai {

std::vector<double> adaptive_smooth(std::span<const double> x,
                                    std::span<const double> k,
                                    double alpha,
                                    int start) noexcept {
    const std::size_t n = x.size();
    std::vector<double> out(n, NaN);
    if (k.size() != n) return out;

    const std::size_t first = start > 0 ? static_cast<std::size_t>(start) : 1;
    if (first >= n) return out;

    // Cells before `first` are never written and stay null; anything the
    // scan writes is kept as-is, including an exact 0.
    double prev = 0.0;

    for (std::size_t i = first; i < n; ++i) {
        const double a = alpha * k[i];
        prev = a * x[i] + prev * (1.0 - a);
        out[i] = prev;
    }
    return out;
}

} // namespace tai
