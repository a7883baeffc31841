/// @file src/window/window.cpp
/// @brief Rolling and exponential transforms.
///
/// Rolling sums slide in O(n) with a Neumaier-compensated accumulator. The
/// window also counts its non-zero terms so a window of zeros reports an
/// exact 0 instead of residual rounding error; CMO and VIDYA rely on that to
/// detect a flat market (0/0).

#include "tai/window.hpp"
#include "tai/types.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <deque>

namespace tai {

namespace {

/// Compensated running sum supporting removal.
struct CompensatedSum {
    double sum  = 0.0;
    double comp = 0.0;

    void add(double v) noexcept {
        const double t = sum + v;
        if (std::abs(sum) >= std::abs(v)) comp += (sum - t) + v;
        else                              comp += (v - t) + sum;
        sum = t;
    }

    [[nodiscard]] double value() const noexcept { return sum + comp; }

    void reset() noexcept { sum = 0.0; comp = 0.0; }
};

[[nodiscard]] bool window_fits(std::span<const double> x, int n) noexcept {
    return n > 0 && static_cast<std::size_t>(n) <= x.size();
}

/// Monotonic-deque rolling extreme. `better(a, b)` is true when a should
/// evict b (a ≤ b for min, a ≥ b for max).
template <typename Better>
std::vector<double> rolling_extreme(std::span<const double> x, int n,
                                    Better better) noexcept {
    std::vector<double> out(x.size(), NaN);
    if (!window_fits(x, n)) return out;

    const auto w = static_cast<std::size_t>(n);
    std::deque<std::size_t> idx;
    std::size_t nulls = 0;

    for (std::size_t i = 0; i < x.size(); ++i) {
        if (is_null(x[i])) {
            ++nulls;
        } else {
            while (!idx.empty() && better(x[i], x[idx.back()])) idx.pop_back();
            idx.push_back(i);
        }
        if (i >= w && is_null(x[i - w])) --nulls;
        while (!idx.empty() && idx.front() + w <= i) idx.pop_front();

        if (i + 1 >= w && nulls == 0 && !idx.empty()) {
            out[i] = x[idx.front()];
        }
    }
    return out;
}

} // namespace

// ─── rolling_sum / rolling_mean ───────────────────────────────────────────────

std::vector<double> rolling_sum(std::span<const double> x, int n) noexcept {
    std::vector<double> out(x.size(), NaN);
    if (!window_fits(x, n)) return out;

    const auto w = static_cast<std::size_t>(n);
    CompensatedSum acc;
    std::size_t valid   = 0;
    std::size_t nonzero = 0;

    for (std::size_t i = 0; i < x.size(); ++i) {
        const double v = x[i];
        if (!is_null(v)) {
            acc.add(v);
            ++valid;
            if (v != 0.0) ++nonzero;
        }
        if (i >= w) {
            const double old = x[i - w];
            if (!is_null(old)) {
                acc.add(-old);
                --valid;
                if (old != 0.0) --nonzero;
            }
        }
        if (nonzero == 0) acc.reset();

        if (valid == w) out[i] = acc.value();
    }
    return out;
}

std::vector<double> rolling_mean(std::span<const double> x, int n) noexcept {
    std::vector<double> out = rolling_sum(x, n);
    if (n <= 0) return out;
    for (double& v : out) v /= static_cast<double>(n);
    return out;
}

// ─── rolling_min / rolling_max ────────────────────────────────────────────────

std::vector<double> rolling_min(std::span<const double> x, int n) noexcept {
    return rolling_extreme(x, n, [](double a, double b) { return a <= b; });
}

std::vector<double> rolling_max(std::span<const double> x, int n) noexcept {
    return rolling_extreme(x, n, [](double a, double b) { return a >= b; });
}

// ─── rolling_stdev ────────────────────────────────────────────────────────────

std::vector<double> rolling_stdev(std::span<const double> x, int n,
                                  int ddof) noexcept {
    std::vector<double> out(x.size(), NaN);
    if (!window_fits(x, n) || n - ddof <= 0) return out;

    const auto w = static_cast<std::size_t>(n);
    const std::vector<double> mean = rolling_mean(x, n);

    // Two-pass per window: windows are short and this keeps the variance
    // non-negative without the usual sliding sum-of-squares cancellation.
    for (std::size_t i = w - 1; i < x.size(); ++i) {
        if (is_null(mean[i])) continue;
        double sq = 0.0;
        for (std::size_t j = i + 1 - w; j <= i; ++j) {
            const double d = x[j] - mean[i];
            sq += d * d;
        }
        out[i] = std::sqrt(sq / static_cast<double>(n - ddof));
    }
    return out;
}

// ─── rolling_weighted ─────────────────────────────────────────────────────────

std::vector<double> rolling_weighted(std::span<const double> x,
                                     std::span<const double> weights) noexcept {
    std::vector<double> out(x.size(), NaN);
    const int n = static_cast<int>(weights.size());
    if (!window_fits(x, n)) return out;

    const auto w = static_cast<std::size_t>(n);
    const Eigen::Map<const Eigen::VectorXd> wv(weights.data(), n);
    const double wsum = wv.sum();
    if (wsum == 0.0) return out;

    std::size_t nulls = 0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (is_null(x[i])) ++nulls;
        if (i >= w && is_null(x[i - w])) --nulls;
        if (i + 1 < w || nulls != 0) continue;

        const Eigen::Map<const Eigen::VectorXd> window(x.data() + (i + 1 - w), n);
        out[i] = wv.dot(window) / wsum;
    }
    return out;
}

// ─── ewm_mean ─────────────────────────────────────────────────────────────────

std::vector<double> ewm_mean(std::span<const double> x, double alpha,
                             bool adjust, int min_periods) noexcept {
    std::vector<double> out(x.size(), NaN);
    if (!(alpha > 0.0 && alpha <= 1.0) || x.empty()) return out;

    const double old_wt_factor = 1.0 - alpha;
    const double new_wt        = adjust ? 1.0 : alpha;
    const auto   minp          = static_cast<std::size_t>(min_periods > 1 ? min_periods : 1);

    double weighted = NaN;
    double old_wt   = 1.0;
    std::size_t nobs = 0;

    for (std::size_t i = 0; i < x.size(); ++i) {
        const double cur    = x[i];
        const bool   is_obs = !is_null(cur);
        if (is_obs) ++nobs;

        if (!is_null(weighted)) {
            // Gaps still decay the old weight.
            old_wt *= old_wt_factor;
            if (is_obs) {
                if (weighted != cur) {
                    weighted = (old_wt * weighted + new_wt * cur) / (old_wt + new_wt);
                }
                old_wt = adjust ? old_wt + new_wt : 1.0;
            }
        } else if (is_obs) {
            weighted = cur;
        }

        out[i] = (nobs >= minp) ? weighted : NaN;
    }
    return out;
}

// ─── sma / ema / rma / wilder ─────────────────────────────────────────────────

std::vector<double> sma_values(std::span<const double> x, int n) noexcept {
    return rolling_mean(x, n);
}

std::vector<double> ema_values(std::span<const double> x, int n,
                               bool presma, bool adjust) noexcept {
    if (n <= 0) return std::vector<double>(x.size(), NaN);
    const double alpha = 2.0 / (static_cast<double>(n) + 1.0);

    if (!presma) {
        return ewm_mean(x, alpha, adjust, 0);
    }

    // Seed: mean of the first n non-null observations, placed on the n-th.
    std::vector<double> seeded(x.size(), NaN);
    std::size_t seen = 0;
    double      acc  = 0.0;
    std::size_t seed_at = x.size();
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (is_null(x[i])) continue;
        acc += x[i];
        if (++seen == static_cast<std::size_t>(n)) {
            seed_at = i;
            break;
        }
    }
    if (seed_at == x.size()) return seeded;

    seeded[seed_at] = acc / static_cast<double>(n);
    for (std::size_t i = seed_at + 1; i < x.size(); ++i) seeded[i] = x[i];
    return ewm_mean(seeded, alpha, adjust, 0);
}

std::vector<double> rma_values(std::span<const double> x, int n) noexcept {
    if (n <= 0) return std::vector<double>(x.size(), NaN);
    return ewm_mean(x, 1.0 / static_cast<double>(n), true, n);
}

std::vector<double> wilder_values(std::span<const double> x, int n) noexcept {
    std::vector<double> out(x.size(), NaN);
    if (n <= 0) return out;

    std::size_t seen = 0;
    double      acc  = 0.0;
    std::size_t i    = 0;
    for (; i < x.size(); ++i) {
        if (is_null(x[i])) continue;
        acc += x[i];
        if (++seen == static_cast<std::size_t>(n)) break;
    }
    if (i >= x.size()) return out;

    const double nd = static_cast<double>(n);
    double prev = acc / nd;
    out[i] = prev;
    for (++i; i < x.size(); ++i) {
        prev   = (prev * (nd - 1.0) + x[i]) / nd;
        out[i] = prev;
    }
    return out;
}

// ─── fibonacci ────────────────────────────────────────────────────────────────

std::vector<double> fibonacci(int n, bool weighted) noexcept {
    std::vector<double> out;
    if (n <= 0) return out;
    out.reserve(static_cast<std::size_t>(n));

    double a = 1.0, b = 1.0;
    out.push_back(a);
    for (int i = 1; i < n; ++i) {
        const double next = a + b;
        a = b;
        b = next;
        out.push_back(a);
    }

    if (weighted) {
        Eigen::Map<Eigen::VectorXd> v(out.data(), n);
        const double total = v.sum();
        if (total > 0.0) v /= total;
    }
    return out;
}

} // namespace tai
