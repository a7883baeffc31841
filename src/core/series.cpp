/// @file src/core/series.cpp
/// @brief Series utilities: validation, offset, fill, labels, elementwise
///        helpers.

#include "tai/series.hpp"

#include <Eigen/Dense>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace tai {

// ─── Validation ───────────────────────────────────────────────────────────────

bool verify_series(std::span<const double> x, int min_length) noexcept {
    if (x.empty()) return false;
    const std::size_t need = min_length > 0 ? static_cast<std::size_t>(min_length) : 0;
    return x.size() >= need;
}

int get_drift(int drift) noexcept { return drift > 0 ? drift : 1; }

int positive_or(int value, int fallback) noexcept {
    return value > 0 ? value : fallback;
}

double positive_or(double value, double fallback) noexcept {
    return (std::isfinite(value) && value > 0.0) ? value : fallback;
}

// ─── shift ────────────────────────────────────────────────────────────────────

std::vector<double> shift(std::span<const double> x, int k) noexcept {
    const auto n = static_cast<std::ptrdiff_t>(x.size());
    std::vector<double> out(x.size(), NaN);
    for (std::ptrdiff_t i = 0; i < n; ++i) {
        const std::ptrdiff_t src = i - k;
        if (src >= 0 && src < n) out[static_cast<std::size_t>(i)] = x[static_cast<std::size_t>(src)];
    }
    return out;
}

// ─── fill ─────────────────────────────────────────────────────────────────────

void fill_constant(std::vector<double>& x, double value) noexcept {
    for (double& v : x) {
        if (is_null(v)) v = value;
    }
}

void fill_forward(std::vector<double>& x) noexcept {
    double last = NaN;
    for (double& v : x) {
        if (is_null(v)) v = last;
        else            last = v;
    }
}

void fill_backward(std::vector<double>& x) noexcept {
    double next = NaN;
    for (auto it = x.rbegin(); it != x.rend(); ++it) {
        if (is_null(*it)) *it = next;
        else              next = *it;
    }
}

std::vector<double> post_process(std::vector<double> values,
                                 const Options& opts) noexcept {
    if (opts.offset != 0) {
        values = shift(values, opts.offset);
    }
    if (opts.fillna) {
        fill_constant(values, *opts.fillna);
    }
    if (opts.fill_method) {
        switch (*opts.fill_method) {
            case FillMethod::Forward:  fill_forward(values);  break;
            case FillMethod::Backward: fill_backward(values); break;
        }
    }
    return values;
}

Series make_series(std::string name, Category category,
                   std::vector<double> values, const Options& opts) noexcept {
    return Series{
        .name     = std::move(name),
        .category = category,
        .values   = post_process(std::move(values), opts),
    };
}

// ─── Labels ───────────────────────────────────────────────────────────────────

std::string format_param(double value) {
    std::string s = fmt::format("{}", value);
    // fmt prints 2.0 as "2"; labels keep the decimal point.
    if (std::isfinite(value) &&
        s.find_first_of(".e") == std::string::npos) {
        s += ".0";
    }
    return s;
}

// ─── Elementwise helpers ──────────────────────────────────────────────────────

std::vector<double> diff(std::span<const double> x, int lag) noexcept {
    std::vector<double> out(x.size(), NaN);
    if (lag <= 0) return out;
    const auto d = static_cast<std::size_t>(lag);
    for (std::size_t i = d; i < x.size(); ++i) {
        out[i] = x[i] - x[i - d];
    }
    return out;
}

std::vector<double> non_zero_range(std::span<const double> a,
                                   std::span<const double> b) noexcept {
    const std::size_t n = std::min(a.size(), b.size());
    std::vector<double> out(a.size(), NaN);
    bool any_zero = false;
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = a[i] - b[i];
        if (out[i] == 0.0) any_zero = true;
    }
    if (any_zero) {
        const double eps = std::numeric_limits<double>::epsilon();
        for (double& v : out) v += eps;
    }
    return out;
}

std::vector<double> signed_series(std::span<const double> x,
                                  double initial, int lag) noexcept {
    std::vector<double> out = diff(x, get_drift(lag));
    for (double& v : out) {
        if (v > 0.0)      v = 1.0;
        else if (v < 0.0) v = -1.0;
    }
    if (!out.empty()) out[0] = initial;
    return out;
}

double correlation(std::span<const double> a, std::span<const double> b) noexcept {
    const std::size_t n = std::min(a.size(), b.size());
    std::vector<double> xa, xb;
    xa.reserve(n);
    xb.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (!is_null(a[i]) && !is_null(b[i]) &&
            std::isfinite(a[i]) && std::isfinite(b[i])) {
            xa.push_back(a[i]);
            xb.push_back(b[i]);
        }
    }
    if (xa.size() < 2) return NaN;

    const Eigen::Map<const Eigen::ArrayXd> va(xa.data(), static_cast<Eigen::Index>(xa.size()));
    const Eigen::Map<const Eigen::ArrayXd> vb(xb.data(), static_cast<Eigen::Index>(xb.size()));
    const Eigen::ArrayXd da = va - va.mean();
    const Eigen::ArrayXd db = vb - vb.mean();
    const double denom = std::sqrt((da * da).sum() * (db * db).sum());
    if (denom == 0.0) return NaN;
    return (da * db).sum() / denom;
}

} // namespace tai
