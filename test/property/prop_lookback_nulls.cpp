/**
 * @file  prop_lookback_nulls.cpp
 * @brief Property: on null-free input the warm-up of each window is exactly
 *        its lookback, and rolling extremes bound their window.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_lookback_nulls
 *
 *   first_valid(sma(x, n))         = n − 1
 *   first_valid(ema(x, n, presma)) = n − 1
 *   first_valid(rma(x, n))         = n − 1
 *   rolling_min(x, n)[i] ≤ x[j] ≤ rolling_max(x, n)[i],  j ∈ (i − n, i]
 */

#include <rapidcheck.h>
#include <vector>

#include "tai/types.hpp"
#include "tai/window.hpp"

using namespace tai;

namespace {

long first_valid(const std::vector<double>& x) {
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (!is_null(x[i])) return static_cast<long>(i);
    }
    return -1;
}

std::vector<double> prices() {
    const auto raw = *rc::gen::container<std::vector<int>>(rc::gen::inRange(1, 100000));
    return std::vector<double>(raw.begin(), raw.end());
}

} // namespace

int main() {
    // ── Property 1: warm-up length of the moving averages ───────────────────
    rc::check(
        "lookback_nulls: sma, ema and rma first value at n - 1",
        []() {
            const auto x = prices();
            const int n = *rc::gen::inRange(1, 60);
            RC_PRE(x.size() >= static_cast<std::size_t>(n));

            const long expect = n - 1;
            RC_ASSERT(first_valid(sma_values(x, n)) == expect);
            RC_ASSERT(first_valid(ema_values(x, n, true, false)) == expect);
            RC_ASSERT(first_valid(rma_values(x, n)) == expect);
            RC_ASSERT(first_valid(rolling_max(x, n)) == expect);
        }
    );

    // ── Property 2: window shorter than n → all null ────────────────────────
    rc::check(
        "lookback_nulls: input shorter than the window is all null",
        []() {
            const auto x = prices();
            const int n = static_cast<int>(x.size()) + *rc::gen::inRange(1, 10);
            for (double v : sma_values(x, n)) RC_ASSERT(is_null(v));
            for (double v : rolling_min(x, n)) RC_ASSERT(is_null(v));
        }
    );

    // ── Property 3: rolling extremes bound their window ─────────────────────
    rc::check(
        "lookback_nulls: rolling_min <= window values <= rolling_max",
        []() {
            const auto x = prices();
            const int n = *rc::gen::inRange(1, 30);
            RC_PRE(x.size() >= static_cast<std::size_t>(n));

            const auto lo = rolling_min(x, n);
            const auto hi = rolling_max(x, n);
            const auto w  = static_cast<std::size_t>(n);
            for (std::size_t i = w - 1; i < x.size(); ++i) {
                bool hit_lo = false, hit_hi = false;
                for (std::size_t j = i + 1 - w; j <= i; ++j) {
                    RC_ASSERT(lo[i] <= x[j]);
                    RC_ASSERT(x[j] <= hi[i]);
                    hit_lo = hit_lo || lo[i] == x[j];
                    hit_hi = hit_hi || hi[i] == x[j];
                }
                RC_ASSERT(hit_lo && hit_hi);
            }
        }
    );

    return 0;
}
