/**
 * @file  prop_recurrence_determinism.cpp
 * @brief Property: the adaptive smoothing scan is a pure function of its
 *        inputs and respects its start position.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_recurrence_determinism
 *
 *   out[i] = α·k[i]·x[i] + out[i−1]·(1 − α·k[i]),   out[start−1] = 0
 */

#include <rapidcheck.h>
#include <cstring>
#include <vector>

#include "tai/recurrence.hpp"
#include "tai/types.hpp"

using namespace tai;

namespace {

std::vector<double> scaled(const std::vector<int>& raw, double scale) {
    std::vector<double> out;
    out.reserve(raw.size());
    for (int r : raw) out.push_back(static_cast<double>(r) * scale);
    return out;
}

} // namespace

int main() {
    // ── Property 1: bit-identical on repeat ─────────────────────────────────
    rc::check(
        "recurrence_determinism: two runs give identical bits",
        []() {
            const auto raw = *rc::gen::container<std::vector<int>>(rc::gen::inRange(1, 100000));
            const auto x = scaled(raw, 0.01);
            std::vector<double> k(x.size());
            for (std::size_t i = 0; i < k.size(); ++i) k[i] = (raw[i] % 101) / 100.0;
            const int start = *rc::gen::inRange(0, 40);

            const auto a = adaptive_smooth(x, k, 2.0 / 15.0, start);
            const auto b = adaptive_smooth(x, k, 2.0 / 15.0, start);
            RC_ASSERT(a.size() == x.size());
            RC_ASSERT(std::memcmp(a.data(), b.data(), a.size() * sizeof(double)) == 0);
        }
    );

    // ── Property 2: positions before start stay null ────────────────────────
    rc::check(
        "recurrence_determinism: nothing before start is computed",
        []() {
            const auto raw = *rc::gen::container<std::vector<int>>(rc::gen::inRange(1, 1000));
            const auto x = scaled(raw, 1.0);
            const std::vector<double> k(x.size(), 0.5);
            const int start = *rc::gen::inRange(1, 40);

            const auto out = adaptive_smooth(x, k, 0.2, start);
            for (std::size_t i = 0; i < out.size(); ++i) {
                if (i < static_cast<std::size_t>(start)) {
                    RC_ASSERT(is_null(out[i]));
                } else {
                    RC_ASSERT(!is_null(out[i]));
                }
            }
        }
    );

    // ── Property 3: zero efficiency holds the zero seed ─────────────────────
    rc::check(
        "recurrence_determinism: k == 0 keeps the output at the seed",
        []() {
            const auto raw = *rc::gen::container<std::vector<int>>(rc::gen::inRange(1, 1000));
            const auto x = scaled(raw, 1.0);
            const std::vector<double> k(x.size(), 0.0);

            const auto out = adaptive_smooth(x, k, 0.5, 1);
            for (std::size_t i = 1; i < out.size(); ++i) RC_ASSERT(out[i] == 0.0);
        }
    );

    // ── Property 4: output stays inside the range of x and the seed ─────────
    rc::check(
        "recurrence_determinism: 0 <= out <= max(x) for positive x",
        []() {
            const auto raw = *rc::gen::container<std::vector<int>>(rc::gen::inRange(1, 1000));
            const auto x = scaled(raw, 1.0);
            std::vector<double> k(x.size());
            for (std::size_t i = 0; i < k.size(); ++i) k[i] = (raw[i] % 11) / 10.0;

            double hi = 0.0;
            for (double v : x) hi = v > hi ? v : hi;

            const auto out = adaptive_smooth(x, k, 0.5, 1);
            for (std::size_t i = 1; i < out.size(); ++i) {
                RC_ASSERT(out[i] >= 0.0);
                RC_ASSERT(out[i] <= hi + 1e-9);
            }
        }
    );

    return 0;
}
