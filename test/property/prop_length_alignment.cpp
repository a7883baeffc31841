/**
 * @file  prop_length_alignment.cpp
 * @brief Property: every indicator output is aligned with its input.
 *
 * Run with 1,000 random inputs (each runs the whole catalog):
 *   RC_PARAMS="max_success=1000" ./prop_length_alignment
 *
 * For any consistent OHLCV sequence and any offset, each column of each
 * catalog result has exactly len(input) entries. An indicator may decline
 * (nullopt) when the input is shorter than its lookback, never return a
 * shorter or longer column.
 */

#include <rapidcheck.h>
#include <string>

#include "tai/catalog.hpp"
#include "tai/log.hpp"

using namespace tai;

namespace {

OhlcvColumns bars_from(const std::vector<int>& closes) {
    OhlcvColumns d;
    for (std::size_t i = 0; i < closes.size(); ++i) {
        const double c = 100.0 + static_cast<double>(closes[i]) / 10.0;
        d.timestamp.push_back(static_cast<double>(i));
        d.open.push_back(c);
        d.high.push_back(c + 0.5);
        d.low.push_back(c - 0.5);
        d.close.push_back(c);
        d.volume.push_back(1000.0 + static_cast<double>(i % 7) * 100.0);
    }
    return d;
}

} // namespace

int main() {
    log::set_level(log::Level::Off);

    rc::check(
        "length_alignment: len(output) == len(input) for every indicator",
        []() {
            const auto closes = *rc::gen::container<std::vector<int>>(
                rc::gen::inRange(-500, 500));
            const int offset = *rc::gen::inRange(-10, 11);
            const OhlcvColumns data = bars_from(closes);

            const catalog::ParamMap params{{"offset", std::to_string(offset)}};
            for (const auto& e : catalog::entries()) {
                const auto frame = catalog::compute(e.name, data, params);
                if (!frame) continue;
                RC_ASSERT(!frame->columns.empty());
                for (const auto& col : frame->columns) {
                    RC_ASSERT(col.size() == data.size());
                }
            }
        }
    );

    return 0;
}
