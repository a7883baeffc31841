/**
 * @file  fuzz_indicators.cpp
 * @brief libFuzzer target running every catalog indicator on arbitrary
 *        price series and parameter values.
 *
 * Build:
 *   cmake -DTAI_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_indicators
 *
 * Run for 60 seconds:
 *   ./fuzz_indicators -max_total_time=60
 *
 * Input layout:
 *   byte 0       catalog entry index (mod entry count)
 *   byte 1       length parameter (0 → default)
 *   byte 2       offset parameter, reinterpreted as int8
 *   byte 3       flags: bit 0 talib, bit 1 presma, bit 2 fill_method=ffill
 *   bytes 4..    doubles, used as close; high/low/open/volume derive from it.
 *                NaN, ±inf and denormals are all allowed through.
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. A returned frame has at least one column, and each column has the
 *      input length.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

#include "tai/catalog.hpp"
#include "tai/log.hpp"

using namespace tai;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 4) return 0;
    log::set_level(log::Level::Off);

    const auto& entries = catalog::entries();
    const auto& entry   = entries[data[0] % entries.size()];
    const int length    = data[1];
    const int offset    = static_cast<int8_t>(data[2]);
    const uint8_t flags = data[3];

    OhlcvColumns d;
    for (size_t at = 4; at + sizeof(double) <= size; at += sizeof(double)) {
        double c;
        std::memcpy(&c, data + at, sizeof(double));
        d.timestamp.push_back(static_cast<double>(d.close.size()));
        d.close.push_back(c);
        d.open.push_back(c);
        d.high.push_back(c + 1.0);
        d.low.push_back(c - 1.0);
        d.volume.push_back(std::abs(c));
    }

    catalog::ParamMap params{
        {"offset", std::to_string(offset)},
        {"talib", (flags & 1) ? "true" : "false"},
        {"presma", (flags & 2) ? "true" : "false"},
    };
    if (length > 0) params["length"] = std::to_string(length);
    if (flags & 4) params["fill_method"] = "ffill";

    const auto frame = catalog::compute(entry.name, d, params);
    if (frame.has_value()) {
        assert(!frame->columns.empty());
        for (const auto& col : frame->columns) {
            assert(col.size() == d.size());
        }
    }

    return 0;
}
