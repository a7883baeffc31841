/**
 * @file  fuzz_csv_loader.cpp
 * @brief libFuzzer target for the header-driven CSV loader.
 *
 * Build:
 *   cmake -DTAI_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_csv_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_csv_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every returned bar passes validate_bar: finite fields,
 *      low ≤ open, close ≤ high, volume ≥ 0.
 *   3. Columns built from the bars all have the bar count.
 *
 * Inputs worth reaching:
 *   • Headers with shuffled, duplicated or missing columns
 *   • "NaN", "inf", "1e308" tokens
 *   • CRLF line endings, '#' comments, quoted fields
 *   • Binary garbage and embedded null bytes
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "tai/data_loader.hpp"
#include "tai/types.hpp"

using namespace tai;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    const auto bars = DataLoader::parse_csv_string(input);
    for (const auto& bar : bars) {
        assert(DataLoader::validate_bar(bar));
        assert(std::isfinite(bar.timestamp));
        assert(bar.low <= bar.high);
    }

    const OhlcvColumns cols = to_columns(bars);
    assert(cols.size() == bars.size());
    assert(cols.open.size() == bars.size());
    assert(cols.volume.size() == bars.size());

    // The header probe must tolerate any single line.
    const auto eol = input.find('\n');
    const auto layout = DataLoader::parse_header(input.substr(0, eol));
    if (layout.has_value()) {
        assert(layout->open >= 0 || layout->high >= 0 ||
               layout->low >= 0 || layout->close >= 0);
    }

    return 0;
}
