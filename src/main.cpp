/// @file src/main.cpp
/// @brief tai CLI entry point.
///
/// Usage:
///   tai <indicator> <csv_file> [key=value ...]   Compute and print as CSV
///   tai --list                                   List indicators by category
///   tai --version                                Library and TA-Lib versions
///   tai --help                                   Print usage
///
/// `<csv_file>` may be `-` to read from stdin. `log=debug|info|warn|error|off`
/// sets the log level; every other key=value is passed to the indicator.

#include "tai/catalog.hpp"
#include "tai/data_loader.hpp"
#include "tai/log.hpp"
#include "tai/talib.hpp"

#include <fmt/core.h>

#include <cstring>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr const char* kVersion = "0.1.0";

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  tai <indicator> <csv_file> [key=value ...]   Compute an indicator\n"
        "  tai --list                                   List indicators\n"
        "  tai --version                                Show versions\n"
        "  tai --help                                   Show this help\n"
        "\n"
        "CSV input (header names located by name, '-' reads stdin):\n"
        "  timestamp,open,high,low,close,volume\n"
        "\n"
        "Common keys: length, offset, fillna, fill_method=ffill|bfill,\n"
        "  talib=true|false, presma, adjust, lookahead, log=debug|info|warn|error|off\n"
    );
}

void print_list() {
    for (const tai::Category cat : {tai::Category::Overlap, tai::Category::Momentum,
                                    tai::Category::Trend, tai::Category::Volume,
                                    tai::Category::Volatility}) {
        fmt::print("{}:\n", tai::to_string(cat));
        for (const auto& e : tai::catalog::entries()) {
            if (e.category == cat) {
                fmt::print("  {:<12} {}\n", e.name, e.description);
            }
        }
    }
}

/// Empty cell for null, shortest round-trip representation otherwise.
std::string cell(double v) {
    return tai::is_null(v) ? std::string{} : fmt::format("{}", v);
}

void print_frame(const tai::Frame& frame, const tai::OhlcvColumns& data) {
    fmt::print("timestamp");
    for (const auto& col : frame.columns) {
        fmt::print(",{}", col.name);
    }
    fmt::print("\n");

    for (std::size_t i = 0; i < frame.rows(); ++i) {
        fmt::print("{}", i < data.timestamp.size() ? cell(data.timestamp[i]) : std::string{});
        for (const auto& col : frame.columns) {
            fmt::print(",{}", cell(col.values[i]));
        }
        fmt::print("\n");
    }
}

/// Load, compute, print. Returns 0 on success, 1 on error.
int run_indicator(const std::string& name, const std::string& path,
                  const tai::catalog::ParamMap& params) {
    if (tai::catalog::find(name) == nullptr) {
        fmt::print(stderr, "Error: unknown indicator '{}' (see tai --list)\n", name);
        return 1;
    }

    std::optional<std::vector<tai::OHLCV>> bars;
    if (path == "-") {
        const std::string input{std::istreambuf_iterator<char>(std::cin),
                                std::istreambuf_iterator<char>()};
        bars = tai::DataLoader::parse_csv_string(input);
    } else {
        bars = tai::DataLoader::load_csv(path);
    }
    if (!bars) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", path);
        return 1;
    }
    if (bars->empty()) {
        fmt::print(stderr, "Error: no valid bars loaded from '{}'\n", path);
        return 1;
    }
    tai::log::info("loaded {} bars from '{}'", bars->size(), path);

    const tai::OhlcvColumns data = tai::to_columns(*bars);
    const auto frame = tai::catalog::compute(name, data, params);
    if (!frame) {
        fmt::print(stderr, "Error: {} could not be computed on {} bars\n",
                   name, bars->size());
        return 1;
    }

    print_frame(*frame, data);
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    if (std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0) {
        print_usage();
        return 0;
    }
    if (std::strcmp(argv[1], "--list") == 0) {
        print_list();
        return 0;
    }
    if (std::strcmp(argv[1], "--version") == 0) {
        fmt::print("tai {}\n{}\n", kVersion, tai::talib::version());
        return 0;
    }

    if (argc < 3) {
        fmt::print(stderr, "Error: {} requires a CSV file argument\n", argv[1]);
        return 1;
    }

    tai::catalog::ParamMap params;
    for (int i = 3; i < argc; ++i) {
        auto kv = tai::catalog::parse_assignment(argv[i]);
        if (!kv) {
            fmt::print(stderr, "Error: expected key=value, got '{}'\n", argv[i]);
            return 1;
        }
        if (kv->first == "log") {
            tai::log::set_level(tai::log::parse_level(kv->second));
            continue;
        }
        params.insert_or_assign(std::move(kv->first), std::move(kv->second));
    }

    return run_indicator(argv[1], argv[2], params);
}
