/// @file src/core/data_loader.cpp
/// @brief Header-driven CSV loader for OHLCV bars.

#include "tai/data_loader.hpp"
#include "tai/log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace tai {

namespace {

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n\"");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n\"");
    return s.substr(first, last - first + 1);
}

std::vector<std::string_view> split_fields(std::string_view line) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            out.push_back(trim(line.substr(start)));
            break;
        }
        out.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return out;
}

std::string lowered(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// strtod with a full-token match; no exceptions on garbage.
std::optional<double> to_number(std::string_view token) {
    if (token.empty()) return std::nullopt;
    const std::string buf(token);
    char* end = nullptr;
    const double val = std::strtod(buf.c_str(), &end);
    if (end != buf.c_str() + buf.size()) return std::nullopt;
    return val;
}

std::optional<double> field_at(const std::vector<std::string_view>& fields,
                               int pos) {
    if (pos < 0 || static_cast<std::size_t>(pos) >= fields.size()) {
        return std::nullopt;
    }
    return to_number(fields[static_cast<std::size_t>(pos)]);
}

} // namespace

// ─── DataLoader::validate_bar ─────────────────────────────────────────────────

bool DataLoader::validate_bar(const OHLCV& bar) noexcept {
    const double fields[] = {bar.timestamp, bar.open, bar.high,
                             bar.low, bar.close, bar.volume};
    for (double f : fields) {
        if (!std::isfinite(f)) return false;
    }

    if (bar.high < bar.low) return false;
    if (bar.open  < bar.low || bar.open  > bar.high) return false;
    if (bar.close < bar.low || bar.close > bar.high) return false;

    return bar.volume >= 0.0;
}

// ─── DataLoader::parse_header ─────────────────────────────────────────────────

std::optional<CsvLayout>
DataLoader::parse_header(std::string_view line) noexcept {
    CsvLayout layout{-1, -1, -1, -1, -1, -1};
    const auto fields = split_fields(line);

    for (std::size_t i = 0; i < fields.size(); ++i) {
        const std::string name = lowered(fields[i]);
        const int pos = static_cast<int>(i);
        if (name == "timestamp" || name == "date" || name == "time" ||
            name == "datetime") {
            if (layout.timestamp < 0) layout.timestamp = pos;
        } else if (name == "open"   || name == "o") layout.open   = pos;
        else if   (name == "high"   || name == "h") layout.high   = pos;
        else if   (name == "low"    || name == "l") layout.low    = pos;
        else if   (name == "close"  || name == "c") layout.close  = pos;
        else if   (name == "volume" || name == "v") layout.volume = pos;
    }

    if (layout.open < 0 && layout.high < 0 && layout.low < 0 &&
        layout.close < 0) {
        return std::nullopt;
    }
    return layout;
}

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<OHLCV>
DataLoader::parse_row(std::string_view line, const CsvLayout& layout,
                      double ordinal) noexcept {
    if (trim(line).empty() || line.front() == '#') {
        return std::nullopt;
    }

    const auto fields = split_fields(line);
    const auto open  = field_at(fields, layout.open);
    const auto high  = field_at(fields, layout.high);
    const auto low   = field_at(fields, layout.low);
    const auto close = field_at(fields, layout.close);
    if (!open || !high || !low || !close) {
        return std::nullopt;
    }

    double volume = 0.0;
    if (layout.volume >= 0) {
        const auto v = field_at(fields, layout.volume);
        if (!v) return std::nullopt;
        volume = *v;
    }

    OHLCV bar{
        .timestamp = field_at(fields, layout.timestamp).value_or(ordinal),
        .open      = *open,
        .high      = *high,
        .low       = *low,
        .close     = *close,
        .volume    = volume,
    };

    if (!validate_bar(bar)) {
        return std::nullopt;
    }
    return bar;
}

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

std::vector<OHLCV>
DataLoader::parse_csv_string(const std::string& csv_content) noexcept {
    std::vector<OHLCV> bars;
    std::istringstream stream(csv_content);
    std::string line;
    std::optional<CsvLayout> layout;
    std::size_t skipped = 0;
    double ordinal = 0.0;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty() || line.front() == '#') {
            continue;
        }

        if (!layout) {
            // First content line: a header if it names price columns,
            // otherwise data in the default positional layout.
            layout = parse_header(line);
            if (layout && layout->usable()) {
                continue;
            }
            layout = CsvLayout{};
        }

        if (auto bar = parse_row(line, *layout, ordinal)) {
            bars.push_back(*bar);
            ordinal += 1.0;
        } else {
            ++skipped;
        }
    }

    if (skipped > 0) {
        log::debug("csv: skipped {} malformed row(s), kept {}", skipped, bars.size());
    }
    return bars;
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

std::optional<std::vector<OHLCV>>
DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        log::debug("csv: cannot open '{}'", filepath);
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

} // namespace tai
