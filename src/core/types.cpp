/// @file src/core/types.cpp
/// @brief Series / Frame helpers and the bar-to-column transpose.

#include "tai/options.hpp"
#include "tai/types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace tai {

// ─── Category ─────────────────────────────────────────────────────────────────

const char* to_string(Category c) noexcept {
    switch (c) {
        case Category::Momentum:   return "momentum";
        case Category::Overlap:    return "overlap";
        case Category::Trend:      return "trend";
        case Category::Volume:     return "volume";
        case Category::Volatility: return "volatility";
    }
    return "unknown";
}

// ─── Series / Frame ───────────────────────────────────────────────────────────

std::size_t Series::null_count() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(values.begin(), values.end(),
                      [](double v) { return is_null(v); }));
}

const Series* Frame::find(std::string_view label) const noexcept {
    for (const auto& col : columns) {
        if (col.name == label) return &col;
    }
    return nullptr;
}

std::size_t Frame::rows() const noexcept {
    return columns.empty() ? 0 : columns.front().size();
}

// ─── to_columns ───────────────────────────────────────────────────────────────

OhlcvColumns to_columns(std::span<const OHLCV> bars) {
    OhlcvColumns out;
    out.timestamp.reserve(bars.size());
    out.open.reserve(bars.size());
    out.high.reserve(bars.size());
    out.low.reserve(bars.size());
    out.close.reserve(bars.size());
    out.volume.reserve(bars.size());
    for (const auto& b : bars) {
        out.timestamp.push_back(b.timestamp);
        out.open.push_back(b.open);
        out.high.push_back(b.high);
        out.low.push_back(b.low);
        out.close.push_back(b.close);
        out.volume.push_back(b.volume);
    }
    return out;
}

// ─── FillMethod ───────────────────────────────────────────────────────────────

std::optional<FillMethod> parse_fill_method(std::string_view name) noexcept {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "ffill" || lower == "pad")      return FillMethod::Forward;
    if (lower == "bfill" || lower == "backfill") return FillMethod::Backward;
    return std::nullopt;
}

const char* to_string(FillMethod m) noexcept {
    switch (m) {
        case FillMethod::Forward:  return "ffill";
        case FillMethod::Backward: return "bfill";
    }
    return "unknown";
}

} // namespace tai
