/// @file src/catalog/catalog.cpp
/// @brief Indicator registry and string-parameter dispatch.

#include "tai/catalog.hpp"

#include "tai/log.hpp"
#include "tai/momentum.hpp"
#include "tai/options.hpp"
#include "tai/overlap.hpp"
#include "tai/trend.hpp"
#include "tai/volatility.hpp"
#include "tai/volume.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace tai::catalog {

namespace {

// ─── Value parsing ────────────────────────────────────────────────────────────

std::optional<int> to_int(std::string_view s) noexcept {
    int value = 0;
    const auto* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    return value;
}

std::optional<double> to_double(std::string_view s) noexcept {
    if (s.empty()) return std::nullopt;
    const std::string buf(s);
    char* end = nullptr;
    const double value = std::strtod(buf.c_str(), &end);
    if (end != buf.c_str() + buf.size()) return std::nullopt;
    return value;
}

std::optional<bool> to_bool(std::string_view s) noexcept {
    std::string x(s);
    std::transform(x.begin(), x.end(), x.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (x == "true"  || x == "1" || x == "yes" || x == "on")  return true;
    if (x == "false" || x == "0" || x == "no"  || x == "off") return false;
    return std::nullopt;
}

enum class Kind { Int, Double, FiniteDouble, Bool, MaModeName, FillMethodName };

struct KeySpec {
    std::string_view key;
    Kind             kind;
};

constexpr std::array<KeySpec, 36> kKeys{{
    {"length", Kind::Int},        {"fast", Kind::Int},
    {"slow", Kind::Int},          {"signal", Kind::Int},
    {"drift", Kind::Int},         {"offset", Kind::Int},
    {"ddof", Kind::Int},          {"lower_length", Kind::Int},
    {"upper_length", Kind::Int},  {"atr_length", Kind::Int},
    {"a", Kind::Double},          {"scalar", Kind::Double},
    {"initial", Kind::Double},    {"std", Kind::Double},
    {"c", Kind::Double},          {"long", Kind::Double},
    {"short", Kind::Double},      {"na", Kind::Double},
    {"nb", Kind::Double},         {"nc", Kind::Double},
    {"nd", Kind::Double},
    {"fillna", Kind::FiniteDouble},
    {"asc", Kind::Bool},          {"centered", Kind::Bool},
    {"percent", Kind::Bool},      {"everget", Kind::Bool},
    {"tr", Kind::Bool},           {"channel_eval", Kind::Bool},
    {"refined", Kind::Bool},      {"thirds", Kind::Bool},
    {"talib", Kind::Bool},        {"presma", Kind::Bool},
    {"adjust", Kind::Bool},       {"lookahead", Kind::Bool},
    {"mamode", Kind::MaModeName}, {"fill_method", Kind::FillMethodName},
}};

/// First recognised key whose value does not parse as its kind.
std::optional<std::string> first_invalid(const ParamMap& params) noexcept {
    for (const auto& [key, value] : params) {
        const auto spec = std::find_if(kKeys.begin(), kKeys.end(),
                                       [&](const KeySpec& k) { return k.key == key; });
        if (spec == kKeys.end()) continue;

        bool ok = true;
        switch (spec->kind) {
            case Kind::Int:            ok = to_int(value).has_value();            break;
            case Kind::Double:         ok = to_double(value).has_value();         break;
            case Kind::FiniteDouble: {
                // A null fill value would leave the nulls it is meant to replace.
                const auto v = to_double(value);
                ok = v && std::isfinite(*v);
                break;
            }
            case Kind::Bool:           ok = to_bool(value).has_value();           break;
            case Kind::MaModeName:     ok = parse_ma_mode(value).has_value();     break;
            case Kind::FillMethodName: ok = parse_fill_method(value).has_value(); break;
        }
        if (!ok) return key;
    }
    return std::nullopt;
}

/// Typed reads over an already-validated ParamMap.
class Reader {
public:
    explicit Reader(const ParamMap& params) noexcept : params_(params) {}

    [[nodiscard]] int get(std::string_view key, int fallback) const noexcept {
        const auto it = params_.find(key);
        return it == params_.end() ? fallback : to_int(it->second).value_or(fallback);
    }

    [[nodiscard]] double get(std::string_view key, double fallback) const noexcept {
        const auto it = params_.find(key);
        return it == params_.end() ? fallback : to_double(it->second).value_or(fallback);
    }

    [[nodiscard]] bool get(std::string_view key, bool fallback) const noexcept {
        const auto it = params_.find(key);
        return it == params_.end() ? fallback : to_bool(it->second).value_or(fallback);
    }

    [[nodiscard]] MaMode get(std::string_view key, MaMode fallback) const noexcept {
        const auto it = params_.find(key);
        return it == params_.end() ? fallback : parse_ma_mode(it->second).value_or(fallback);
    }

    [[nodiscard]] Options options() const noexcept {
        Options opts;
        opts.offset    = get("offset", opts.offset);
        opts.talib     = get("talib", opts.talib);
        opts.presma    = get("presma", opts.presma);
        opts.adjust    = get("adjust", opts.adjust);
        opts.lookahead = get("lookahead", opts.lookahead);
        if (const auto it = params_.find("fillna"); it != params_.end()) {
            opts.fillna = to_double(it->second);
        }
        if (const auto it = params_.find("fill_method"); it != params_.end()) {
            opts.fill_method = parse_fill_method(it->second);
        }
        return opts;
    }

private:
    const ParamMap& params_;
};

// ─── Registry ─────────────────────────────────────────────────────────────────

using Runner = std::optional<Frame> (*)(const OhlcvColumns&, const Reader&,
                                        const Options&) noexcept;

struct Definition {
    Entry  entry;
    Runner run;
};

std::optional<Frame> single(std::optional<Series> s) noexcept {
    if (!s) return std::nullopt;
    Frame frame{.name = s->name, .category = s->category, .columns = {}};
    frame.columns.push_back(std::move(*s));
    return frame;
}

const std::array<Definition, 28>& definitions() noexcept {
    static const std::array<Definition, 28> defs{{
        // overlap
        {{"sma", Category::Overlap, "Simple Moving Average"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(sma(d.close, {.length = r.get("length", constants::SMA_LENGTH)}, o));
         }},
        {{"ema", Category::Overlap, "Exponential Moving Average"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(ema(d.close, {.length = r.get("length", constants::EMA_LENGTH)}, o));
         }},
        {{"rma", Category::Overlap, "Wilder's Moving Average"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(rma(d.close, {.length = r.get("length", constants::RMA_LENGTH)}, o));
         }},
        {{"fwma", Category::Overlap, "Fibonacci's Weighted Moving Average"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(fwma(d.close, {.length = r.get("length", constants::FWMA_LENGTH),
                                          .asc    = r.get("asc", true)}, o));
         }},
        {{"t3", Category::Overlap, "Tim Tillson's T3 Moving Average"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(t3(d.close, {.length = r.get("length", constants::T3_LENGTH),
                                        .a      = r.get("a", constants::T3_A)}, o));
         }},
        {{"vidya", Category::Overlap, "Variable Index Dynamic Average"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(vidya(d.close, {.length = r.get("length", constants::VIDYA_LENGTH),
                                           .drift  = r.get("drift", constants::DRIFT)}, o));
         }},
        // momentum
        {{"cmo", Category::Momentum, "Chande Momentum Oscillator"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(cmo(d.close, {.length = r.get("length", constants::CMO_LENGTH),
                                         .scalar = r.get("scalar", constants::CMO_SCALAR),
                                         .drift  = r.get("drift", constants::DRIFT)}, o));
         }},
        {{"roc", Category::Momentum, "Rate of Change"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(roc(d.close, {.length = r.get("length", constants::ROC_LENGTH),
                                         .scalar = r.get("scalar", constants::ROC_SCALAR)}, o));
         }},
        {{"tsi", Category::Momentum, "True Strength Index"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return tsi(d.close, {.fast   = r.get("fast", constants::TSI_FAST),
                                  .slow   = r.get("slow", constants::TSI_SLOW),
                                  .signal = r.get("signal", constants::TSI_SIGNAL),
                                  .scalar = r.get("scalar", constants::TSI_SCALAR),
                                  .drift  = r.get("drift", constants::DRIFT)}, o);
         }},
        {{"smi", Category::Momentum, "SMI Ergodic Indicator"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return smi(d.close, {.fast   = r.get("fast", constants::SMI_FAST),
                                  .slow   = r.get("slow", constants::SMI_SLOW),
                                  .signal = r.get("signal", constants::SMI_SIGNAL),
                                  .scalar = r.get("scalar", constants::SMI_SCALAR)}, o);
         }},
        {{"pgo", Category::Momentum, "Pretty Good Oscillator"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(pgo(d.high, d.low, d.close,
                               {.length = r.get("length", constants::PGO_LENGTH)}, o));
         }},
        // trend
        {{"dpo", Category::Trend, "Detrended Price Oscillator"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(dpo(d.close, {.length   = r.get("length", constants::DPO_LENGTH),
                                         .centered = r.get("centered", true)}, o));
         }},
        // volume
        {{"pvi", Category::Volume, "Positive Volume Index"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(pvi(d.close, d.volume,
                               {.length  = r.get("length", constants::PVI_LENGTH),
                                .initial = r.get("initial", constants::PVI_INITIAL)}, o));
         }},
        {{"nvi", Category::Volume, "Negative Volume Index"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(nvi(d.close, d.volume,
                               {.length  = r.get("length", constants::NVI_LENGTH),
                                .initial = r.get("initial", constants::NVI_INITIAL)}, o));
         }},
        // volatility
        {{"true_range", Category::Volatility, "True Range"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(true_range(d.high, d.low, d.close,
                                      {.drift = r.get("drift", constants::DRIFT)}, o));
         }},
        {{"atr", Category::Volatility, "Average True Range"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(atr(d.high, d.low, d.close,
                               {.length  = r.get("length", constants::ATR_LENGTH),
                                .mamode  = r.get("mamode", MaMode::Rma),
                                .drift   = r.get("drift", constants::DRIFT),
                                .percent = r.get("percent", false)}, o));
         }},
        {{"natr", Category::Volatility, "Normalized Average True Range"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(natr(d.high, d.low, d.close,
                                {.length = r.get("length", constants::NATR_LENGTH),
                                 .scalar = r.get("scalar", constants::NATR_SCALAR),
                                 .mamode = r.get("mamode", MaMode::Ema),
                                 .drift  = r.get("drift", constants::DRIFT)}, o));
         }},
        {{"bbands", Category::Volatility, "Bollinger Bands"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return bbands(d.close, {.length = r.get("length", constants::BBANDS_LENGTH),
                                     .stddev = r.get("std", constants::BBANDS_STD),
                                     .ddof   = r.get("ddof", 0),
                                     .mamode = r.get("mamode", MaMode::Sma)}, o);
         }},
        {{"donchian", Category::Volatility, "Donchian Channels"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return donchian(d.high, d.low,
                             {.lower_length = r.get("lower_length", constants::DONCHIAN_LENGTH),
                              .upper_length = r.get("upper_length", constants::DONCHIAN_LENGTH)}, o);
         }},
        {{"ui", Category::Volatility, "Ulcer Index"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(ui(d.close, {.length  = r.get("length", constants::UI_LENGTH),
                                        .scalar  = r.get("scalar", constants::UI_SCALAR),
                                        .everget = r.get("everget", false)}, o));
         }},
        {{"pdist", Category::Volatility, "Price Distance"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(pdist(d.open, d.high, d.low, d.close,
                                 {.drift = r.get("drift", constants::DRIFT)}, o));
         }},
        {{"aberration", Category::Volatility, "Aberration"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return aberration(d.high, d.low, d.close,
                               {.length     = r.get("length", constants::ABERRATION_LENGTH),
                                .atr_length = r.get("atr_length",
                                                    constants::ABERRATION_ATR_LENGTH)}, o);
         }},
        {{"accbands", Category::Volatility, "Acceleration Bands"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return accbands(d.high, d.low, d.close,
                             {.length = r.get("length", constants::ACCBANDS_LENGTH),
                              .c      = r.get("c", constants::ACCBANDS_C),
                              .mamode = r.get("mamode", MaMode::Sma)}, o);
         }},
        {{"kc", Category::Volatility, "Keltner Channels"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return kc(d.high, d.low, d.close,
                       {.length = r.get("length", constants::KC_LENGTH),
                        .scalar = r.get("scalar", constants::KC_SCALAR),
                        .mamode = r.get("mamode", MaMode::Ema),
                        .tr     = r.get("tr", true)}, o);
         }},
        {{"hwc", Category::Volatility, "Holt-Winters Channel"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return hwc(d.close, {.na           = r.get("na", constants::HWC_NA),
                                  .nb           = r.get("nb", constants::HWC_NB),
                                  .nc           = r.get("nc", constants::HWC_NC),
                                  .nd           = r.get("nd", constants::HWC_ND),
                                  .scalar       = r.get("scalar", constants::HWC_SCALAR),
                                  .channel_eval = r.get("channel_eval", false)}, o);
         }},
        {{"massi", Category::Volatility, "Mass Index"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(massi(d.high, d.low,
                                 {.fast = r.get("fast", constants::MASSI_FAST),
                                  .slow = r.get("slow", constants::MASSI_SLOW)}, o));
         }},
        {{"rvi", Category::Volatility, "Relative Volatility Index"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return single(rvi(d.close, d.high, d.low,
                               {.length  = r.get("length", constants::RVI_LENGTH),
                                .scalar  = r.get("scalar", constants::RVI_SCALAR),
                                .refined = r.get("refined", false),
                                .thirds  = r.get("thirds", false),
                                .mamode  = r.get("mamode", MaMode::Ema),
                                .drift   = r.get("drift", constants::DRIFT)}, o));
         }},
        {{"thermo", Category::Volatility, "Elder's Thermometer"},
         [](const OhlcvColumns& d, const Reader& r, const Options& o) noexcept {
             return thermo(d.high, d.low,
                           {.length       = r.get("length", constants::THERMO_LENGTH),
                            .long_factor  = r.get("long", constants::THERMO_LONG),
                            .short_factor = r.get("short", constants::THERMO_SHORT),
                            .mamode       = r.get("mamode", MaMode::Ema),
                            .drift        = r.get("drift", constants::DRIFT)}, o);
         }},
    }};
    return defs;
}

} // namespace

// ─── Public API ───────────────────────────────────────────────────────────────

const std::vector<Entry>& entries() noexcept {
    static const std::vector<Entry> list = [] {
        std::vector<Entry> out;
        for (const auto& def : definitions()) out.push_back(def.entry);
        return out;
    }();
    return list;
}

const Entry* find(std::string_view name) noexcept {
    for (const auto& e : entries()) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

std::optional<Frame>
compute(std::string_view name, const OhlcvColumns& data,
        const ParamMap& params) noexcept {
    const auto& defs = definitions();
    const auto def = std::find_if(defs.begin(), defs.end(),
                                  [&](const Definition& d) { return d.entry.name == name; });
    if (def == defs.end()) {
        log::warn("unknown indicator '{}'", name);
        return std::nullopt;
    }

    if (const auto bad = first_invalid(params)) {
        log::warn("{}: cannot parse {}={}", name, *bad, params.find(*bad)->second);
        return std::nullopt;
    }

    const Reader reader(params);
    return def->run(data, reader, reader.options());
}

std::optional<std::pair<std::string, std::string>>
parse_assignment(std::string_view text) noexcept {
    const auto eq = text.find('=');
    if (eq == std::string_view::npos || eq == 0) return std::nullopt;
    return std::pair<std::string, std::string>{std::string(text.substr(0, eq)),
                                               std::string(text.substr(eq + 1))};
}

} // namespace tai::catalog
