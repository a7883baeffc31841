#pragma once

/// @file include/tai/volatility.hpp
/// @brief Volatility indicators: ranges, bands and channels.
///
/// # Module: Volatility
///
/// | Function   | Output                                   |
/// |------------|------------------------------------------|
/// | true_range | TRUERANGE_{d}                            |
/// | atr        | ATR{m}_{n}  (m = r/e/s, "p" if percent)  |
/// | natr       | NATR_{n}                                 |
/// | bbands     | BBL/BBM/BBU/BBB/BBP_{n}_{std}            |
/// | donchian   | DCL/DCM/DCU_{lower}_{upper}              |
/// | ui         | UI_{n} or UIe_{n}                        |
/// | pdist      | PDIST                                    |
/// | aberration | ABER_ZG/SG/XG/ATR_{n}_{atr}              |
/// | accbands   | ACCBL/ACCBM/ACCBU_{n}                    |
/// | kc         | KCL/KCB/KCU{m}_{n}_{scalar}              |
/// | hwc        | HWM/HWU/HWL (+HWW/HWPCT)_{scalar}        |
/// | massi      | MASSI_{fast}_{slow}                      |
/// | rvi        | RVI_{n}, RVIr_{n} or RVIt_{n}            |
/// | thermo     | THERMO/THERMOma/THERMOl/THERMOs_{n}_{l}_{s} |
///
/// Channel labels print `scalar`, `long` and `short` in shortest form
/// ("KCe_20_2", "THERMO_20_2_0.5"); Bollinger keeps the decimal point.

#include "tai/constants.hpp"
#include "tai/options.hpp"
#include "tai/types.hpp"

#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace tai {

/// Moving-average flavour used to smooth a range series.
enum class MaMode {
    Rma,
    Ema,
    Sma,
};

/// Parse "rma", "ema" or "sma". Returns nullopt for anything else.
[[nodiscard]] std::optional<MaMode> parse_ma_mode(std::string_view name) noexcept;

[[nodiscard]] const char* to_string(MaMode mode) noexcept;

/// Smooth `x` over `length` with the given flavour. Ema honours
/// `opts.presma` and `opts.adjust`; Rma is Wilder's SMA-seeded recursion when
/// `opts.presma` is set.
[[nodiscard]] std::vector<double> ma_values(std::span<const double> x, int length,
                                            MaMode mode, const Options& opts) noexcept;

struct TrueRangeParams {
    int drift = constants::DRIFT;
};

struct AtrParams {
    int    length  = constants::ATR_LENGTH;
    MaMode mamode  = MaMode::Rma;
    int    drift   = constants::DRIFT;
    bool   percent = false;  ///< Express ATR as a percentage of close
};

struct NatrParams {
    int    length = constants::NATR_LENGTH;
    double scalar = constants::NATR_SCALAR;
    MaMode mamode = MaMode::Ema;
    int    drift  = constants::DRIFT;
};

struct BbandsParams {
    int    length = constants::BBANDS_LENGTH;
    double stddev = constants::BBANDS_STD;  ///< Band width in standard deviations
    int    ddof   = 0;                      ///< 0 = population, 1 = sample
    MaMode mamode = MaMode::Sma;
};

struct DonchianParams {
    int lower_length = constants::DONCHIAN_LENGTH;
    int upper_length = constants::DONCHIAN_LENGTH;
};

struct UiParams {
    int    length  = constants::UI_LENGTH;
    double scalar  = constants::UI_SCALAR;
    bool   everget = false;  ///< Everget's variant: SMA in place of the sum
};

struct PdistParams {
    int drift = constants::DRIFT;
};

struct AberrationParams {
    int length     = constants::ABERRATION_LENGTH;      ///< SMA of the typical price
    int atr_length = constants::ABERRATION_ATR_LENGTH;
};

struct AccbandsParams {
    int    length = constants::ACCBANDS_LENGTH;
    double c      = constants::ACCBANDS_C;
    MaMode mamode = MaMode::Sma;
};

struct KcParams {
    int    length = constants::KC_LENGTH;
    double scalar = constants::KC_SCALAR;
    MaMode mamode = MaMode::Ema;
    bool   tr     = true;  ///< Band on true range; false uses high − low
};

struct HwcParams {
    double na     = constants::HWC_NA;
    double nb     = constants::HWC_NB;
    double nc     = constants::HWC_NC;
    double nd     = constants::HWC_ND;
    double scalar = constants::HWC_SCALAR;
    bool   channel_eval = false;  ///< Also emit channel width and position
};

struct MassiParams {
    int fast = constants::MASSI_FAST;
    int slow = constants::MASSI_SLOW;
};

struct RviParams {
    int    length  = constants::RVI_LENGTH;
    double scalar  = constants::RVI_SCALAR;
    bool   refined = false;  ///< Mean of the high and low RVIs
    bool   thirds  = false;  ///< Mean of the high, low and close RVIs
    MaMode mamode  = MaMode::Ema;
    int    drift   = constants::DRIFT;
};

struct ThermoParams {
    int    length = constants::THERMO_LENGTH;
    double long_factor  = constants::THERMO_LONG;   ///< Long signal below ma · factor
    double short_factor = constants::THERMO_SHORT;  ///< Short signal above ma · factor
    MaMode mamode = MaMode::Ema;
    int    drift  = constants::DRIFT;
};

/// True Range: max(h − l, |h − c[−d]|, |c[−d] − l|); first `drift` null.
/// TA-Lib path: TA_TRANGE (drift 1 only).
[[nodiscard]] std::optional<Series>
true_range(std::span<const double> high, std::span<const double> low,
           std::span<const double> close, TrueRangeParams params = {},
           const Options& opts = {}) noexcept;

/// Average True Range. The Wilder (rma) form is seeded with the mean of the
/// first `length` true ranges when `opts.presma` is set. TA-Lib path: TA_ATR
/// (rma only).
[[nodiscard]] std::optional<Series>
atr(std::span<const double> high, std::span<const double> low,
    std::span<const double> close, AtrParams params = {},
    const Options& opts = {}) noexcept;

/// Normalized ATR: scalar · ATR / close. TA-Lib path: TA_NATR (rma only).
[[nodiscard]] std::optional<Series>
natr(std::span<const double> high, std::span<const double> low,
     std::span<const double> close, NatrParams params = {},
     const Options& opts = {}) noexcept;

/// Bollinger Bands: lower, mid, upper, bandwidth (%), percent-b.
/// TA-Lib path: TA_BBANDS (sma, ddof 0).
[[nodiscard]] std::optional<Frame>
bbands(std::span<const double> close, BbandsParams params = {},
       const Options& opts = {}) noexcept;

/// Donchian Channels: rolling low minimum, midpoint, rolling high maximum.
[[nodiscard]] std::optional<Frame>
donchian(std::span<const double> high, std::span<const double> low,
         DonchianParams params = {}, const Options& opts = {}) noexcept;

/// Ulcer Index: RMS of percentage drawdowns from the rolling close maximum.
[[nodiscard]] std::optional<Series>
ui(std::span<const double> close, UiParams params = {},
   const Options& opts = {}) noexcept;

/// Price Distance: 2(h − l) + |o − c[−d]| − |c − o|.
[[nodiscard]] std::optional<Series>
pdist(std::span<const double> open, std::span<const double> high,
      std::span<const double> low, std::span<const double> close,
      PdistParams params = {}, const Options& opts = {}) noexcept;

// ─── Channels ─────────────────────────────────────────────────────────────────

/// Aberration: SMA of hlc3 (ZG) with ATR above (SG) and below (XG), plus the
/// ATR itself.
[[nodiscard]] std::optional<Frame>
aberration(std::span<const double> high, std::span<const double> low,
           std::span<const double> close, AberrationParams params = {},
           const Options& opts = {}) noexcept;

/// Acceleration Bands: smoothed low·(1 − r), close and high·(1 + r) with
/// r = c·(h − l)/(h + l).
[[nodiscard]] std::optional<Frame>
accbands(std::span<const double> high, std::span<const double> low,
         std::span<const double> close, AccbandsParams params = {},
         const Options& opts = {}) noexcept;

/// Keltner Channels: smoothed close ± scalar · smoothed range.
[[nodiscard]] std::optional<Frame>
kc(std::span<const double> high, std::span<const double> low,
   std::span<const double> close, KcParams params = {},
   const Options& opts = {}) noexcept;

/// Holt-Winters Channel: triple exponential level/velocity/acceleration fit
/// with a band of `scalar` smoothed deviations. Weights outside (0, 1] fall
/// back to their defaults.
[[nodiscard]] std::optional<Frame>
hwc(std::span<const double> close, HwcParams params = {},
    const Options& opts = {}) noexcept;

// ─── Dispersion ───────────────────────────────────────────────────────────────

/// Mass Index: rolling `slow` sum of EMA(h − l) / EMA(EMA(h − l)), both over
/// `fast`. The lengths are swapped when slow < fast.
[[nodiscard]] std::optional<Series>
massi(std::span<const double> high, std::span<const double> low,
      MassiParams params = {}, const Options& opts = {}) noexcept;

/// Relative Volatility Index: RSI-style ratio of the standard deviation on
/// up moves to that on all moves. `refined` and `thirds` need `high` and
/// `low` aligned with `close`; pass empty spans otherwise.
[[nodiscard]] std::optional<Series>
rvi(std::span<const double> close, std::span<const double> high,
    std::span<const double> low, RviParams params = {},
    const Options& opts = {}) noexcept;

/// Elder's Thermometer: the larger of the drift-moves of the high and low,
/// its moving average, and 0/1 long and short signals against it.
[[nodiscard]] std::optional<Frame>
thermo(std::span<const double> high, std::span<const double> low,
       ThermoParams params = {}, const Options& opts = {}) noexcept;

} // namespace tai
