#pragma once

#include <cstddef>

/// @file include/tai/constants.hpp
/// @brief Documented parameter defaults for every indicator.
///
/// A parameter that is absent, non-positive or out of range is replaced by
/// the value here. Nothing is ever rejected.

namespace tai::constants {

// ─── Overlap ──────────────────────────────────────────────────────────────────

static constexpr int SMA_LENGTH  = 10;
static constexpr int EMA_LENGTH  = 10;
static constexpr int RMA_LENGTH  = 10;
static constexpr int FWMA_LENGTH = 10;

static constexpr int    T3_LENGTH = 10;
/// Tillson volume factor; must lie strictly inside (0, 1).
static constexpr double T3_A      = 0.7;

static constexpr int VIDYA_LENGTH = 14;

// ─── Momentum ─────────────────────────────────────────────────────────────────

static constexpr int    CMO_LENGTH = 14;
static constexpr double CMO_SCALAR = 100.0;

static constexpr int    ROC_LENGTH = 10;
static constexpr double ROC_SCALAR = 100.0;

static constexpr int    TSI_FAST   = 13;
static constexpr int    TSI_SLOW   = 25;
static constexpr int    TSI_SIGNAL = 13;
static constexpr double TSI_SCALAR = 100.0;

static constexpr int    SMI_FAST   = 5;
static constexpr int    SMI_SLOW   = 20;
static constexpr int    SMI_SIGNAL = 5;
static constexpr double SMI_SCALAR = 1.0;

static constexpr int PGO_LENGTH = 14;

// ─── Trend ────────────────────────────────────────────────────────────────────

static constexpr int DPO_LENGTH = 20;

// ─── Volume ───────────────────────────────────────────────────────────────────

static constexpr int    PVI_LENGTH  = 1;
static constexpr double PVI_INITIAL = 1000.0;
static constexpr int    NVI_LENGTH  = 1;
static constexpr double NVI_INITIAL = 1000.0;

// ─── Volatility ───────────────────────────────────────────────────────────────

static constexpr int    ATR_LENGTH   = 14;
static constexpr int    NATR_LENGTH  = 14;
static constexpr double NATR_SCALAR  = 100.0;
static constexpr int    BBANDS_LENGTH = 5;
static constexpr double BBANDS_STD    = 2.0;
static constexpr int    DONCHIAN_LENGTH = 20;
static constexpr int    UI_LENGTH    = 14;
static constexpr double UI_SCALAR    = 100.0;

static constexpr int    ABERRATION_LENGTH     = 5;
static constexpr int    ABERRATION_ATR_LENGTH = 15;
static constexpr int    ACCBANDS_LENGTH = 20;
/// Width factor applied to the normalised high-low range.
static constexpr double ACCBANDS_C      = 4.0;
static constexpr int    KC_LENGTH = 20;
static constexpr double KC_SCALAR = 2.0;

/// Holt-Winters smoothing weights for level, velocity, acceleration and
/// variance; each must lie in (0, 1].
static constexpr double HWC_NA     = 0.2;
static constexpr double HWC_NB     = 0.1;
static constexpr double HWC_NC     = 0.1;
static constexpr double HWC_ND     = 0.1;
static constexpr double HWC_SCALAR = 1.0;

static constexpr int    MASSI_FAST = 9;
static constexpr int    MASSI_SLOW = 25;
static constexpr int    RVI_LENGTH = 14;
static constexpr double RVI_SCALAR = 100.0;
static constexpr int    THERMO_LENGTH = 20;
static constexpr double THERMO_LONG   = 2.0;
static constexpr double THERMO_SHORT  = 0.5;

// ─── Shared ───────────────────────────────────────────────────────────────────

/// Default differencing lag.
static constexpr int DRIFT = 1;

/// Minimum correlation for the bundled and TA-Lib paths to count as equivalent.
static constexpr double CORRELATION_THRESHOLD = 0.99;

} // namespace tai::constants
