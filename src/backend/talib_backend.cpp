/**
 * @file  talib_backend.cpp
 * @brief TA-Lib backed implementations of tai::talib.
 *
 * Module:  src/backend/
 *
 * Linked only when CMake finds ta_libc.h and the ta-lib library. Every entry
 * point runs the TA-Lib function over [0, size−1] and realigns the result:
 *
 *       out[outBegIdx + i] = buf[i],  i < outNBElement
 *
 * so the leading lookback positions read as null, the same way the bundled
 * indicators report their warm-up.
 *
 * TA_Initialize is called once, on first use, by a function-local static
 * whose destructor calls TA_Shutdown at process exit.
 */

#include "tai/talib.hpp"
#include "tai/types.hpp"

#include <ta_libc.h>

#include <fmt/format.h>

#include <string>

namespace tai::talib {

// ── Library lifetime ─────────────────────────────────────────────────────────

namespace {

class Session {
public:
    Session() noexcept : ok_(TA_Initialize() == TA_SUCCESS) {
        if (ok_) {
            version_ = fmt::format("TA-Lib {}.{}.{}", TA_GetVersionMajor(),
                                   TA_GetVersionMinor(), TA_GetVersionBuild());
        }
    }
    ~Session() {
        if (ok_) TA_Shutdown();
    }
    Session(const Session&)            = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] bool ok() const noexcept { return ok_; }
    [[nodiscard]] const std::string& version() const noexcept { return version_; }

private:
    bool        ok_;
    std::string version_ = "TA-Lib failed to initialise";
};

[[nodiscard]] const Session& session() noexcept {
    static const Session s;
    return s;
}

[[nodiscard]] int last_index(std::size_t n) noexcept {
    return static_cast<int>(n) - 1;
}

/// Scatter a TA-Lib output buffer back onto the input positions.
[[nodiscard]] Column realign(const std::vector<double>& buf, std::size_t n,
                             int beg, int count) {
    Column out(n, NaN);
    for (int i = 0; i < count; ++i) {
        const auto at = static_cast<std::size_t>(beg + i);
        if (at < n) out[at] = buf[static_cast<std::size_t>(i)];
    }
    return out;
}

/// Shared driver for the single-input, single-output functions.
template <typename Fn>
[[nodiscard]] std::optional<Column> run_single(std::span<const double> x, Fn fn) noexcept {
    if (!session().ok() || x.empty()) return std::nullopt;
    std::vector<double> buf(x.size(), NaN);
    int beg = 0, count = 0;
    if (fn(x.data(), &beg, &count, buf.data()) != TA_SUCCESS) {
        return std::nullopt;
    }
    return realign(buf, x.size(), beg, count);
}

[[nodiscard]] bool aligned(std::span<const double> high,
                           std::span<const double> low,
                           std::span<const double> close) noexcept {
    return !close.empty() && high.size() == close.size() && low.size() == close.size();
}

} // anonymous namespace

// ── Status ───────────────────────────────────────────────────────────────────

bool available() noexcept { return session().ok(); }

const char* version() noexcept { return session().version().c_str(); }

// ── Single-series functions ──────────────────────────────────────────────────

std::optional<Column> sma(std::span<const double> close, int length) noexcept {
    return run_single(close, [&](const double* in, int* beg, int* count, double* out) {
        return TA_SMA(0, last_index(close.size()), in, length, beg, count, out);
    });
}

std::optional<Column> ema(std::span<const double> close, int length) noexcept {
    return run_single(close, [&](const double* in, int* beg, int* count, double* out) {
        return TA_EMA(0, last_index(close.size()), in, length, beg, count, out);
    });
}

std::optional<Column> t3(std::span<const double> close, int length, double a) noexcept {
    return run_single(close, [&](const double* in, int* beg, int* count, double* out) {
        return TA_T3(0, last_index(close.size()), in, length, a, beg, count, out);
    });
}

std::optional<Column> cmo(std::span<const double> close, int length) noexcept {
    return run_single(close, [&](const double* in, int* beg, int* count, double* out) {
        return TA_CMO(0, last_index(close.size()), in, length, beg, count, out);
    });
}

std::optional<Column> roc(std::span<const double> close, int length) noexcept {
    return run_single(close, [&](const double* in, int* beg, int* count, double* out) {
        return TA_ROC(0, last_index(close.size()), in, length, beg, count, out);
    });
}

// ── High / low / close functions ─────────────────────────────────────────────

std::optional<Column> trange(std::span<const double> high,
                             std::span<const double> low,
                             std::span<const double> close) noexcept {
    if (!aligned(high, low, close)) return std::nullopt;
    return run_single(close, [&](const double* in, int* beg, int* count, double* out) {
        return TA_TRANGE(0, last_index(close.size()), high.data(), low.data(), in,
                         beg, count, out);
    });
}

std::optional<Column> atr(std::span<const double> high,
                          std::span<const double> low,
                          std::span<const double> close,
                          int length) noexcept {
    if (!aligned(high, low, close)) return std::nullopt;
    return run_single(close, [&](const double* in, int* beg, int* count, double* out) {
        return TA_ATR(0, last_index(close.size()), high.data(), low.data(), in,
                      length, beg, count, out);
    });
}

std::optional<Column> natr(std::span<const double> high,
                           std::span<const double> low,
                           std::span<const double> close,
                           int length) noexcept {
    if (!aligned(high, low, close)) return std::nullopt;
    return run_single(close, [&](const double* in, int* beg, int* count, double* out) {
        return TA_NATR(0, last_index(close.size()), high.data(), low.data(), in,
                       length, beg, count, out);
    });
}

// ── Bollinger Bands ──────────────────────────────────────────────────────────

std::optional<std::array<Column, 3>>
bbands(std::span<const double> close, int length, double nbdev) noexcept {
    if (!session().ok() || close.empty()) return std::nullopt;

    const std::size_t n = close.size();
    std::vector<double> upper(n, NaN), middle(n, NaN), lower(n, NaN);
    int beg = 0, count = 0;
    const TA_RetCode rc = TA_BBANDS(0, last_index(n), close.data(), length,
                                    nbdev, nbdev, TA_MAType_SMA,
                                    &beg, &count,
                                    upper.data(), middle.data(), lower.data());
    if (rc != TA_SUCCESS) return std::nullopt;

    return std::array<Column, 3>{realign(lower, n, beg, count),
                                 realign(middle, n, beg, count),
                                 realign(upper, n, beg, count)};
}

} // namespace tai::talib
