/**
 * @file  talib_absent.cpp
 * @brief tai::talib when the library was built without TA-Lib.
 *
 * Module:  src/backend/
 *
 * Every entry point reports "no result" so indicators take their bundled
 * path. Keeping the symbols present means callers never need a
 * preprocessor check.
 */

#include "tai/talib.hpp"

namespace tai::talib {

bool available() noexcept { return false; }

const char* version() noexcept { return "TA-Lib not available"; }

std::optional<Column> sma(std::span<const double>, int) noexcept { return std::nullopt; }
std::optional<Column> ema(std::span<const double>, int) noexcept { return std::nullopt; }
std::optional<Column> t3(std::span<const double>, int, double) noexcept { return std::nullopt; }
std::optional<Column> cmo(std::span<const double>, int) noexcept { return std::nullopt; }
std::optional<Column> roc(std::span<const double>, int) noexcept { return std::nullopt; }

std::optional<Column> trange(std::span<const double>, std::span<const double>,
                             std::span<const double>) noexcept {
    return std::nullopt;
}

std::optional<Column> atr(std::span<const double>, std::span<const double>,
                          std::span<const double>, int) noexcept {
    return std::nullopt;
}

std::optional<Column> natr(std::span<const double>, std::span<const double>,
                           std::span<const double>, int) noexcept {
    return std::nullopt;
}

std::optional<std::array<Column, 3>>
bbands(std::span<const double>, int, double) noexcept {
    return std::nullopt;
}

} // namespace tai::talib
