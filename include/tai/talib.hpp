#pragma once

/// @file include/tai/talib.hpp
/// @brief Optional TA-Lib reference backend.
///
/// # Module: TA-Lib backend
///
/// ## Responsibility
/// Expose the TA-Lib implementations of the indicators that have one, with
/// outputs realigned to the input length (TA-Lib returns only the valid
/// tail; the leading `outBegIdx` positions are filled with null here).
///
/// ## Path selection
/// The backend is chosen when the library is built: `src/backend/talib_backend.cpp`
/// when CMake finds `ta_libc.h` and the `ta-lib` library, otherwise
/// `src/backend/talib_absent.cpp`. Callers check `available()` and fall back
/// to the bundled computation whenever an entry point returns `nullopt`,
/// so indicator semantics never depend on which file was linked.
///
/// ## Guarantees
/// - All functions are noexcept
/// - A returned vector always has the input length
/// - `nullopt` on a TA-Lib error code, on absent backend, or on mismatched
///   input lengths

#include <array>
#include <optional>
#include <span>
#include <vector>

namespace tai::talib {

/// True when the TA-Lib backend was linked and initialised.
[[nodiscard]] bool available() noexcept;

/// "TA-Lib <major>.<minor>.<build>" or "TA-Lib not available".
[[nodiscard]] const char* version() noexcept;

using Column = std::vector<double>;

[[nodiscard]] std::optional<Column> sma(std::span<const double> close, int length) noexcept;
[[nodiscard]] std::optional<Column> ema(std::span<const double> close, int length) noexcept;
[[nodiscard]] std::optional<Column> t3(std::span<const double> close, int length, double a) noexcept;
[[nodiscard]] std::optional<Column> cmo(std::span<const double> close, int length) noexcept;
[[nodiscard]] std::optional<Column> roc(std::span<const double> close, int length) noexcept;

[[nodiscard]] std::optional<Column> trange(std::span<const double> high,
                                           std::span<const double> low,
                                           std::span<const double> close) noexcept;

[[nodiscard]] std::optional<Column> atr(std::span<const double> high,
                                        std::span<const double> low,
                                        std::span<const double> close,
                                        int length) noexcept;

[[nodiscard]] std::optional<Column> natr(std::span<const double> high,
                                         std::span<const double> low,
                                         std::span<const double> close,
                                         int length) noexcept;

/// Bollinger Bands with an SMA middle line: {lower, middle, upper}.
[[nodiscard]] std::optional<std::array<Column, 3>>
bbands(std::span<const double> close, int length, double nbdev) noexcept;

} // namespace tai::talib
