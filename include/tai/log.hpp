#pragma once

/// @file include/tai/log.hpp
/// @brief Level-gated diagnostics printed with fmt.
///
/// The library is quiet by default (level Warn). Indicators log fallbacks and
/// validation failures at Debug; the catalog logs misuse at Warn. Output goes
/// to stderr unless redirected with set_sink().

#include <fmt/format.h>

#include <cstdio>
#include <string_view>
#include <utility>

namespace tai::log {

enum class Level : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    Off   = 4,
};

void  set_level(Level level) noexcept;
[[nodiscard]] Level level() noexcept;

/// Parse "debug", "info", "warn", "error" or "off" (case-insensitive).
/// Unknown names give Warn.
[[nodiscard]] Level parse_level(std::string_view name) noexcept;

[[nodiscard]] const char* to_string(Level level) noexcept;

/// Redirect output. nullptr restores stderr. The stream is not owned.
void set_sink(std::FILE* sink) noexcept;

[[nodiscard]] inline bool enabled(Level lvl) noexcept {
    return static_cast<int>(lvl) >= static_cast<int>(level());
}

/// Write one line "[tai] LEVEL message" to the sink.
void write(Level lvl, std::string_view message) noexcept;

template <typename... Args>
void debug(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Debug)) write(Level::Debug, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void info(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Info)) write(Level::Info, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Warn)) write(Level::Warn, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void error(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Error)) write(Level::Error, fmt::format(f, std::forward<Args>(args)...));
}

} // namespace tai::log
