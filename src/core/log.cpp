/// @file src/core/log.cpp
/// @brief Level-gated fmt logging to a redirectable FILE* sink.

#include "tai/log.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <string>

namespace tai::log {

namespace {

std::atomic<int>        g_level{static_cast<int>(Level::Warn)};
std::atomic<std::FILE*> g_sink{nullptr};

} // namespace

void set_level(Level lvl) noexcept { g_level.store(static_cast<int>(lvl)); }

Level level() noexcept { return static_cast<Level>(g_level.load()); }

Level parse_level(std::string_view name) noexcept {
    std::string x(name);
    std::transform(x.begin(), x.end(), x.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (x == "debug") return Level::Debug;
    if (x == "info")  return Level::Info;
    if (x == "warn" || x == "warning") return Level::Warn;
    if (x == "error") return Level::Error;
    if (x == "off")   return Level::Off;
    return Level::Warn;
}

const char* to_string(Level lvl) noexcept {
    switch (lvl) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off:   return "OFF";
    }
    return "INFO";
}

void set_sink(std::FILE* sink) noexcept { g_sink.store(sink); }

void write(Level lvl, std::string_view message) noexcept {
    std::FILE* f = g_sink.load();
    if (f == nullptr) f = stderr;
    fmt::print(f, "[tai] {:<5} {}\n", to_string(lvl), message);
    std::fflush(f);
}

} // namespace tai::log
