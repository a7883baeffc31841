#pragma once

/// @file include/tai/catalog.hpp
/// @brief Name-based access to every indicator.
///
/// # Module: Catalog
///
/// ## Responsibility
/// Map an indicator name ("t3", "vidya", "bbands", ...) to its category and
/// to a call that takes string parameters, so front ends (the `tai` CLI)
/// need not know each indicator's signature.
///
/// ## Parameters
/// Keys match the parameter struct members (`length`, `a`, `fast`, `slow`,
/// `signal`, `scalar`, `drift`, `initial`, `asc`, `centered`, `mamode`,
/// `percent`, `std`, `ddof`, `lower_length`, `upper_length`, `everget`,
/// `atr_length`, `c`, `tr`, `na`, `nb`, `nc`, `nd`, `channel_eval`,
/// `refined`, `thirds`, and `long`/`short` for the thermometer factors) plus
/// the Options keys (`offset`, `fillna`, `fill_method`, `talib`, `presma`,
/// `adjust`, `lookahead`). Keys an indicator does not use are ignored.
///
/// ## Guarantees
/// - `compute` returns nullopt for an unknown name, an unparsable value (a
///   non-finite `fillna` counts as one), or when the indicator itself
///   returns nullopt; the first two are logged at
///   warn level
/// - Single-output indicators come back as a one-column Frame

#include "tai/types.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tai::catalog {

using ParamMap = std::map<std::string, std::string, std::less<>>;

struct Entry {
    std::string_view name;
    Category         category;
    std::string_view description;
};

/// Every indicator, grouped by category in declaration order.
[[nodiscard]] const std::vector<Entry>& entries() noexcept;

/// Catalog entry by name, or nullptr.
[[nodiscard]] const Entry* find(std::string_view name) noexcept;

/// Compute `name` on `data` with string parameters.
[[nodiscard]] std::optional<Frame>
compute(std::string_view name, const OhlcvColumns& data,
        const ParamMap& params = {}) noexcept;

/// Split "key=value" into (key, value). nullopt when there is no '=' or the
/// key is empty.
[[nodiscard]] std::optional<std::pair<std::string, std::string>>
parse_assignment(std::string_view text) noexcept;

} // namespace tai::catalog
