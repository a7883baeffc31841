#pragma once

/// @file include/tai/data_loader.hpp
/// @brief CSV loader for OHLCV market data.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV files containing OHLCV market data into `std::vector<OHLCV>`.
/// Columns are located by header name, so exports with extra columns or a
/// different column order load unchanged.
///
/// ## Expected CSV Format
/// ```
/// timestamp,open,high,low,close,volume
/// 1,100.0,105.0,99.0,103.0,1000000
/// 2,103.0,107.0,102.0,106.5,1200000
/// ```
/// Header names are matched case-insensitively. `date` or `time` may stand in
/// for `timestamp`; a timestamp that is not numeric (an ISO date, say) is
/// replaced by the row's ordinal. `volume` is optional and defaults to 0.
/// Without a recognisable header the columns are taken positionally.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only if the file cannot be opened
/// - Skips individual bad rows rather than failing the entire load
/// - Does not modify any file or external state

#include "tai/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tai {

/// Zero-based positions of the OHLCV fields within a CSV row. A negative
/// position means the column is absent.
struct CsvLayout {
    int timestamp = 0;
    int open      = 1;
    int high      = 2;
    int low       = 3;
    int close     = 4;
    int volume    = 5;

    /// True when open, high, low and close all have a position.
    [[nodiscard]] bool usable() const noexcept {
        return open >= 0 && high >= 0 && low >= 0 && close >= 0;
    }
};

/// Loads OHLCV data from CSV files and strings.
class DataLoader {
public:
    DataLoader() = delete;

    /// Load OHLCV bars from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty vector if the file has a header but no valid data rows
    /// - Vector of parsed bars, skipping any malformed or non-finite rows
    [[nodiscard]] static std::optional<std::vector<OHLCV>>
    load_csv(const std::string& filepath) noexcept;

    /// Parse OHLCV bars from a CSV-formatted string. Same format as
    /// `load_csv`.
    [[nodiscard]] static std::vector<OHLCV>
    parse_csv_string(const std::string& csv_content) noexcept;

    /// Resolve column positions from a header line. Returns `nullopt` when
    /// the line names none of the price columns (i.e. it is data, not a
    /// header).
    [[nodiscard]] static std::optional<CsvLayout>
    parse_header(std::string_view line) noexcept;

    /// A bar is valid if all fields are finite, low ≤ open, close ≤ high and
    /// volume ≥ 0.
    [[nodiscard]] static bool validate_bar(const OHLCV& bar) noexcept;

private:
    [[nodiscard]] static std::optional<OHLCV>
    parse_row(std::string_view line, const CsvLayout& layout,
              double ordinal) noexcept;
};

} // namespace tai
