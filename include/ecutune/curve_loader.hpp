#pragma once

/// @file include/ecutune/curve_loader.hpp
/// @brief CSV loader for baseline torque curves.
///
/// # Module: CurveLoader
///
/// ## Responsibility
/// Parse a dyno-style CSV into a `BaselineCurve` for the CLI `--curve` mode.
///
/// ## Expected CSV Format
/// ```
/// rpm,torque_nm
/// 1000,200.0
/// 2000,210.0
/// ```
/// The first non-blank, non-comment line is treated as a header and skipped.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on unrecoverable errors
/// - Skips individual bad rows (with a warning log) rather than failing the load
/// - The returned curve satisfies every `BaselineCurve` invariant

#include "ecutune/types.hpp"

#include <optional>
#include <string>
#include <utility>

namespace ecutune::core {

/// Loads baseline curves from CSV files.
class CurveLoader {
public:
    /// Load a curve from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - `nullopt` if the surviving rows do not form a valid curve
    [[nodiscard]] static std::optional<BaselineCurve>
    load_csv(const std::string& filepath) noexcept;

    /// Parse a curve from CSV text. Same format as `load_csv`.
    [[nodiscard]] static std::optional<BaselineCurve>
    parse_csv_string(const std::string& csv_content) noexcept;

    /// Parse a single `rpm,torque_nm` data row.
    /// Returns `nullopt` for blank, comment, or malformed rows.
    [[nodiscard]] static std::optional<std::pair<int, double>>
    parse_row(const std::string& line) noexcept;
};

}  // namespace ecutune::core
