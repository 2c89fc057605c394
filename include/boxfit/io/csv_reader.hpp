#pragma once

#include <boxfit/core/error.hpp>
#include <boxfit/core/table.hpp>
#include <expected>
#include <istream>
#include <string>

namespace boxfit::io {

/// Parses delimited text whose first record is the header.
/// Quoted fields may contain the separator, doubled quotes and newlines.
/// Empty fields become empty cells; other fields stay text.
/// ParseFailed if there is no header record or a quote is left open.
[[nodiscard]] std::expected<boxfit::core::Table, boxfit::core::AnalysisError>
parse_csv(std::istream& in, char separator = ',');

/// Reads and parses \p path. LoadFailed if the file cannot be opened.
[[nodiscard]] std::expected<boxfit::core::Table, boxfit::core::AnalysisError>
read_csv(const std::string& path, char separator = ',');

}  // namespace boxfit::io
