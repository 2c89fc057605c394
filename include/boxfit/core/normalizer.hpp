#pragma once

#include <boxfit/core/error.hpp>
#include <boxfit/core/table.hpp>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace boxfit::core {

/// Column roles picked by the caller; each must name a column of the table.
struct ColumnSelection {
  std::string id;
  std::string height;
  std::string width;
  std::string length;
};

/// Dimensions coerced to numbers, aligned by row index.
/// invalid[i] is true iff any of height/width/length is missing for row i.
struct NormalizedDimensions {
  std::vector<Cell> ids;
  std::vector<std::optional<double>> height;
  std::vector<std::optional<double>> width;
  std::vector<std::optional<double>> length;
  std::vector<bool> invalid;

  [[nodiscard]] std::size_t size() const noexcept { return ids.size(); }
};

/// Numeric value of a cell, or nullopt if it is empty, not a complete number,
/// NaN or infinite. Text is trimmed before parsing. Never throws.
[[nodiscard]] std::optional<double> parse_dimension(const Cell& cell);

/// Coerces the selected columns of \p table. Bad cells degrade to missing;
/// only a selector naming an absent column fails (MissingColumn).
[[nodiscard]] std::expected<NormalizedDimensions, AnalysisError> normalize(
    const Table& table, const ColumnSelection& selection);

}  // namespace boxfit::core
