#pragma once

#include <boxfit/core/analysis_result.hpp>
#include <boxfit/core/classifier.hpp>
#include <boxfit/core/error.hpp>
#include <boxfit/core/normalizer.hpp>
#include <boxfit/core/table.hpp>
#include <array>
#include <expected>
#include <string_view>

namespace boxfit::core {

/// Output column names, in export order.
inline constexpr std::array<std::string_view, 7> kOutputColumns = {
    "Item ID", "Height", "Width", "Length",
    "Volume",  "Status", "Optimal Cardboard Width",
};

/// Runs normalize -> classify -> summarize on one table.
/// Fails only on invalid constraints or a missing selected column.
[[nodiscard]] std::expected<AnalysisResult, AnalysisError> analyze(
    const Table& table,
    const ColumnSelection& selection,
    const PackagingConstraints& constraints);

/// Annotated table with kOutputColumns; missing values are empty cells and
/// both label columns are text.
[[nodiscard]] Table to_output_table(const AnalysisResult& result);

/// Two-column Metric/Value table: Total Items, OK Count, OK %, No OK Count, No OK %.
[[nodiscard]] Table to_summary_table(const Summary& summary);

}  // namespace boxfit::core
