#pragma once

#include <boxfit/core/analysis_result.hpp>
#include <boxfit/core/error.hpp>
#include <boxfit/core/table.hpp>
#include <expected>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace boxfit::io {

/// Quotes \p field if it contains a comma, quote, CR or LF.
[[nodiscard]] std::string escape_csv_field(std::string_view field);

/// Header line plus one line per row; LF line endings.
void write_table_csv(std::ostream& out, const boxfit::core::Table& table);

/// Annotated results followed by the summary footer block
/// ("Summary", Total Items, OK Count, OK %, No OK Count, No OK %).
void write_results_csv(std::ostream& out,
                       const boxfit::core::AnalysisResult& result);

/// Metric,Value table of the summary alone.
void write_summary_csv(std::ostream& out, const boxfit::core::Summary& summary);

[[nodiscard]] std::expected<void, boxfit::core::AnalysisError>
write_results_csv_file(const std::string& path,
                       const boxfit::core::AnalysisResult& result);

[[nodiscard]] std::expected<void, boxfit::core::AnalysisError>
write_summary_csv_file(const std::string& path,
                       const boxfit::core::Summary& summary);

/// Output file stems for \p inputs, one per input and pairwise distinct.
/// An input whose file stem is shared with another input gets "_<position>"
/// appended (1-based), e.g. a/items.csv, b/items.csv -> items_1, items_2.
[[nodiscard]] std::vector<std::string> unique_output_stems(
    const std::vector<std::string>& inputs);

/// "<stem>_size_analysis.csv"
[[nodiscard]] std::string results_file_name(const std::string& stem);

/// "<stem>_summary.csv"
[[nodiscard]] std::string summary_file_name(const std::string& stem);

}  // namespace boxfit::io
