#include <boxfit/io/csv_writer.hpp>
#include <boxfit/core/analysis.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <unordered_map>
#include <unordered_set>

namespace boxfit::io {

using boxfit::core::AnalysisError;

std::string escape_csv_field(std::string_view field) {
  if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string(field);
  }
  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (const char c : field) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

void write_table_csv(std::ostream& out, const boxfit::core::Table& table) {
  const auto& columns = table.columns();
  for (std::size_t c = 0; c < columns.size(); ++c) {
    if (c > 0) out << ',';
    out << escape_csv_field(columns[c]);
  }
  out << '\n';
  for (const auto& row : table.rows()) {
    for (std::size_t c = 0; c < row.size(); ++c) {
      if (c > 0) out << ',';
      out << escape_csv_field(boxfit::core::cell_to_string(row[c]));
    }
    out << '\n';
  }
}

void write_results_csv(std::ostream& out,
                       const boxfit::core::AnalysisResult& result) {
  write_table_csv(out, boxfit::core::to_output_table(result));
  const auto& s = result.summary;
  out << fmt::format(
      "\n\nSummary\n"
      "Total Items,{}\n"
      "OK Count,{}\n"
      "OK %, {:.2f}\n"
      "No OK Count,{}\n"
      "No OK %, {:.2f}\n",
      s.total, s.ok_count, s.ok_pct, s.no_ok_count, s.no_ok_pct);
}

void write_summary_csv(std::ostream& out, const boxfit::core::Summary& summary) {
  write_table_csv(out, boxfit::core::to_summary_table(summary));
}

namespace {

template <typename Writer>
std::expected<void, AnalysisError> write_file(const std::string& path,
                                              Writer&& writer) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) {
    spdlog::error("cannot open '{}' for writing", path);
    return std::unexpected(AnalysisError::WriteFailed);
  }
  writer(f);
  f.flush();
  if (!f) {
    spdlog::error("write to '{}' failed", path);
    return std::unexpected(AnalysisError::WriteFailed);
  }
  return {};
}

}  // namespace

std::expected<void, AnalysisError> write_results_csv_file(
    const std::string& path, const boxfit::core::AnalysisResult& result) {
  return write_file(path, [&result](std::ostream& out) {
    write_results_csv(out, result);
  });
}

std::expected<void, AnalysisError> write_summary_csv_file(
    const std::string& path, const boxfit::core::Summary& summary) {
  return write_file(path, [&summary](std::ostream& out) {
    write_summary_csv(out, summary);
  });
}

std::vector<std::string> unique_output_stems(const std::vector<std::string>& inputs) {
  std::vector<std::string> stems;
  stems.reserve(inputs.size());
  std::unordered_map<std::string, std::size_t> counts;
  for (const auto& in : inputs) {
    stems.push_back(std::filesystem::path(in).stem().string());
    ++counts[stems.back()];
  }

  std::unordered_set<std::string> used;
  for (std::size_t i = 0; i < stems.size(); ++i) {
    const std::string suffix = "_" + std::to_string(i + 1);
    std::string candidate = stems[i];
    if (counts[stems[i]] > 1) candidate += suffix;
    // A suffixed name may clash with another input's own stem.
    while (used.contains(candidate)) candidate += suffix;
    used.insert(candidate);
    stems[i] = std::move(candidate);
  }
  return stems;
}

std::string results_file_name(const std::string& stem) {
  return stem + "_size_analysis.csv";
}

std::string summary_file_name(const std::string& stem) {
  return stem + "_summary.csv";
}

}  // namespace boxfit::io
