#pragma once

#include <boxfit/core/classifier.hpp>
#include <boxfit/core/normalizer.hpp>
#include <spdlog/common.h>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace boxfit::app {

/// Analyzer configuration: packaging constants, column roles, output, logging.
struct AnalyzerConfig {
  boxfit::core::PackagingConstraints constraints;
  boxfit::core::ColumnSelection columns{"Item ID", "Height", "Width", "Length"};
  std::string output_dir{"output"};
  std::size_t num_workers{0};  // 0 = hardware concurrency
  std::string log_level{"info"};
};

/// Load config from a simple key=value file (one per line) or use defaults.
/// Keys: max_height, max_width, max_length, cardboard_widths (comma list),
/// id_column, height_column, width_column, length_column, output_dir,
/// num_workers, log_level. Throws std::invalid_argument / std::out_of_range
/// on a malformed number.
AnalyzerConfig load_config(const std::string& path);

/// Default config when no file is provided.
AnalyzerConfig default_config();

/// Parses "23, 39" into {23, 39}. Throws on a malformed entry.
std::vector<double> parse_width_list(const std::string& value);

/// spdlog level for a name (trace, debug, info, warn, error, critical, off);
/// nullopt for any other name.
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(
    const std::string& name);

}  // namespace boxfit::app
