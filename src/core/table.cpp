#include <boxfit/core/table.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace boxfit::core {

Table::Table(std::vector<std::string> columns, std::vector<Row> rows)
    : columns_(std::move(columns)) {
  rows_.reserve(rows.size());
  for (auto& row : rows) {
    append_row(std::move(row));
  }
}

std::optional<std::size_t> Table::column_index(const std::string& name) const {
  const auto it = std::find(columns_.begin(), columns_.end(), name);
  if (it == columns_.end()) return std::nullopt;
  return static_cast<std::size_t>(it - columns_.begin());
}

std::expected<std::vector<Cell>, AnalysisError> Table::column(
    const std::string& name) const {
  const auto idx = column_index(name);
  if (!idx) {
    return std::unexpected(AnalysisError::MissingColumn);
  }
  std::vector<Cell> out;
  out.reserve(rows_.size());
  for (const auto& row : rows_) {
    out.push_back(row[*idx]);
  }
  return out;
}

void Table::append_row(Row row) {
  row.resize(columns_.size());
  rows_.push_back(std::move(row));
}

std::string cell_to_string(const Cell& cell) {
  if (const auto* d = std::get_if<double>(&cell)) {
    return fmt::format("{}", *d);
  }
  if (const auto* s = std::get_if<std::string>(&cell)) {
    return *s;
  }
  return {};
}

}  // namespace boxfit::core
