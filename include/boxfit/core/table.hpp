#pragma once

#include <boxfit/core/error.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace boxfit::core {

/// One table cell: empty, numeric, or text. Item ids pass through untouched.
using Cell = std::variant<std::monostate, double, std::string>;

using Row = std::vector<Cell>;

/// In-memory table: ordered named columns and ordered rows.
/// Every row holds exactly column_count() cells; the constructor pads short
/// rows with empty cells and drops extra trailing cells.
class Table {
 public:
  Table() = default;

  Table(std::vector<std::string> columns, std::vector<Row> rows);

  [[nodiscard]] const std::vector<std::string>& columns() const noexcept {
    return columns_;
  }
  [[nodiscard]] const std::vector<Row>& rows() const noexcept { return rows_; }

  [[nodiscard]] std::size_t column_count() const noexcept {
    return columns_.size();
  }
  [[nodiscard]] std::size_t row_count() const noexcept { return rows_.size(); }
  [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

  /// Index of the first column called \p name, if any.
  [[nodiscard]] std::optional<std::size_t> column_index(
      const std::string& name) const;

  [[nodiscard]] const Cell& at(std::size_t row, std::size_t col) const {
    return rows_.at(row).at(col);
  }

  /// Copy of one column, top to bottom. MissingColumn if \p name is absent.
  [[nodiscard]] std::expected<std::vector<Cell>, AnalysisError> column(
      const std::string& name) const;

  void append_row(Row row);

 private:
  std::vector<std::string> columns_;
  std::vector<Row> rows_;
};

/// True if the cell holds no value.
[[nodiscard]] inline bool is_empty(const Cell& cell) noexcept {
  return std::holds_alternative<std::monostate>(cell);
}

/// Text form of a cell as written to exports: empty, shortest decimal, or text.
[[nodiscard]] std::string cell_to_string(const Cell& cell);

}  // namespace boxfit::core
