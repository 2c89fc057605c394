#include <boxfit/io/csv_reader.hpp>
#include <spdlog/spdlog.h>
#include <cstddef>
#include <fstream>
#include <iterator>
#include <string_view>
#include <vector>

namespace boxfit::io {

namespace {

using boxfit::core::AnalysisError;
using boxfit::core::Cell;
using boxfit::core::Row;

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

/// Splits the whole buffer into records of raw fields.
/// Returns false on an unterminated quoted field.
bool split_records(std::string_view text,
                   char sep,
                   std::vector<std::vector<std::string>>& records) {
  std::vector<std::string> fields;
  std::string field;
  bool in_quotes = false;
  bool record_has_data = false;

  auto end_field = [&]() {
    fields.push_back(std::move(field));
    field.clear();
  };
  auto end_record = [&]() {
    end_field();
    // Blank lines carry a single empty field and no quotes; skip them.
    if (record_has_data || fields.size() > 1 || !fields.front().empty()) {
      records.push_back(std::move(fields));
    }
    fields.clear();
    record_has_data = false;
  };

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }
    if (c == '"') {
      in_quotes = true;
      record_has_data = true;
    } else if (c == sep) {
      end_field();
    } else if (c == '\r') {
      if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
      end_record();
    } else if (c == '\n') {
      end_record();
    } else {
      field.push_back(c);
    }
  }
  if (in_quotes) return false;
  if (!field.empty() || !fields.empty() || record_has_data) {
    end_record();
  }
  return true;
}

}  // namespace

std::expected<boxfit::core::Table, AnalysisError> parse_csv(std::istream& in,
                                                            char separator) {
  const std::string buffer{std::istreambuf_iterator<char>(in),
                           std::istreambuf_iterator<char>()};
  std::string_view text(buffer);
  if (text.starts_with(kUtf8Bom)) text.remove_prefix(kUtf8Bom.size());

  std::vector<std::vector<std::string>> records;
  if (!split_records(text, separator, records)) {
    spdlog::error("parse_csv: unterminated quoted field");
    return std::unexpected(AnalysisError::ParseFailed);
  }
  if (records.empty()) {
    spdlog::error("parse_csv: no header record");
    return std::unexpected(AnalysisError::ParseFailed);
  }

  std::vector<std::string> columns = std::move(records.front());
  std::vector<Row> rows;
  rows.reserve(records.size() - 1);
  for (std::size_t r = 1; r < records.size(); ++r) {
    Row row;
    row.reserve(records[r].size());
    for (auto& f : records[r]) {
      if (f.empty()) {
        row.emplace_back();
      } else {
        row.emplace_back(std::move(f));
      }
    }
    rows.push_back(std::move(row));
  }
  spdlog::debug("parse_csv: {} columns, {} rows", columns.size(), rows.size());
  return boxfit::core::Table(std::move(columns), std::move(rows));
}

std::expected<boxfit::core::Table, AnalysisError> read_csv(
    const std::string& path, char separator) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    spdlog::error("read_csv: cannot open '{}'", path);
    return std::unexpected(AnalysisError::LoadFailed);
  }
  return parse_csv(f, separator);
}

}  // namespace boxfit::io
