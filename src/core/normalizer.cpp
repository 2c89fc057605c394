#include <boxfit/core/normalizer.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <string_view>
#include <system_error>

namespace boxfit::core {

namespace {

std::string_view trim(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::optional<double> parse_text(std::string_view text) {
  text = trim(text);
  if (text.empty()) return std::nullopt;
  // from_chars rejects a leading '+', which spreadsheets happily emit.
  if (text.front() == '+') {
    text.remove_prefix(1);
    if (text.empty() || text.front() == '-' || text.front() == '+') {
      return std::nullopt;
    }
  }
  double value = 0.0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) return std::nullopt;
  return value;
}

std::vector<std::optional<double>> coerce(const std::vector<Cell>& cells) {
  std::vector<std::optional<double>> out;
  out.reserve(cells.size());
  for (const auto& c : cells) {
    out.push_back(parse_dimension(c));
  }
  return out;
}

}  // namespace

std::optional<double> parse_dimension(const Cell& cell) {
  std::optional<double> value;
  if (const auto* d = std::get_if<double>(&cell)) {
    value = *d;
  } else if (const auto* s = std::get_if<std::string>(&cell)) {
    value = parse_text(*s);
  }
  if (value && !std::isfinite(*value)) return std::nullopt;
  return value;
}

std::expected<NormalizedDimensions, AnalysisError> normalize(
    const Table& table, const ColumnSelection& selection) {
  auto ids = table.column(selection.id);
  auto height = table.column(selection.height);
  auto width = table.column(selection.width);
  auto length = table.column(selection.length);
  if (!ids || !height || !width || !length) {
    spdlog::error("normalize: selected column not found (id='{}' height='{}' width='{}' length='{}')",
                  selection.id, selection.height, selection.width, selection.length);
    return std::unexpected(AnalysisError::MissingColumn);
  }

  NormalizedDimensions dims;
  dims.ids = std::move(*ids);
  dims.height = coerce(*height);
  dims.width = coerce(*width);
  dims.length = coerce(*length);

  const std::size_t n = dims.ids.size();
  dims.invalid.resize(n);
  std::size_t invalid_count = 0;
  for (std::size_t i = 0; i < n; ++i) {
    dims.invalid[i] = !dims.height[i] || !dims.width[i] || !dims.length[i];
    if (dims.invalid[i]) ++invalid_count;
  }
  if (invalid_count > 0) {
    spdlog::warn("normalize: {} of {} rows have missing or non-numeric dimensions",
                 invalid_count, n);
  }
  return dims;
}

}  // namespace boxfit::core
