#include <boxfit/core/analysis.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace boxfit::core {

namespace {

Cell optional_cell(std::optional<double> v) {
  if (v) return Cell{*v};
  return Cell{};
}

}  // namespace

std::expected<AnalysisResult, AnalysisError> analyze(
    const Table& table,
    const ColumnSelection& selection,
    const PackagingConstraints& constraints) {
  if (auto ok = validate_constraints(constraints); !ok) {
    return std::unexpected(ok.error());
  }

  auto dims = normalize(table, selection);
  if (!dims) {
    return std::unexpected(dims.error());
  }

  AnalysisResult result;
  result.records = classify(*dims, constraints);
  result.summary = summarize(result.records);
  spdlog::debug("analyze: total={} ok={} no_ok={}", result.summary.total,
                result.summary.ok_count, result.summary.no_ok_count);
  return result;
}

Table to_output_table(const AnalysisResult& result) {
  std::vector<std::string> columns(kOutputColumns.begin(), kOutputColumns.end());
  std::vector<Row> rows;
  rows.reserve(result.records.size());
  for (const auto& r : result.records) {
    rows.push_back({
        r.id,
        optional_cell(r.height),
        optional_cell(r.width),
        optional_cell(r.length),
        optional_cell(r.volume),
        Cell{std::string(to_label(r.machine_fit))},
        Cell{cardboard_label(r.cardboard_width)},
    });
  }
  return Table(std::move(columns), std::move(rows));
}

Table to_summary_table(const Summary& summary) {
  std::vector<Row> rows = {
      {Cell{std::string("Total Items")}, Cell{static_cast<double>(summary.total)}},
      {Cell{std::string("OK Count")}, Cell{static_cast<double>(summary.ok_count)}},
      {Cell{std::string("OK %")}, Cell{summary.ok_pct}},
      {Cell{std::string("No OK Count")}, Cell{static_cast<double>(summary.no_ok_count)}},
      {Cell{std::string("No OK %")}, Cell{summary.no_ok_pct}},
  };
  return Table({"Metric", "Value"}, std::move(rows));
}

}  // namespace boxfit::core
