#pragma once

#include <boxfit/core/item_record.hpp>
#include <cstddef>
#include <vector>

namespace boxfit::core {

/// Dataset-level pass/fail statistics.
/// ok_count + no_ok_count == total; percentages are rounded to 2 decimals
/// and both 0 for an empty dataset.
struct Summary {
  std::size_t total{0};
  std::size_t ok_count{0};
  std::size_t no_ok_count{0};
  double ok_pct{0.0};
  double no_ok_pct{0.0};
};

/// Per-row records in input order plus the summary folded from them.
struct AnalysisResult {
  std::vector<ItemRecord> records;
  Summary summary;
};

}  // namespace boxfit::core
