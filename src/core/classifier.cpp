#include <boxfit/core/classifier.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstddef>

namespace boxfit::core {

namespace {

bool positive_finite(double v) noexcept { return std::isfinite(v) && v > 0.0; }

}  // namespace

std::expected<void, AnalysisError> validate_constraints(
    const PackagingConstraints& constraints) {
  if (!positive_finite(constraints.max_height) ||
      !positive_finite(constraints.max_width) ||
      !positive_finite(constraints.max_length)) {
    spdlog::error("machine limits must be positive (height={} width={} length={})",
                  constraints.max_height, constraints.max_width,
                  constraints.max_length);
    return std::unexpected(AnalysisError::InvalidConfig);
  }
  const auto& widths = constraints.cardboard_widths;
  if (widths.empty()) {
    spdlog::error("no cardboard widths configured");
    return std::unexpected(AnalysisError::InvalidConfig);
  }
  for (std::size_t i = 0; i < widths.size(); ++i) {
    if (!positive_finite(widths[i]) || (i > 0 && widths[i] <= widths[i - 1])) {
      spdlog::error("cardboard widths must be positive and strictly ascending");
      return std::unexpected(AnalysisError::InvalidConfig);
    }
  }
  return {};
}

bool fits_machine(double height,
                  double width,
                  double length,
                  const PackagingConstraints& constraints) noexcept {
  return height <= constraints.max_height && width <= constraints.max_width &&
         length <= constraints.max_length;
}

std::optional<double> pick_cardboard(std::optional<double> height,
                                     std::optional<double> width,
                                     std::span<const double> widths) noexcept {
  if (!height || !width) return std::nullopt;
  const double wrap = *height + *width;
  for (const double w : widths) {
    if (wrap <= w) return w;
  }
  return std::nullopt;
}

std::vector<ItemRecord> classify(const NormalizedDimensions& dims,
                                 const PackagingConstraints& constraints) {
  std::vector<ItemRecord> records;
  records.reserve(dims.size());
  for (std::size_t i = 0; i < dims.size(); ++i) {
    ItemRecord r;
    r.id = dims.ids[i];
    r.height = dims.height[i];
    r.width = dims.width[i];
    r.length = dims.length[i];
    r.valid = !dims.invalid[i];
    if (r.valid) {
      // Huge dimensions can overflow the product; leave volume empty then.
      const double volume = *r.height * *r.width * *r.length;
      if (std::isfinite(volume)) r.volume = volume;
      if (fits_machine(*r.height, *r.width, *r.length, constraints)) {
        r.machine_fit = MachineFit::Ok;
      }
    }
    r.cardboard_width =
        pick_cardboard(r.height, r.width, constraints.cardboard_widths);
    records.push_back(std::move(r));
  }
  return records;
}

// Scales then rounds, so it can differ from a correctly rounded decimal
// round when value * 100 is inexact. count / total * 100 percentages have not
// been found to hit such a case.
double round2(double value) noexcept {
  return std::nearbyint(value * 100.0) / 100.0;
}

Summary summarize(std::span<const ItemRecord> records) noexcept {
  Summary s;
  s.total = records.size();
  for (const auto& r : records) {
    if (r.machine_fit == MachineFit::Ok) {
      ++s.ok_count;
    } else {
      ++s.no_ok_count;
    }
  }
  if (s.total > 0) {
    const auto total = static_cast<double>(s.total);
    s.ok_pct = round2(static_cast<double>(s.ok_count) / total * 100.0);
    s.no_ok_pct = round2(static_cast<double>(s.no_ok_count) / total * 100.0);
  }
  return s;
}

}  // namespace boxfit::core
