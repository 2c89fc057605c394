#pragma once

#include <boxfit/core/analysis_result.hpp>
#include <boxfit/core/error.hpp>
#include <boxfit/core/item_record.hpp>
#include <boxfit/core/normalizer.hpp>
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace boxfit::core {

/// Fixed packaging constants for one run. Same length unit as the item
/// dimensions (inches by default).
struct PackagingConstraints {
  double max_height{11.0};
  double max_width{22.0};
  double max_length{15.0};
  /// Available cardboard stock widths, strictly ascending.
  std::vector<double> cardboard_widths{23.0, 39.0};
};

/// InvalidConfig if a limit is not a positive finite number or the width list
/// is empty, non-positive or not strictly ascending.
[[nodiscard]] std::expected<void, AnalysisError> validate_constraints(
    const PackagingConstraints& constraints);

/// Inclusive envelope check: a dimension equal to its limit passes.
[[nodiscard]] bool fits_machine(double height,
                                double width,
                                double length,
                                const PackagingConstraints& constraints) noexcept;

/// Smallest width w with height + width <= w, scanning \p widths in order
/// (first match wins). nullopt if height or width is missing or none suffice.
/// Length is deliberately not an input.
[[nodiscard]] std::optional<double> pick_cardboard(
    std::optional<double> height,
    std::optional<double> width,
    std::span<const double> widths) noexcept;

/// Builds one ItemRecord per row, in row order.
[[nodiscard]] std::vector<ItemRecord> classify(
    const NormalizedDimensions& dims,
    const PackagingConstraints& constraints);

/// Single pass counting OK / No OK with 2-decimal percentages.
[[nodiscard]] Summary summarize(std::span<const ItemRecord> records) noexcept;

/// Rounds to 2 decimal places, ties to even.
[[nodiscard]] double round2(double value) noexcept;

}  // namespace boxfit::core
