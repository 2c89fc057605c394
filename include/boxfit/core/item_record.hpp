#pragma once

#include <boxfit/core/table.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace boxfit::core {

/// Whether the item fits the packing machine's box envelope.
enum class MachineFit : std::uint8_t {
  Ok,
  NoOk,
};

[[nodiscard]] constexpr std::string_view to_label(MachineFit fit) noexcept {
  return fit == MachineFit::Ok ? "OK" : "No OK";
}

/// Label used for rows that no cardboard width can wrap.
inline constexpr std::string_view kNoFitLabel = "No Fit";

/// Classification of one input row.
struct ItemRecord {
  Cell id;
  std::optional<double> height;
  std::optional<double> width;
  std::optional<double> length;
  bool valid{false};  // all three dimensions parsed
  std::optional<double> volume;  // set iff valid and the product is finite
  MachineFit machine_fit{MachineFit::NoOk};
  /// Smallest sufficient cardboard width; nullopt = No Fit.
  std::optional<double> cardboard_width;
};

/// "23", "39", "23.5" or "No Fit".
[[nodiscard]] std::string cardboard_label(std::optional<double> width);

}  // namespace boxfit::core
