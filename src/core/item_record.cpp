#include <boxfit/core/item_record.hpp>
#include <fmt/format.h>

namespace boxfit::core {

std::string cardboard_label(std::optional<double> width) {
  if (!width) return std::string(kNoFitLabel);
  return fmt::format("{}", *width);
}

}  // namespace boxfit::core
