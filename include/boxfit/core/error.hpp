#pragma once

#include <string_view>

namespace boxfit::core {

/// Analysis error codes; used with std::expected for recoverable failures.
/// Malformed dimension cells are not errors (they become missing values).
enum class AnalysisError {
  None = 0,
  MissingColumn,
  InvalidConfig,
  LoadFailed,
  ParseFailed,
  WriteFailed,
};

[[nodiscard]] constexpr std::string_view to_string(AnalysisError e) noexcept {
  switch (e) {
    case AnalysisError::None:
      return "None";
    case AnalysisError::MissingColumn:
      return "MissingColumn";
    case AnalysisError::InvalidConfig:
      return "InvalidConfig";
    case AnalysisError::LoadFailed:
      return "LoadFailed";
    case AnalysisError::ParseFailed:
      return "ParseFailed";
    case AnalysisError::WriteFailed:
      return "WriteFailed";
  }
  return "Unknown";
}

}  // namespace boxfit::core
