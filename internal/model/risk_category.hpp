#pragma once

#include <cstdint>
#include <string_view>

namespace credit::model {

// Persisted; do not renumber.
enum class RiskCategory : std::uint8_t {
  kLow      = 1,
  kMedium   = 2,
  kHigh     = 3,
  kVeryHigh = 4,
};

constexpr std::string_view ToString(RiskCategory category) {
  switch (category) {
    case RiskCategory::kLow:
      return "low";
    case RiskCategory::kMedium:
      return "medium";
    case RiskCategory::kHigh:
      return "high";
    case RiskCategory::kVeryHigh:
      return "very-high";
  }
  return "unknown";
}

} // namespace credit::model
