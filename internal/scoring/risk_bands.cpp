#include "risk_bands.hpp"

namespace credit::scoring {

using credit::model::RiskCategory;

RiskCategory DeriveRiskCategory(uint64_t score) {
  if (score >= kLowRiskThreshold) return RiskCategory::kLow;
  if (score >= kMediumRiskThreshold) return RiskCategory::kMedium;
  if (score >= kHighRiskThreshold) return RiskCategory::kHigh;
  return RiskCategory::kVeryHigh;
}

uint32_t DeriveInterestRate(uint64_t score) {
  switch (DeriveRiskCategory(score)) {
    case RiskCategory::kLow:
      return 300;
    case RiskCategory::kMedium:
      return 800;
    case RiskCategory::kHigh:
      return 1500;
    case RiskCategory::kVeryHigh:
      return 2000;
  }
  return 2000;
}

} // namespace credit::scoring
