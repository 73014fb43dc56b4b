#pragma once

#include <cstdint>

#include "internal/model/risk_category.hpp"

namespace credit::scoring {

/*
  Score bands, highest threshold first, inclusive at the lower edge.

    score >= 700  low        300 bps
    score >= 600  medium     800 bps
    score >= 500  high      1500 bps
    otherwise     very-high 2000 bps

  Shared by profile registration (raw credit score), loan application
  (stored credit score) and the comprehensive assessment (final score).
*/

inline constexpr uint64_t kLowRiskThreshold    = 700;
inline constexpr uint64_t kMediumRiskThreshold = 600;
inline constexpr uint64_t kHighRiskThreshold   = 500;

// Minimum stored credit score accepted by Apply.
inline constexpr uint64_t kMinimumApplicationScore = kHighRiskThreshold;

credit::model::RiskCategory DeriveRiskCategory(uint64_t score);

uint32_t DeriveInterestRate(uint64_t score);

} // namespace credit::scoring
