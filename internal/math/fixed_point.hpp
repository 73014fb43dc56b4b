#pragma once

#include <cstdint>
#include <limits>
#include <optional>

namespace credit::math {

/*
  Integer-only fixed point helpers.

  Every division truncates toward zero. Nothing here uses floating point;
  amounts, ratios and rates are plain uint64_t in their own scale
  (currency units, percent, basis points).
*/

inline constexpr uint64_t kPercentScale     = 100;
inline constexpr uint64_t kBasisPointScale  = 10000;
inline constexpr uint64_t kMonthlyRateScale = 120000; // 12 months * 10000 bps

// Largest amount the ledger stores; SQL backends persist amounts as BIGINT.
inline constexpr uint64_t kMaxAmount = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

std::optional<uint64_t> CheckedAdd(uint64_t a, uint64_t b);
std::optional<uint64_t> CheckedMul(uint64_t a, uint64_t b);

// value * multiplier / divisor, exact over a 128-bit product. Saturates at UINT64_MAX when the quotient
// does not fit.
// divisor must be non-zero.
uint64_t MulDiv(uint64_t value, uint64_t multiplier, uint64_t divisor);

// numerator * scale / denominator. A zero denominator is the worst case
// and yields `scale` (e.g. DTI with no income is 100.00%).
uint64_t RatioBasisPoints(uint64_t numerator, uint64_t denominator, uint64_t scale);

// Straight-line estimate, not true amortization:
//   interest = principal * rate_bps * months / 120000
//   payment  = (principal + interest) / months
// Empty when the result does not fit in 64 bits. months must be > 0.
std::optional<uint64_t> AmortizedMonthlyPayment(uint64_t principal, uint64_t annual_rate_bps, uint32_t months);

inline uint64_t SaturatingSub(uint64_t a, uint64_t b) {
  return a > b ? a - b : 0;
}

} // namespace credit::math
