#include "fixed_point.hpp"

#include <limits>

namespace credit::math {

namespace {

constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();

} // namespace

std::optional<uint64_t> CheckedAdd(uint64_t a, uint64_t b) {
  if (a > kMax - b) return std::nullopt;
  return a + b;
}

std::optional<uint64_t> CheckedMul(uint64_t a, uint64_t b) {
  if (a != 0 && b > kMax / a) return std::nullopt;
  return a * b;
}

uint64_t MulDiv(uint64_t value, uint64_t multiplier, uint64_t divisor) {
  const unsigned __int128 wide = static_cast<unsigned __int128>(value) * multiplier / divisor;
  if (wide > static_cast<unsigned __int128>(kMax)) return kMax;
  return static_cast<uint64_t>(wide);
}

uint64_t RatioBasisPoints(uint64_t numerator, uint64_t denominator, uint64_t scale) {
  if (denominator == 0) {
    return scale;
  }
  return MulDiv(numerator, scale, denominator);
}

std::optional<uint64_t> AmortizedMonthlyPayment(uint64_t principal, uint64_t annual_rate_bps, uint32_t months) {
  const auto rate_months = CheckedMul(annual_rate_bps, months);
  if (!rate_months) return std::nullopt;

  const auto total_interest = MulDiv(principal, *rate_months, kMonthlyRateScale);
  if (total_interest == kMax) return std::nullopt;

  const auto total = CheckedAdd(principal, total_interest);
  if (!total) return std::nullopt;

  return *total / months;
}

} // namespace credit::math
