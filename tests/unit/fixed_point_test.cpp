#include "internal/math/fixed_point.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>

namespace {

using namespace credit::math;

constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();

void TestCheckedArithmetic() {
  assert(CheckedAdd(2, 3).value() == 5);
  assert(!CheckedAdd(kMax, 1).has_value());
  assert(CheckedAdd(kMax, 0).value() == kMax);

  assert(CheckedMul(0, kMax).value() == 0);
  assert(CheckedMul(1ULL << 31, 1ULL << 32).value() == (1ULL << 63));
  assert(!CheckedMul(1ULL << 32, 1ULL << 32).has_value());

  assert(SaturatingSub(10, 4) == 6);
  assert(SaturatingSub(4, 10) == 0);
}

void TestMulDivIsExactWithoutFullProduct() {
  assert(MulDiv(10, 3, 4) == 7);
  assert(MulDiv(7, 1, 2) == 3);
  assert(MulDiv(0, 123, 7) == 0);

  // 1e18 * 1000 overflows 64 bits; the decomposition does not
  assert(MulDiv(1000000000000000000ULL, 1000, 1000) == 1000000000000000000ULL);
  assert(MulDiv(kMax, 1, 1) == kMax);
  assert(MulDiv(kMax, 2, 1) == kMax);
}

void TestMulDivLargeDivisorWithRemainder() {
  // (v % d) * m overflows 64 bits here while the quotient is small.
  assert(MulDiv(100000000000000000ULL, 10000, 300000000000000000ULL) == 3333);
  assert(MulDiv(200000000000000000ULL, 100, 300000000000000000ULL) == 66);
  assert(MulDiv(kMaxAmount - 1, kMaxAmount, kMaxAmount) == kMaxAmount - 1);
  assert(RatioBasisPoints(100000000000000000ULL, 300000000000000000ULL, 10000) == 3333);
}

void TestRatioBasisPoints() {
  assert(RatioBasisPoints(20000, 100000, kBasisPointScale) == 2000);
  assert(RatioBasisPoints(1, 3, kPercentScale) == 33);
  assert(RatioBasisPoints(2, 3, kPercentScale) == 66);

  // zero denominator is the worst case for any numerator
  assert(RatioBasisPoints(0, 0, kBasisPointScale) == kBasisPointScale);
  assert(RatioBasisPoints(12345, 0, kPercentScale) == kPercentScale);
  assert(RatioBasisPoints(kMax, 0, 7) == 7);
}

void TestAmortizedMonthlyPayment() {
  // (50000 + 50000*300*60/120000) / 60 = 57500 / 60
  assert(AmortizedMonthlyPayment(50000, 300, 60).value() == 958);
  assert(AmortizedMonthlyPayment(1200, 0, 12).value() == 100);
  assert(AmortizedMonthlyPayment(1, 2000, 360).value() == 0);

  // 100000 at 20% for 360 months: interest 600000, total 700000
  assert(AmortizedMonthlyPayment(100000, 2000, 360).value() == 1944);

  assert(!AmortizedMonthlyPayment(kMax, 2000, 360).has_value());
  assert(!AmortizedMonthlyPayment(kMaxAmount, 2000, 360).has_value());
}

} // namespace

int main() {
  TestCheckedArithmetic();
  TestMulDivIsExactWithoutFullProduct();
  TestMulDivLargeDivisorWithRemainder();
  TestRatioBasisPoints();
  TestAmortizedMonthlyPayment();

  std::cout << "credit_ledger_unit_fixed_point: pass\n";
  return 0;
}
