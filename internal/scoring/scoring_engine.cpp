#include "scoring_engine.hpp"

#include <algorithm>
#include <limits>

#include "internal/math/fixed_point.hpp"
#include "internal/scoring/risk_bands.hpp"

namespace credit::scoring {

namespace {

constexpr uint64_t kCreditWeight     = 35;
constexpr uint64_t kDtiWeight        = 25;
constexpr uint64_t kPaymentWeight    = 20;
constexpr uint64_t kEmploymentWeight = 10;
constexpr uint64_t kDefaultsWeight   = 10;

constexpr uint64_t kDtiCutoffBps        = 5000;
constexpr uint64_t kDtiBpsPerPoint      = 50;
constexpr uint64_t kNeutralPaymentScore = 50;
constexpr uint64_t kLtiDiscountAbove    = 50;
constexpr uint64_t kLtiDiscountFactor   = 950; // per mille
constexpr uint64_t kMaxAmountPercent    = 40;

constexpr uint64_t kBaseScore  = 500;
constexpr uint64_t kScoreRange = 350;

constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();

uint64_t Weighted(uint64_t score, uint64_t weight) {
  return math::CheckedMul(score, weight).value_or(kMax);
}

uint64_t Accumulate(uint64_t total, uint64_t term) {
  return math::CheckedAdd(total, term).value_or(kMax);
}

} // namespace

uint64_t ScoringEngine::CreditScoreComponent(uint64_t credit_score) {
  const auto clamped = std::min(credit_score, kMaxCreditScore);
  return math::SaturatingSub(clamped, kMinCreditScore) * math::kPercentScale / (kMaxCreditScore - kMinCreditScore);
}

uint64_t ScoringEngine::DebtToIncomeScore(uint64_t dti_bps) {
  if (dti_bps >= kDtiCutoffBps) return 0;
  return math::kPercentScale - dti_bps / kDtiBpsPerPoint;
}

uint64_t ScoringEngine::PaymentHistoryScore(uint64_t on_time_payments, uint64_t total_loans) {
  if (total_loans == 0) return kNeutralPaymentScore;
  return math::RatioBasisPoints(on_time_payments, total_loans, math::kPercentScale);
}

uint64_t ScoringEngine::EmploymentScore(uint64_t employment_years) {
  return std::min<uint64_t>(Weighted(employment_years, 10), math::kPercentScale);
}

uint64_t ScoringEngine::DefaultScore(uint64_t previous_defaults) {
  if (previous_defaults == 0) return 100;
  if (previous_defaults <= 2) return 50;
  return 0;
}

RiskAssessment ScoringEngine::Assess(const db::model::BorrowerProfileRecord& profile, uint64_t requested_amount,
                                     uint32_t model_version) {
  RiskAssessment a;
  a.requested_amount = requested_amount;
  a.model_version    = model_version;

  a.credit_score_component = CreditScoreComponent(profile.credit_score);
  a.debt_to_income_bps     = math::RatioBasisPoints(profile.total_debt, profile.annual_income, math::kBasisPointScale);
  a.debt_to_income_score   = DebtToIncomeScore(a.debt_to_income_bps);
  a.payment_history_score  = PaymentHistoryScore(profile.on_time_payments, profile.total_loans);
  a.employment_score       = EmploymentScore(profile.employment_years);
  a.default_score          = DefaultScore(profile.previous_defaults);

  uint64_t weighted = 0;
  weighted          = Accumulate(weighted, Weighted(a.credit_score_component, kCreditWeight));
  weighted          = Accumulate(weighted, Weighted(a.debt_to_income_score, kDtiWeight));
  weighted          = Accumulate(weighted, Weighted(a.payment_history_score, kPaymentWeight));
  weighted          = Accumulate(weighted, Weighted(a.employment_score, kEmploymentWeight));
  weighted          = Accumulate(weighted, Weighted(a.default_score, kDefaultsWeight));
  a.composite_score = weighted / math::kPercentScale;

  // zero income: RatioBasisPoints yields the full scale, so the discount applies
  a.loan_to_income_percent = math::RatioBasisPoints(requested_amount, profile.annual_income, math::kPercentScale);
  a.lti_discount_applied   = a.loan_to_income_percent > kLtiDiscountAbove;
  a.adjusted_score         = a.lti_discount_applied ? math::MulDiv(a.composite_score, kLtiDiscountFactor, 1000) : a.composite_score;

  a.final_risk_score         = Accumulate(kBaseScore, math::MulDiv(a.adjusted_score, kScoreRange, math::kPercentScale));
  a.risk_category            = DeriveRiskCategory(a.final_risk_score);
  a.recommended_interest_bps = DeriveInterestRate(a.final_risk_score);
  a.max_recommended_amount   = math::MulDiv(profile.annual_income, kMaxAmountPercent, math::kPercentScale);
  a.approval_recommendation  = a.final_risk_score >= kMinimumApplicationScore;

  return a;
}

} // namespace credit::scoring
