#pragma once

#include <cstdint>

#include "internal/db/model/borrower_profile_record.hpp"
#include "internal/model/risk_category.hpp"

namespace credit::scoring {

inline constexpr uint32_t kModelVersion = 1;

inline constexpr uint64_t kMinCreditScore = 300;
inline constexpr uint64_t kMaxCreditScore = 850;

/*
  Result of a comprehensive assessment.

  The sub-scores are each on 0..100 (payment_history_score may exceed 100
  when on-time payments outnumber loans; that relation is not enforced on
  profiles). Everything needed to reproduce the decision is carried here.
*/
struct RiskAssessment {
  uint64_t requested_amount = 0;

  // breakdown
  uint64_t credit_score_component = 0;
  uint64_t debt_to_income_bps     = 0;
  uint64_t debt_to_income_score   = 0;
  uint64_t payment_history_score  = 0;
  uint64_t employment_score       = 0;
  uint64_t default_score          = 0;
  uint64_t loan_to_income_percent = 0;
  uint64_t composite_score        = 0;
  uint64_t adjusted_score         = 0;
  bool     lti_discount_applied   = false;

  // outcome
  uint64_t                    final_risk_score         = 0;
  credit::model::RiskCategory risk_category            = credit::model::RiskCategory::kVeryHigh;
  uint32_t                    recommended_interest_bps = 0;
  uint64_t                    max_recommended_amount   = 0;
  bool                        approval_recommendation  = false;
  uint32_t                    model_version            = kModelVersion;
};

/*
  Stateless weighted-sum risk model.

    credit score     35
    debt-to-income   25
    payment history  20
    employment       10
    prior defaults   10

  A loan above half of annual income discounts the composite by 5%.
  final = 500 + adjusted * 350 / 100, so a composite of 0 still maps to the
  bottom of the "high" band.
*/
class ScoringEngine {
 public:
  static uint64_t CreditScoreComponent(uint64_t credit_score);
  static uint64_t DebtToIncomeScore(uint64_t dti_bps);
  static uint64_t PaymentHistoryScore(uint64_t on_time_payments, uint64_t total_loans);
  static uint64_t EmploymentScore(uint64_t employment_years);
  static uint64_t DefaultScore(uint64_t previous_defaults);

  static RiskAssessment Assess(const db::model::BorrowerProfileRecord& profile, uint64_t requested_amount,
                               uint32_t model_version = kModelVersion);
};

} // namespace credit::scoring
