#include "internal/scoring/scoring_engine.hpp"

#include <cassert>
#include <iostream>

namespace {

using credit::db::model::BorrowerProfileRecord;
using credit::model::RiskCategory;
using credit::scoring::RiskAssessment;
using credit::scoring::ScoringEngine;

BorrowerProfileRecord ReferenceProfile() {
  BorrowerProfileRecord profile;
  profile.borrower          = "alice";
  profile.credit_score      = 720;
  profile.annual_income     = 100000;
  profile.total_debt        = 20000;
  profile.employment_years  = 5;
  profile.previous_defaults = 0;
  profile.on_time_payments  = 18;
  profile.total_loans       = 20;
  return profile;
}

bool SameAssessment(const RiskAssessment& a, const RiskAssessment& b) {
  return a.requested_amount == b.requested_amount && a.credit_score_component == b.credit_score_component &&
         a.debt_to_income_bps == b.debt_to_income_bps && a.debt_to_income_score == b.debt_to_income_score &&
         a.payment_history_score == b.payment_history_score && a.employment_score == b.employment_score &&
         a.default_score == b.default_score && a.loan_to_income_percent == b.loan_to_income_percent &&
         a.composite_score == b.composite_score && a.adjusted_score == b.adjusted_score &&
         a.lti_discount_applied == b.lti_discount_applied && a.final_risk_score == b.final_risk_score &&
         a.risk_category == b.risk_category && a.recommended_interest_bps == b.recommended_interest_bps &&
         a.max_recommended_amount == b.max_recommended_amount && a.approval_recommendation == b.approval_recommendation &&
         a.model_version == b.model_version;
}

void TestReferenceProfileBreakdown() {
  const auto a = ScoringEngine::Assess(ReferenceProfile(), 50000);

  assert(a.credit_score_component == 76); // 420 * 100 / 550
  assert(a.debt_to_income_bps == 2000);
  assert(a.debt_to_income_score == 60);
  assert(a.payment_history_score == 90);
  assert(a.employment_score == 50);
  assert(a.default_score == 100);
  assert(a.composite_score == 74); // 7460 / 100

  // exactly 50% of income is not above the threshold
  assert(a.loan_to_income_percent == 50);
  assert(!a.lti_discount_applied);
  assert(a.adjusted_score == 74);

  assert(a.final_risk_score == 759);
  assert(a.risk_category == RiskCategory::kLow);
  assert(a.recommended_interest_bps == 300);
  assert(a.max_recommended_amount == 40000);
  assert(a.approval_recommendation);
  assert(a.model_version == 1);
}

void TestLoanToIncomeDiscount() {
  const auto a = ScoringEngine::Assess(ReferenceProfile(), 60000);
  assert(a.loan_to_income_percent == 60);
  assert(a.lti_discount_applied);
  assert(a.adjusted_score == 70); // 74 * 950 / 1000
  assert(a.final_risk_score == 745);
}

void TestSubScoreEdges() {
  assert(ScoringEngine::CreditScoreComponent(300) == 0);
  assert(ScoringEngine::CreditScoreComponent(850) == 100);
  assert(ScoringEngine::CreditScoreComponent(299) == 0);

  assert(ScoringEngine::DebtToIncomeScore(0) == 100);
  assert(ScoringEngine::DebtToIncomeScore(4999) == 1);
  assert(ScoringEngine::DebtToIncomeScore(5000) == 0);

  assert(ScoringEngine::PaymentHistoryScore(0, 0) == 50);
  assert(ScoringEngine::PaymentHistoryScore(999, 0) == 50);
  assert(ScoringEngine::PaymentHistoryScore(10, 10) == 100);
  assert(ScoringEngine::PaymentHistoryScore(0, 10) == 0);

  assert(ScoringEngine::EmploymentScore(0) == 0);
  assert(ScoringEngine::EmploymentScore(10) == 100);
  assert(ScoringEngine::EmploymentScore(40) == 100);

  assert(ScoringEngine::DefaultScore(0) == 100);
  assert(ScoringEngine::DefaultScore(1) == 50);
  assert(ScoringEngine::DefaultScore(2) == 50);
  assert(ScoringEngine::DefaultScore(3) == 0);
}

void TestZeroIncomeUsesWorstCase() {
  auto profile          = ReferenceProfile();
  profile.annual_income = 0;
  profile.total_debt    = 0;

  const auto a = ScoringEngine::Assess(profile, 1);
  assert(a.debt_to_income_bps == 10000);
  assert(a.debt_to_income_score == 0);
  assert(a.loan_to_income_percent == 100);
  assert(a.lti_discount_applied);
  assert(a.max_recommended_amount == 0);
}

void TestLargeBalancesKeepExactRatios() {
  auto profile          = ReferenceProfile();
  profile.annual_income = 300000000000000000ULL;
  profile.total_debt    = 100000000000000000ULL;

  const auto a = ScoringEngine::Assess(profile, 200000000000000000ULL);
  assert(a.debt_to_income_bps == 3333);
  assert(a.debt_to_income_score == 34);
  assert(a.loan_to_income_percent == 66);
  assert(a.lti_discount_applied);
  assert(a.max_recommended_amount == 120000000000000000ULL);

  const auto small = ScoringEngine::Assess(profile, 100000000000000000ULL);
  assert(small.loan_to_income_percent == 33);
  assert(!small.lti_discount_applied);
}

void TestExtremeProfiles() {
  BorrowerProfileRecord worst;
  worst.credit_score      = 300;
  worst.annual_income     = 10000;
  worst.total_debt        = 10000;
  worst.on_time_payments  = 0;
  worst.total_loans       = 5;
  worst.employment_years  = 0;
  worst.previous_defaults = 7;

  const auto low = ScoringEngine::Assess(worst, 100000);
  assert(low.composite_score == 0);
  assert(low.final_risk_score == 500);
  assert(low.risk_category == RiskCategory::kHigh);
  assert(low.recommended_interest_bps == 1500);
  assert(low.approval_recommendation);

  BorrowerProfileRecord best;
  best.credit_score      = 850;
  best.annual_income     = 200000;
  best.total_debt        = 0;
  best.on_time_payments  = 12;
  best.total_loans       = 12;
  best.employment_years  = 15;
  best.previous_defaults = 0;

  const auto high = ScoringEngine::Assess(best, 1000);
  assert(high.composite_score == 100);
  assert(high.final_risk_score == 850);
  assert(high.risk_category == RiskCategory::kLow);
}

void TestMonotonicity() {
  auto     profile = ReferenceProfile();
  uint64_t last    = 0;
  for (uint64_t income = 1000; income <= 1000000; income += 7919) {
    profile.annual_income = income;
    const auto score      = ScoringEngine::Assess(profile, 1000).debt_to_income_score;
    assert(score >= last);
    last = score;
  }

  uint64_t previous = ScoringEngine::DefaultScore(0);
  for (uint64_t defaults = 1; defaults < 20; ++defaults) {
    const auto score = ScoringEngine::DefaultScore(defaults);
    assert(score <= previous);
    previous = score;
  }
}

void TestAssessmentIsDeterministic() {
  const auto profile = ReferenceProfile();
  const auto first   = ScoringEngine::Assess(profile, 75000);
  const auto second  = ScoringEngine::Assess(profile, 75000);
  assert(SameAssessment(first, second));
}

} // namespace

int main() {
  TestReferenceProfileBreakdown();
  TestLoanToIncomeDiscount();
  TestSubScoreEdges();
  TestZeroIncomeUsesWorstCase();
  TestLargeBalancesKeepExactRatios();
  TestExtremeProfiles();
  TestMonotonicity();
  TestAssessmentIsDeterministic();

  std::cout << "credit_ledger_unit_scoring_engine: pass\n";
  return 0;
}
