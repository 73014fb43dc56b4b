#pragma once

#include <cstdint>
#include <string>

#include "internal/model/risk_category.hpp"

namespace credit::db::model {

/*
  Persistent borrower profile, one per identity.

  risk_category is derived from credit_score on every write and is never
  set by callers.
*/
struct BorrowerProfileRecord {
  std::string borrower;

  uint32_t credit_score      = 0;
  uint64_t annual_income     = 0;
  uint64_t total_debt        = 0;
  uint32_t employment_years  = 0;
  uint32_t previous_defaults = 0;
  uint64_t on_time_payments  = 0;
  uint64_t total_loans       = 0;

  credit::model::RiskCategory risk_category = credit::model::RiskCategory::kVeryHigh;

  uint64_t last_updated = 0;
};

} // namespace credit::db::model
