#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace credit::db::model {

/*
  Loan application row.

  IMPORTANT:
  - Retained after disbursement for audit; the active loan shares its id.
  - risk_score / interest_rate_bps are snapshots taken at apply time.
*/
struct LoanApplicationRecord {
  uint64_t    id = 0;
  std::string borrower;
  uint64_t    amount = 0;
  std::string purpose;
  uint32_t    term_months = 0;

  uint32_t risk_score        = 0;
  uint32_t interest_rate_bps = 0;

  credit::model::ApplicationStatus status = credit::model::ApplicationStatus::kUnspecified;

  uint64_t applied_at  = 0;
  uint64_t approved_at = 0; // 0 until approved
};

} // namespace credit::db::model
