#pragma once

#include <cstdint>
#include <string>

namespace credit::db::model {

/*
  Disbursed loan, keyed by the originating application id.

  principal_amount, interest_rate_bps and monthly_payment are fixed at
  disbursement. outstanding_balance only decreases.
*/
struct ActiveLoanRecord {
  uint64_t    id = 0;
  std::string borrower;

  uint64_t principal_amount    = 0;
  uint64_t outstanding_balance = 0;
  uint32_t interest_rate_bps   = 0;
  uint64_t monthly_payment     = 0;

  uint64_t payments_made   = 0;
  uint64_t payments_missed = 0;

  uint32_t term_months  = 0;
  uint64_t disbursed_at = 0;
};

} // namespace credit::db::model
