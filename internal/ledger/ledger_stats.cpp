#include "ledger_stats.hpp"

#include "internal/math/fixed_point.hpp"

namespace credit::ledger {

using util::ErrorCode;
using util::Status;

util::StatusOr<db::model::LedgerStatsRecord> LedgerStats::RecordDisbursement(const db::model::LedgerStatsRecord& current,
                                                                              uint64_t amount) {
  const auto loans = math::CheckedAdd(current.total_loans_issued, 1);
  const auto total = math::CheckedAdd(current.total_amount_disbursed, amount);
  if (!loans || !total || *loans > math::kMaxAmount || *total > math::kMaxAmount) {
    return Status::Err(ErrorCode::InvalidAmount, "Disburse: ledger totals would overflow");
  }

  auto next                   = current;
  next.total_loans_issued     = *loans;
  next.total_amount_disbursed = *total;
  return next;
}

util::StatusOr<db::model::LedgerStatsRecord> LedgerStats::NextApplicationId(const db::model::LedgerStatsRecord& current) {
  const auto id = math::CheckedAdd(current.last_application_id, 1);
  if (!id || *id > math::kMaxAmount) {
    return Status::Err(ErrorCode::InvalidParameters, "Apply: application id space exhausted");
  }

  auto next                = current;
  next.last_application_id = *id;
  return next;
}

} // namespace credit::ledger
