#include "profile_store.hpp"

#include <utility>

#include "internal/math/fixed_point.hpp"
#include "internal/scoring/risk_bands.hpp"
#include "internal/scoring/scoring_engine.hpp"
#include "internal/util/db_status.hpp"

namespace credit::profile {

using util::ErrorCode;
using util::Status;

ProfileStore::ProfileStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::TimestampSource> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

Status ProfileStore::Validate(const auth::Caller& caller, const ProfileInput& input) {
  if (caller.principal.empty()) {
    return Status::Err(ErrorCode::Unauthorized, "RegisterProfile: caller has no principal");
  }
  if (input.credit_score < scoring::kMinCreditScore || input.credit_score > scoring::kMaxCreditScore) {
    return Status::Err(ErrorCode::InvalidParameters,
                       "RegisterProfile: credit score " + std::to_string(input.credit_score) + " outside [300, 850]");
  }
  if (input.annual_income > math::kMaxAmount || input.total_debt > math::kMaxAmount || input.on_time_payments > math::kMaxAmount ||
      input.total_loans > math::kMaxAmount) {
    return Status::Err(ErrorCode::InvalidParameters, "RegisterProfile: value exceeds storable range");
  }
  return Status::Ok();
}

util::StatusOr<db::model::BorrowerProfileRecord> ProfileStore::Register(db::Transaction& tx, const auth::Caller& caller,
                                                                        const ProfileInput& input) {
  if (auto status = Validate(caller, input); !status) {
    return status;
  }

  db::model::BorrowerProfileRecord record;
  record.borrower          = caller.principal;
  record.credit_score      = input.credit_score;
  record.annual_income     = input.annual_income;
  record.total_debt        = input.total_debt;
  record.employment_years  = input.employment_years;
  record.previous_defaults = input.previous_defaults;
  record.on_time_payments  = input.on_time_payments;
  record.total_loans       = input.total_loans;
  record.risk_category     = scoring::DeriveRiskCategory(input.credit_score);
  record.last_updated      = clock_->Now();

  if (auto status = util::FromDbResult("RegisterProfile", repository_->UpsertProfile(tx, record)); !status) {
    return status;
  }
  return record;
}

util::StatusOr<db::model::BorrowerProfileRecord> ProfileStore::Get(db::Transaction& tx, const std::string& borrower) {
  auto record = repository_->GetProfile(tx, borrower);
  if (!record) {
    return Status::Err(ErrorCode::NotFound, "GetProfile: no profile for '" + borrower + "'");
  }
  return *record;
}

} // namespace credit::profile
