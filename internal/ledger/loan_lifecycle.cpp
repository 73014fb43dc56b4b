#include "loan_lifecycle.hpp"

#include <utility>

#include "internal/ledger/ledger_stats.hpp"
#include "internal/math/fixed_point.hpp"
#include "internal/scoring/risk_bands.hpp"
#include "internal/util/db_status.hpp"

namespace credit::ledger {

using credit::model::ApplicationStatus;
using util::ErrorCode;
using util::Status;

namespace {

std::string IdText(uint64_t id) {
  return "application " + std::to_string(id);
}

Status RequireOwner(std::string_view op, const auth::Caller& caller) {
  if (!caller.IsOwner()) {
    return Status::Err(ErrorCode::Unauthorized, std::string(op) + ": caller '" + caller.principal + "' is not the owner");
  }
  return Status::Ok();
}

} // namespace

Status ValidateLoanParameters(std::string_view op, uint32_t term_months, const std::string& purpose) {
  if (term_months < kMinTermMonths || term_months > kMaxTermMonths) {
    return Status::Err(ErrorCode::InvalidParameters,
                       std::string(op) + ": term " + std::to_string(term_months) + " months outside [6, 360]");
  }
  if (purpose.size() > kMaxPurposeLength) {
    return Status::Err(ErrorCode::InvalidParameters, std::string(op) + ": purpose longer than 100 bytes");
  }
  return Status::Ok();
}

model::LoanPhase LoanPhaseOf(const db::model::LoanApplicationRecord& application,
                             const std::optional<db::model::ActiveLoanRecord>& loan) {
  if (loan) {
    return loan->outstanding_balance == 0 ? model::LoanPhase::kRepaid : model::LoanPhase::kRepaying;
  }
  if (application.status == ApplicationStatus::kApproved) {
    return model::LoanPhase::kApproved;
  }
  return model::LoanPhase::kPending;
}

LoanLifecycle::LoanLifecycle(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::TimestampSource> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

util::StatusOr<uint64_t> LoanLifecycle::Apply(db::Transaction& tx, const auth::Caller& caller, uint64_t amount,
                                              const std::string& purpose, uint32_t term_months) {
  auto profile = repository_->GetProfile(tx, caller.principal);
  if (!profile) {
    return Status::Err(ErrorCode::NotFound, "Apply: no profile for '" + caller.principal + "'; register a profile first");
  }
  if (amount == 0) {
    return Status::Err(ErrorCode::InvalidAmount, "Apply: amount must be positive");
  }
  if (amount > math::kMaxAmount) {
    return Status::Err(ErrorCode::InvalidAmount, "Apply: amount exceeds storable range");
  }
  if (auto status = ValidateLoanParameters("Apply", term_months, purpose); !status) {
    return status;
  }
  if (profile->credit_score < scoring::kMinimumApplicationScore) {
    return Status::Err(ErrorCode::InsufficientScore,
                       "Apply: credit score " + std::to_string(profile->credit_score) + " below 500");
  }

  auto stats = LedgerStats::NextApplicationId(repository_->GetLedgerStats(tx));
  if (!stats) {
    return stats.status();
  }

  db::model::LoanApplicationRecord application;
  application.id                = stats->last_application_id;
  application.borrower          = caller.principal;
  application.amount            = amount;
  application.purpose           = purpose;
  application.term_months       = term_months;
  application.risk_score        = profile->credit_score;
  application.interest_rate_bps = scoring::DeriveInterestRate(profile->credit_score);
  application.status            = ApplicationStatus::kPending;
  application.applied_at        = clock_->Now();
  application.approved_at       = 0;

  if (auto status = util::FromDbResult("Apply", repository_->InsertApplication(tx, application)); !status) {
    return status;
  }
  if (auto status = util::FromDbResult("Apply", repository_->UpdateLedgerStats(tx, *stats)); !status) {
    return status;
  }
  return application.id;
}

Status LoanLifecycle::Approve(db::Transaction& tx, const auth::Caller& caller, uint64_t id) {
  if (auto status = RequireOwner("Approve", caller); !status) {
    return status;
  }

  auto application = repository_->GetApplication(tx, id);
  if (!application) {
    return Status::Err(ErrorCode::NotFound, "Approve: " + IdText(id) + " does not exist");
  }
  if (!model::CanTransition(application->status, ApplicationStatus::kApproved)) {
    return Status::Err(ErrorCode::InvalidParameters,
                       "Approve: " + IdText(id) + " is " + std::string(model::ToString(application->status)) + ", expected pending");
  }

  application->status      = ApplicationStatus::kApproved;
  application->approved_at = clock_->Now();
  return util::FromDbResult("Approve", repository_->UpdateApplication(tx, *application));
}

util::StatusOr<db::model::ActiveLoanRecord> LoanLifecycle::Disburse(db::Transaction& tx, const auth::Caller& caller, uint64_t id) {
  if (auto status = RequireOwner("Disburse", caller); !status) {
    return status;
  }

  auto application = repository_->GetApplication(tx, id);
  if (!application) {
    return Status::Err(ErrorCode::NotFound, "Disburse: " + IdText(id) + " does not exist");
  }
  if (!model::CanTransition(application->status, ApplicationStatus::kDisbursed)) {
    return Status::Err(ErrorCode::InvalidParameters,
                       "Disburse: " + IdText(id) + " is " + std::string(model::ToString(application->status)) + ", expected approved");
  }
  if (repository_->GetLoan(tx, id)) {
    return Status::Err(ErrorCode::AlreadyExists, "Disburse: loan " + std::to_string(id) + " already disbursed");
  }

  const auto monthly = math::AmortizedMonthlyPayment(application->amount, application->interest_rate_bps, application->term_months);
  if (!monthly) {
    return Status::Err(ErrorCode::InvalidAmount, "Disburse: monthly payment does not fit in 64 bits");
  }

  auto stats = LedgerStats::RecordDisbursement(repository_->GetLedgerStats(tx), application->amount);
  if (!stats) {
    return stats.status();
  }

  db::model::ActiveLoanRecord loan;
  loan.id                  = id;
  loan.borrower            = application->borrower;
  loan.principal_amount    = application->amount;
  loan.outstanding_balance = application->amount;
  loan.interest_rate_bps   = application->interest_rate_bps;
  loan.monthly_payment     = *monthly;
  loan.payments_made       = 0;
  loan.payments_missed     = 0;
  loan.term_months         = application->term_months;
  loan.disbursed_at        = clock_->Now();

  if (auto status = util::FromDbResult("Disburse", repository_->InsertLoan(tx, loan)); !status) {
    return status;
  }

  application->status = ApplicationStatus::kDisbursed;
  if (auto status = util::FromDbResult("Disburse", repository_->UpdateApplication(tx, *application)); !status) {
    return status;
  }
  if (auto status = util::FromDbResult("Disburse", repository_->UpdateLedgerStats(tx, *stats)); !status) {
    return status;
  }
  return loan;
}

util::StatusOr<uint64_t> LoanLifecycle::RecordPayment(db::Transaction& tx, const auth::Caller& caller, uint64_t id,
                                                      uint64_t payment_amount) {
  auto loan = repository_->GetLoan(tx, id);
  if (!loan) {
    return Status::Err(ErrorCode::NotFound, "RecordPayment: loan " + std::to_string(id) + " does not exist");
  }
  if (loan->borrower != caller.principal) {
    return Status::Err(ErrorCode::Unauthorized, "RecordPayment: caller '" + caller.principal + "' is not the borrower");
  }
  if (payment_amount == 0) {
    return Status::Err(ErrorCode::InvalidAmount, "RecordPayment: payment must be positive");
  }
  if (loan->outstanding_balance == 0) {
    return Status::Err(ErrorCode::InvalidAmount, "RecordPayment: loan " + std::to_string(id) + " is already repaid");
  }

  // Overpayment is clamped; the excess is not tracked.
  loan->outstanding_balance = math::SaturatingSub(loan->outstanding_balance, payment_amount);
  loan->payments_made += 1;

  if (auto status = util::FromDbResult("RecordPayment", repository_->UpdateLoan(tx, *loan)); !status) {
    return status;
  }
  return loan->outstanding_balance;
}

util::StatusOr<db::model::LoanApplicationRecord> LoanLifecycle::GetApplication(db::Transaction& tx, uint64_t id) {
  auto application = repository_->GetApplication(tx, id);
  if (!application) {
    return Status::Err(ErrorCode::NotFound, "GetApplication: " + IdText(id) + " does not exist");
  }
  return *application;
}

util::StatusOr<db::model::ActiveLoanRecord> LoanLifecycle::GetLoan(db::Transaction& tx, uint64_t id) {
  auto loan = repository_->GetLoan(tx, id);
  if (!loan) {
    return Status::Err(ErrorCode::NotFound, "GetActiveLoan: loan " + std::to_string(id) + " does not exist");
  }
  return *loan;
}

} // namespace credit::ledger
