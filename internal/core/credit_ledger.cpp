#include "credit_ledger.hpp"

#include <chrono>
#include <exception>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace credit::core {

using util::ErrorCode;
using util::Status;

namespace {

const Status& StatusOf(const Status& status) {
  return status;
}

template <typename T>
const Status& StatusOf(const util::StatusOr<T>& result) {
  return result.status();
}

void LogOutcome(std::string_view route, std::string_view principal, const Status& status) {
  using namespace credit::observability;
  if (status.ok()) {
    CREDIT_LOG_INFO("ledger op ok", {StringField("route", route), StringField("principal", principal)});
    return;
  }
  if (status.code == ErrorCode::StorageFailure) {
    CREDIT_LOG_ERROR("ledger op failed", {StringField("route", route), StringField("principal", principal),
                                          StringField("code", util::ToString(status.code)), StringField("error", status.message)});
    return;
  }
  CREDIT_LOG_WARN("ledger op rejected", {StringField("route", route), StringField("principal", principal),
                                         StringField("code", util::ToString(status.code)), StringField("error", status.message)});
}

template <typename Fn>
auto ObserveOp(std::string_view route, std::string_view principal, Fn&& fn) -> std::invoke_result_t<Fn> {
  using Outcome = std::invoke_result_t<Fn>;

  credit::observability::SpanScope span(route);
  span.SetAttribute("credit.principal", principal);

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](const Status& status) {
    const std::string_view outcome = status.ok() ? std::string_view("ok") : util::ToString(status.code);
    span.SetOutcome(outcome, status.message);
    LogOutcome(route, principal, status);
    auto& metrics = credit::observability::Metrics::Instance();
    metrics.RecordOperation(route, outcome);
    metrics.ObserveOperationLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    Outcome outcome = fn();
    finish(StatusOf(outcome));
    return outcome;
  } catch (const std::exception& ex) {
    Outcome outcome = Status::Err(ErrorCode::StorageFailure, std::string(route) + ": " + ex.what());
    finish(StatusOf(outcome));
    return outcome;
  }
}

// Commits when the staged operation succeeded; otherwise the transaction
// rolls back on destruction.
template <typename Outcome>
Outcome CommitIfOk(db::Transaction& tx, Outcome outcome) {
  if (StatusOf(outcome).ok()) {
    tx.Commit();
  }
  return outcome;
}

} // namespace

CreditLedger::CreditLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::TimestampSource> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)), profiles_(repository_, clock_), lifecycle_(repository_, clock_) {
}

// ------------------------------------------------------------------
// Mutating
// ------------------------------------------------------------------

util::StatusOr<db::model::BorrowerProfileRecord> CreditLedger::RegisterProfile(const auth::Caller& caller, const profile::ProfileInput& input) {
  return ObserveOp("CreditLedger.RegisterProfile", caller.principal, [&] {
    std::unique_lock lock(mutex_);
    auto             tx = repository_->Begin();
    return CommitIfOk(*tx, profiles_.Register(*tx, caller, input));
  });
}

util::StatusOr<uint64_t> CreditLedger::Apply(const auth::Caller& caller, uint64_t amount, const std::string& purpose, uint32_t term_months) {
  return ObserveOp("CreditLedger.Apply", caller.principal, [&] {
    std::unique_lock lock(mutex_);
    auto             tx = repository_->Begin();
    return CommitIfOk(*tx, lifecycle_.Apply(*tx, caller, amount, purpose, term_months));
  });
}

Status CreditLedger::Approve(const auth::Caller& caller, uint64_t id) {
  return ObserveOp("CreditLedger.Approve", caller.principal, [&] {
    std::unique_lock lock(mutex_);
    auto             tx = repository_->Begin();
    return CommitIfOk(*tx, lifecycle_.Approve(*tx, caller, id));
  });
}

Status CreditLedger::Disburse(const auth::Caller& caller, uint64_t id) {
  return ObserveOp("CreditLedger.Disburse", caller.principal, [&]() -> Status {
    std::unique_lock lock(mutex_);
    auto             tx   = repository_->Begin();
    auto             loan = CommitIfOk(*tx, lifecycle_.Disburse(*tx, caller, id));
    if (!loan) {
      return loan.status();
    }
    credit::observability::Metrics::Instance().AddDisbursedAmount(loan->principal_amount);
    return Status::Ok();
  });
}

util::StatusOr<uint64_t> CreditLedger::RecordPayment(const auth::Caller& caller, uint64_t id, uint64_t amount) {
  return ObserveOp("CreditLedger.RecordPayment", caller.principal, [&] {
    std::unique_lock lock(mutex_);
    auto             tx      = repository_->Begin();
    auto             balance = CommitIfOk(*tx, lifecycle_.RecordPayment(*tx, caller, id, amount));
    if (balance && *balance == 0) {
      credit::observability::Metrics::Instance().RecordLoanRepaid();
    }
    return balance;
  });
}

// ------------------------------------------------------------------
// Read-only
// ------------------------------------------------------------------

util::StatusOr<db::model::BorrowerProfileRecord> CreditLedger::GetProfile(const std::string& borrower) {
  return ObserveOp("CreditLedger.GetProfile", borrower, [&] {
    std::shared_lock lock(mutex_);
    auto             tx = repository_->Begin();
    return profiles_.Get(*tx, borrower);
  });
}

util::StatusOr<db::model::LoanApplicationRecord> CreditLedger::GetApplication(uint64_t id) {
  return ObserveOp("CreditLedger.GetApplication", "", [&] {
    std::shared_lock lock(mutex_);
    auto             tx = repository_->Begin();
    return lifecycle_.GetApplication(*tx, id);
  });
}

util::StatusOr<db::model::ActiveLoanRecord> CreditLedger::GetActiveLoan(uint64_t id) {
  return ObserveOp("CreditLedger.GetActiveLoan", "", [&] {
    std::shared_lock lock(mutex_);
    auto             tx = repository_->Begin();
    return lifecycle_.GetLoan(*tx, id);
  });
}

util::StatusOr<db::model::LedgerStatsRecord> CreditLedger::GetStats() {
  return ObserveOp("CreditLedger.GetStats", "", [&]() -> util::StatusOr<db::model::LedgerStatsRecord> {
    std::shared_lock lock(mutex_);
    auto             tx = repository_->Begin();
    return repository_->GetLedgerStats(*tx);
  });
}

util::StatusOr<model::LoanPhase> CreditLedger::GetLoanPhase(uint64_t id) {
  return ObserveOp("CreditLedger.GetLoanPhase", "", [&]() -> util::StatusOr<model::LoanPhase> {
    std::shared_lock lock(mutex_);
    auto             tx          = repository_->Begin();
    auto             application = lifecycle_.GetApplication(*tx, id);
    if (!application) {
      return application.status();
    }
    return ledger::LoanPhaseOf(*application, repository_->GetLoan(*tx, id));
  });
}

util::StatusOr<scoring::RiskAssessment> CreditLedger::AssessComprehensiveRisk(const std::string& borrower, uint64_t requested_amount,
                                                                              const std::string& purpose) {
  return ObserveOp("CreditLedger.AssessComprehensiveRisk", borrower, [&]() -> util::StatusOr<scoring::RiskAssessment> {
    std::shared_lock lock(mutex_);
    auto             tx      = repository_->Begin();
    auto             profile = profiles_.Get(*tx, borrower);
    if (!profile) {
      return Status::Err(ErrorCode::NotFound, "AssessComprehensiveRisk: no profile for '" + borrower + "'");
    }
    if (requested_amount == 0) {
      return Status::Err(ErrorCode::InvalidAmount, "AssessComprehensiveRisk: requested amount must be positive");
    }
    if (purpose.size() > ledger::kMaxPurposeLength) {
      return Status::Err(ErrorCode::InvalidParameters, "AssessComprehensiveRisk: purpose longer than 100 bytes");
    }

    const auto stats = repository_->GetLedgerStats(*tx);
    return scoring::ScoringEngine::Assess(*profile, requested_amount, stats.model_version);
  });
}

} // namespace credit::core
