#pragma once

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>

#include "internal/auth/caller.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/loan_lifecycle.hpp"
#include "internal/profile/profile_store.hpp"
#include "internal/scoring/scoring_engine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace credit::core {

/*
  CreditLedger

  Single entry point into the ledger core.

  Concurrency model:
  - Mutating operations hold mutex_ exclusively for their whole duration,
    so the id nonce and counters are never read-then-written concurrently.
  - Read-only queries hold mutex_ shared and always see committed state.

  Each operation runs in one repository transaction that is committed
  only when the operation succeeded. Storage exceptions are converted to
  StorageFailure; nothing throws out of this class.
*/
class CreditLedger {
 public:
  CreditLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::TimestampSource> clock);

  // ---------------------------------------------------------------------
  // Mutating
  // ---------------------------------------------------------------------

  util::StatusOr<db::model::BorrowerProfileRecord> RegisterProfile(const auth::Caller& caller, const profile::ProfileInput& input);

  util::StatusOr<uint64_t> Apply(const auth::Caller& caller, uint64_t amount, const std::string& purpose, uint32_t term_months);

  util::Status Approve(const auth::Caller& caller, uint64_t id);

  util::Status Disburse(const auth::Caller& caller, uint64_t id);

  util::StatusOr<uint64_t> RecordPayment(const auth::Caller& caller, uint64_t id, uint64_t amount);

  // ---------------------------------------------------------------------
  // Read-only
  // ---------------------------------------------------------------------

  util::StatusOr<db::model::BorrowerProfileRecord> GetProfile(const std::string& borrower);
  util::StatusOr<db::model::LoanApplicationRecord> GetApplication(uint64_t id);
  util::StatusOr<db::model::ActiveLoanRecord>      GetActiveLoan(uint64_t id);
  util::StatusOr<db::model::LedgerStatsRecord>     GetStats();
  util::StatusOr<model::LoanPhase>                 GetLoanPhase(uint64_t id);

  util::StatusOr<scoring::RiskAssessment> AssessComprehensiveRisk(const std::string& borrower, uint64_t requested_amount,
                                                                  const std::string& purpose);

 private:
  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<util::TimestampSource> clock_;

  profile::ProfileStore  profiles_;
  ledger::LoanLifecycle  lifecycle_;

  mutable std::shared_mutex mutex_;
};

} // namespace credit::core
