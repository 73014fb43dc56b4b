#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/auth/caller.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace credit::ledger {

inline constexpr uint32_t    kMinTermMonths    = 6;
inline constexpr uint32_t    kMaxTermMonths    = 360;
inline constexpr std::size_t kMaxPurposeLength = 100; // bytes

/*
  LoanLifecycle

  Application state machine:

    pending -> approved -> disbursed

  and, once disbursed, the active loan:

    repaying (balance > 0) -> repaid (balance == 0)

  No backward transitions, no cancellation.

  Every operation validates all of its preconditions before staging any
  write into the supplied transaction, so a rejected operation leaves the
  transaction untouched. The caller commits.
*/
class LoanLifecycle {
 public:
  LoanLifecycle(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::TimestampSource> clock);

  util::StatusOr<uint64_t> Apply(db::Transaction& tx, const auth::Caller& caller, uint64_t amount, const std::string& purpose,
                                 uint32_t term_months);

  util::Status Approve(db::Transaction& tx, const auth::Caller& caller, uint64_t id);

  util::StatusOr<db::model::ActiveLoanRecord> Disburse(db::Transaction& tx, const auth::Caller& caller, uint64_t id);

  // Returns the new outstanding balance.
  util::StatusOr<uint64_t> RecordPayment(db::Transaction& tx, const auth::Caller& caller, uint64_t id, uint64_t payment_amount);

  util::StatusOr<db::model::LoanApplicationRecord> GetApplication(db::Transaction& tx, uint64_t id);
  util::StatusOr<db::model::ActiveLoanRecord>      GetLoan(db::Transaction& tx, uint64_t id);

 private:
  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<util::TimestampSource> clock_;
};

util::Status ValidateLoanParameters(std::string_view op, uint32_t term_months, const std::string& purpose);

model::LoanPhase LoanPhaseOf(const db::model::LoanApplicationRecord& application,
                             const std::optional<db::model::ActiveLoanRecord>& loan);

} // namespace credit::ledger
