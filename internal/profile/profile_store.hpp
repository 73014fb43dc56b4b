#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/auth/caller.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace credit::profile {

// Caller-supplied profile fields; the risk category and timestamp are derived.
struct ProfileInput {
  uint32_t credit_score      = 0;
  uint64_t annual_income     = 0;
  uint64_t total_debt        = 0;
  uint32_t employment_years  = 0;
  uint32_t previous_defaults = 0;
  uint64_t on_time_payments  = 0;
  uint64_t total_loans       = 0;
};

/*
  Sole writer of borrower profiles.

  A caller only ever writes the profile keyed by its own principal.
  Writes stage into the supplied transaction; the caller commits.
*/
class ProfileStore {
 public:
  ProfileStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::TimestampSource> clock);

  util::StatusOr<db::model::BorrowerProfileRecord> Register(db::Transaction& tx, const auth::Caller& caller, const ProfileInput& input);

  util::StatusOr<db::model::BorrowerProfileRecord> Get(db::Transaction& tx, const std::string& borrower);

  static util::Status Validate(const auth::Caller& caller, const ProfileInput& input);

 private:
  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<util::TimestampSource> clock_;
};

} // namespace credit::profile
