#pragma once

#include <string>

namespace credit::auth {

enum class Role {
  kBorrower,
  kOwner,
};

/*
  Authenticated caller of a ledger operation.

  The principal is the borrower identity for profile and payment
  operations. Only the owner may approve or disburse.
*/
struct Caller {
  std::string principal;
  Role        role = Role::kBorrower;

  bool IsOwner() const {
    return role == Role::kOwner;
  }
};

} // namespace credit::auth
