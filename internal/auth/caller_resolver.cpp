#include "caller_resolver.hpp"

#include <stdexcept>
#include <utility>

namespace credit::auth {

CallerResolver::CallerResolver(std::string owner_principal) : owner_principal_(std::move(owner_principal)) {
  if (owner_principal_.empty()) {
    throw std::runtime_error("CallerResolver: owner principal is empty; set ledger.owner_principal");
  }
}

Caller CallerResolver::Resolve(const std::string& principal) const {
  Caller caller;
  caller.principal = principal;
  caller.role      = principal == owner_principal_ ? Role::kOwner : Role::kBorrower;
  return caller;
}

} // namespace credit::auth
