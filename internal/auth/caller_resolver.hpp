#pragma once

#include <string>

#include "internal/auth/caller.hpp"

namespace credit::auth {

// Maps a principal to a Caller. The configured owner gets Role::kOwner.
class CallerResolver {
 public:
  explicit CallerResolver(std::string owner_principal);

  Caller Resolve(const std::string& principal) const;

  const std::string& owner_principal() const {
    return owner_principal_;
  }

 private:
  std::string owner_principal_;
};

} // namespace credit::auth
