#pragma once

#include <string>
#include <string_view>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace credit::util {

// Folds a repository Result into a ledger Status for operation `op`.
inline Status FromDbResult(std::string_view op, const db::Result& result) {
  if (result) return Status::Ok();

  const auto message = std::string(op) + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      return Status::Err(ErrorCode::NotFound, message);
    case db::ErrorCode::AlreadyExists:
      return Status::Err(ErrorCode::AlreadyExists, message);
    default:
      return Status::Err(ErrorCode::StorageFailure, message);
  }
}

} // namespace credit::util
