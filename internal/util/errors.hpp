#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace credit::util {

/*
  Ledger-level error codes.

  Every ledger operation returns the first violated precondition.
  Storage failures are folded into StorageFailure; NotFound and
  AlreadyExists keep their meaning across both layers.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  InvalidAmount,
  InsufficientScore,
  Unauthorized,
  InvalidParameters,

  StorageFailure
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::InvalidAmount:
      return "invalid_amount";
    case ErrorCode::InsufficientScore:
      return "insufficient_score";
    case ErrorCode::Unauthorized:
      return "unauthorized";
    case ErrorCode::InvalidParameters:
      return "invalid_parameters";
    case ErrorCode::StorageFailure:
      return "storage_failure";
  }
  return "unknown";
}

struct Status {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Status Ok() {
    return {};
  }

  static Status Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  bool ok() const {
    return code == ErrorCode::OK;
  }

  explicit operator bool() const {
    return ok();
  }
};

template <typename T>
class StatusOr {
 public:
  StatusOr(T value) : value_(std::move(value)) {
  }

  StatusOr(Status status) : status_(std::move(status)) {
  }

  bool ok() const {
    return status_.ok() && value_.has_value();
  }

  explicit operator bool() const {
    return ok();
  }

  const Status& status() const {
    return status_;
  }

  ErrorCode code() const {
    return status_.code;
  }

  const T& value() const& {
    return *value_;
  }

  T& value() & {
    return *value_;
  }

  T&& value() && {
    return std::move(*value_);
  }

  const T& operator*() const& {
    return *value_;
  }

  const T* operator->() const {
    return &*value_;
  }

 private:
  Status           status_;
  std::optional<T> value_;
};

} // namespace credit::util
