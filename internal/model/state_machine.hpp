#pragma once

#include <cstdint>
#include <string_view>

namespace credit::model {

/*
  Application status. Forward-only: pending -> approved -> disbursed.
  Values are persisted; do not renumber.
*/
enum class ApplicationStatus : std::uint8_t {
  kUnspecified = 0,
  kPending     = 1,
  kApproved    = 2,
  kDisbursed   = 3,
};

// Derived view over an application and its loan (if any).
enum class LoanPhase : std::uint8_t {
  kPending   = 1,
  kApproved  = 2,
  kRepaying  = 3,
  kRepaid    = 4,
};

constexpr bool IsTerminal(ApplicationStatus status) {
  return status == ApplicationStatus::kDisbursed;
}

constexpr bool CanTransition(ApplicationStatus from, ApplicationStatus to) {
  if (IsTerminal(from) || from == ApplicationStatus::kUnspecified) {
    return false;
  }
  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr std::string_view ToString(ApplicationStatus status) {
  switch (status) {
    case ApplicationStatus::kPending:
      return "pending";
    case ApplicationStatus::kApproved:
      return "approved";
    case ApplicationStatus::kDisbursed:
      return "disbursed";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(LoanPhase phase) {
  switch (phase) {
    case LoanPhase::kPending:
      return "pending";
    case LoanPhase::kApproved:
      return "approved";
    case LoanPhase::kRepaying:
      return "repaying";
    case LoanPhase::kRepaid:
      return "repaid";
  }
  return "unknown";
}

} // namespace credit::model
