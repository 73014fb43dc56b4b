#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace credit::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Profiles
// ------------------------------------------------------------------

Result MemoryRepository::UpsertProfile(Transaction& t, const model::BorrowerProfileRecord& r) {
  TX(t).Mutable().profiles[r.borrower] = r;
  return Result::Ok();
}

std::optional<model::BorrowerProfileRecord> MemoryRepository::GetProfile(Transaction& t, const std::string& borrower) {
  const auto& s  = TX(t).View();
  auto        it = s.profiles.find(borrower);
  if (it == s.profiles.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Applications
// ------------------------------------------------------------------

Result MemoryRepository::InsertApplication(Transaction& t, const model::LoanApplicationRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.applications.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "application " + std::to_string(r.id));
  s.applications[r.id] = r;
  return Result::Ok();
}

std::optional<model::LoanApplicationRecord> MemoryRepository::GetApplication(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.applications.find(id);
  if (it == s.applications.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateApplication(Transaction& t, const model::LoanApplicationRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.applications.contains(r.id)) return Result::Err(ErrorCode::NotFound, "application " + std::to_string(r.id));
  s.applications[r.id] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Loans
// ------------------------------------------------------------------

Result MemoryRepository::InsertLoan(Transaction& t, const model::ActiveLoanRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.loans.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "loan " + std::to_string(r.id));
  s.loans[r.id] = r;
  return Result::Ok();
}

std::optional<model::ActiveLoanRecord> MemoryRepository::GetLoan(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.loans.find(id);
  if (it == s.loans.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateLoan(Transaction& t, const model::ActiveLoanRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.loans.contains(r.id)) return Result::Err(ErrorCode::NotFound, "loan " + std::to_string(r.id));
  s.loans[r.id] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Counters
// ------------------------------------------------------------------

model::LedgerStatsRecord MemoryRepository::GetLedgerStats(Transaction& t) {
  return TX(t).View().stats;
}

Result MemoryRepository::UpdateLedgerStats(Transaction& t, const model::LedgerStatsRecord& r) {
  TX(t).Mutable().stats = r;
  return Result::Ok();
}

} // namespace credit::db::memory
