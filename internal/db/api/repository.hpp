#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/active_loan_record.hpp"
#include "internal/db/model/borrower_profile_record.hpp"
#include "internal/db/model/ledger_stats_record.hpp"
#include "internal/db/model/loan_application_record.hpp"

namespace credit::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A ledger operation's record writes and counter update commit together

  The DB is the source of truth for:
    borrower profiles
    applications and active loans
    ledger counters (id nonce, totals)
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Borrower profiles
  // ---------------------------------------------------------------------

  virtual Result UpsertProfile(Transaction&, const model::BorrowerProfileRecord&) = 0;

  virtual std::optional<model::BorrowerProfileRecord> GetProfile(Transaction&, const std::string& borrower) = 0;

  // ---------------------------------------------------------------------
  // Applications
  // ---------------------------------------------------------------------

  virtual Result InsertApplication(Transaction&, const model::LoanApplicationRecord&) = 0;

  virtual std::optional<model::LoanApplicationRecord> GetApplication(Transaction&, uint64_t id) = 0;

  virtual Result UpdateApplication(Transaction&, const model::LoanApplicationRecord&) = 0;

  // ---------------------------------------------------------------------
  // Active loans
  // ---------------------------------------------------------------------

  virtual Result InsertLoan(Transaction&, const model::ActiveLoanRecord&) = 0;

  virtual std::optional<model::ActiveLoanRecord> GetLoan(Transaction&, uint64_t id) = 0;

  virtual Result UpdateLoan(Transaction&, const model::ActiveLoanRecord&) = 0;

  // ---------------------------------------------------------------------
  // Ledger counters (singleton row)
  // ---------------------------------------------------------------------

  virtual model::LedgerStatsRecord GetLedgerStats(Transaction&) = 0;

  virtual Result UpdateLedgerStats(Transaction&, const model::LedgerStatsRecord&) = 0;
};

} // namespace credit::db
