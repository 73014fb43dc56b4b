#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/schema.hpp"

namespace credit::db::sqlite {

using credit::db::ErrorCode;
using credit::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU32(sqlite3_stmt* st, int idx, uint32_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

uint32_t ColU32(sqlite3_stmt* st, int col) {
  return static_cast<uint32_t>(sqlite3_column_int64(st, col));
}

// Steps a single-row SELECT. false when no row matched.
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Profiles
// ------------------------------------------------------------------

Result SqliteRepository::UpsertProfile(Transaction& t, const model::BorrowerProfileRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPSERT_PROFILE);

  BindText(st.get(), 1, r.borrower);
  BindU32(st.get(), 2, r.credit_score);
  BindU64(st.get(), 3, r.annual_income);
  BindU64(st.get(), 4, r.total_debt);
  BindU32(st.get(), 5, r.employment_years);
  BindU32(st.get(), 6, r.previous_defaults);
  BindU64(st.get(), 7, r.on_time_payments);
  BindU64(st.get(), 8, r.total_loans);
  BindU32(st.get(), 9, static_cast<uint32_t>(r.risk_category));
  BindU64(st.get(), 10, r.last_updated);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::BorrowerProfileRecord>
SqliteRepository::GetProfile(Transaction& t, const std::string& borrower) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_PROFILE);

  BindText(st.get(), 1, borrower);
  if (!StepRow(db, st.get())) return std::nullopt;

  model::BorrowerProfileRecord r;
  r.borrower          = ColText(st.get(), 0);
  r.credit_score      = ColU32(st.get(), 1);
  r.annual_income     = ColU64(st.get(), 2);
  r.total_debt        = ColU64(st.get(), 3);
  r.employment_years  = ColU32(st.get(), 4);
  r.previous_defaults = ColU32(st.get(), 5);
  r.on_time_payments  = ColU64(st.get(), 6);
  r.total_loans       = ColU64(st.get(), 7);
  r.risk_category     = static_cast<credit::model::RiskCategory>(ColU32(st.get(), 8));
  r.last_updated      = ColU64(st.get(), 9);
  return r;
}

// ------------------------------------------------------------------
// Applications
// ------------------------------------------------------------------

Result SqliteRepository::InsertApplication(Transaction& t, const model::LoanApplicationRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INSERT_APPLICATION);

  BindU64(st.get(), 1, r.id);
  BindText(st.get(), 2, r.borrower);
  BindU64(st.get(), 3, r.amount);
  BindText(st.get(), 4, r.purpose);
  BindU32(st.get(), 5, r.term_months);
  BindU32(st.get(), 6, r.risk_score);
  BindU32(st.get(), 7, r.interest_rate_bps);
  BindU32(st.get(), 8, static_cast<uint32_t>(r.status));
  BindU64(st.get(), 9, r.applied_at);
  BindU64(st.get(), 10, r.approved_at);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::LoanApplicationRecord>
SqliteRepository::GetApplication(Transaction& t, uint64_t id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_APPLICATION);

  BindU64(st.get(), 1, id);
  if (!StepRow(db, st.get())) return std::nullopt;

  model::LoanApplicationRecord r;
  r.id                = ColU64(st.get(), 0);
  r.borrower          = ColText(st.get(), 1);
  r.amount            = ColU64(st.get(), 2);
  r.purpose           = ColText(st.get(), 3);
  r.term_months       = ColU32(st.get(), 4);
  r.risk_score        = ColU32(st.get(), 5);
  r.interest_rate_bps = ColU32(st.get(), 6);
  r.status            = static_cast<credit::model::ApplicationStatus>(ColU32(st.get(), 7));
  r.applied_at        = ColU64(st.get(), 8);
  r.approved_at       = ColU64(st.get(), 9);
  return r;
}

Result SqliteRepository::UpdateApplication(Transaction& t, const model::LoanApplicationRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPDATE_APPLICATION);

  BindU32(st.get(), 1, static_cast<uint32_t>(r.status));
  BindU64(st.get(), 2, r.approved_at);
  BindU64(st.get(), 3, r.id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "application " + std::to_string(r.id));
  }
  return result;
}

// ------------------------------------------------------------------
// Loans
// ------------------------------------------------------------------

Result SqliteRepository::InsertLoan(Transaction& t, const model::ActiveLoanRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INSERT_LOAN);

  BindU64(st.get(), 1, r.id);
  BindText(st.get(), 2, r.borrower);
  BindU64(st.get(), 3, r.principal_amount);
  BindU64(st.get(), 4, r.outstanding_balance);
  BindU32(st.get(), 5, r.interest_rate_bps);
  BindU64(st.get(), 6, r.monthly_payment);
  BindU64(st.get(), 7, r.payments_made);
  BindU64(st.get(), 8, r.payments_missed);
  BindU32(st.get(), 9, r.term_months);
  BindU64(st.get(), 10, r.disbursed_at);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ActiveLoanRecord>
SqliteRepository::GetLoan(Transaction& t, uint64_t id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_LOAN);

  BindU64(st.get(), 1, id);
  if (!StepRow(db, st.get())) return std::nullopt;

  model::ActiveLoanRecord r;
  r.id                  = ColU64(st.get(), 0);
  r.borrower            = ColText(st.get(), 1);
  r.principal_amount    = ColU64(st.get(), 2);
  r.outstanding_balance = ColU64(st.get(), 3);
  r.interest_rate_bps   = ColU32(st.get(), 4);
  r.monthly_payment     = ColU64(st.get(), 5);
  r.payments_made       = ColU64(st.get(), 6);
  r.payments_missed     = ColU64(st.get(), 7);
  r.term_months         = ColU32(st.get(), 8);
  r.disbursed_at        = ColU64(st.get(), 9);
  return r;
}

Result SqliteRepository::UpdateLoan(Transaction& t, const model::ActiveLoanRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPDATE_LOAN);

  BindU64(st.get(), 1, r.outstanding_balance);
  BindU64(st.get(), 2, r.payments_made);
  BindU64(st.get(), 3, r.payments_missed);
  BindU64(st.get(), 4, r.id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "loan " + std::to_string(r.id));
  }
  return result;
}

// ------------------------------------------------------------------
// Counters
// ------------------------------------------------------------------

model::LedgerStatsRecord SqliteRepository::GetLedgerStats(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_STATS);

  model::LedgerStatsRecord r;
  if (!StepRow(db, st.get())) {
    // bootstrap seeds the row; a missing row means an empty ledger
    return r;
  }
  r.last_application_id    = ColU64(st.get(), 0);
  r.total_loans_issued     = ColU64(st.get(), 1);
  r.total_amount_disbursed = ColU64(st.get(), 2);
  r.model_version          = ColU32(st.get(), 3);
  return r;
}

Result SqliteRepository::UpdateLedgerStats(Transaction& t, const model::LedgerStatsRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPDATE_STATS);

  BindU64(st.get(), 1, r.last_application_id);
  BindU64(st.get(), 2, r.total_loans_issued);
  BindU64(st.get(), 3, r.total_amount_disbursed);
  BindU32(st.get(), 4, r.model_version);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "ledger_stats row missing; bootstrap the schema");
  }
  return result;
}

} // namespace credit::db::sqlite
