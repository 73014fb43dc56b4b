#include "pg_repository.hpp"

#include <cstdint>

namespace credit::db::postgres {

namespace {

// BIGINT / INTEGER columns are signed; values are range-checked by the ledger.
int64_t I64(uint64_t v) {
  return static_cast<int64_t>(v);
}

int64_t I64(uint32_t v) {
  return static_cast<int64_t>(v);
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Profiles
// ------------------------------------------------------------------

Result PgRepository::UpsertProfile(Transaction& t, const model::BorrowerProfileRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_profile", r.borrower, I64(r.credit_score), I64(r.annual_income), I64(r.total_debt),
                               I64(r.employment_years), I64(r.previous_defaults), I64(r.on_time_payments), I64(r.total_loans),
                               static_cast<int>(r.risk_category), I64(r.last_updated));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BorrowerProfileRecord> PgRepository::GetProfile(Transaction& t, const std::string& borrower) {
  auto res = TX(t).Work().exec_prepared("get_profile", borrower);
  if (res.empty()) return std::nullopt;

  const auto&                  row = res[0];
  model::BorrowerProfileRecord r;
  r.borrower          = row[0].c_str();
  r.credit_score      = row[1].as<uint32_t>();
  r.annual_income     = row[2].as<uint64_t>();
  r.total_debt        = row[3].as<uint64_t>();
  r.employment_years  = row[4].as<uint32_t>();
  r.previous_defaults = row[5].as<uint32_t>();
  r.on_time_payments  = row[6].as<uint64_t>();
  r.total_loans       = row[7].as<uint64_t>();
  r.risk_category     = static_cast<credit::model::RiskCategory>(row[8].as<int>());
  r.last_updated      = row[9].as<uint64_t>();
  return r;
}

// ------------------------------------------------------------------
// Applications
// ------------------------------------------------------------------

Result PgRepository::InsertApplication(Transaction& t, const model::LoanApplicationRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_application", I64(r.id), r.borrower, I64(r.amount), r.purpose, I64(r.term_months),
                               I64(r.risk_score), I64(r.interest_rate_bps), static_cast<int>(r.status), I64(r.applied_at),
                               I64(r.approved_at));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LoanApplicationRecord> PgRepository::GetApplication(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_prepared("get_application", I64(id));
  if (res.empty()) return std::nullopt;

  const auto&                  row = res[0];
  model::LoanApplicationRecord r;
  r.id                = row[0].as<uint64_t>();
  r.borrower          = row[1].c_str();
  r.amount            = row[2].as<uint64_t>();
  r.purpose           = row[3].c_str();
  r.term_months       = row[4].as<uint32_t>();
  r.risk_score        = row[5].as<uint32_t>();
  r.interest_rate_bps = row[6].as<uint32_t>();
  r.status            = static_cast<credit::model::ApplicationStatus>(row[7].as<int>());
  r.applied_at        = row[8].as<uint64_t>();
  r.approved_at       = row[9].as<uint64_t>();
  return r;
}

Result PgRepository::UpdateApplication(Transaction& t, const model::LoanApplicationRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_application", I64(r.id), static_cast<int>(r.status), I64(r.approved_at));
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "application " + std::to_string(r.id));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Loans
// ------------------------------------------------------------------

Result PgRepository::InsertLoan(Transaction& t, const model::ActiveLoanRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_loan", I64(r.id), r.borrower, I64(r.principal_amount), I64(r.outstanding_balance),
                               I64(r.interest_rate_bps), I64(r.monthly_payment), I64(r.payments_made), I64(r.payments_missed),
                               I64(r.term_months), I64(r.disbursed_at));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ActiveLoanRecord> PgRepository::GetLoan(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_prepared("get_loan", I64(id));
  if (res.empty()) return std::nullopt;

  const auto&             row = res[0];
  model::ActiveLoanRecord r;
  r.id                  = row[0].as<uint64_t>();
  r.borrower            = row[1].c_str();
  r.principal_amount    = row[2].as<uint64_t>();
  r.outstanding_balance = row[3].as<uint64_t>();
  r.interest_rate_bps   = row[4].as<uint32_t>();
  r.monthly_payment     = row[5].as<uint64_t>();
  r.payments_made       = row[6].as<uint64_t>();
  r.payments_missed     = row[7].as<uint64_t>();
  r.term_months         = row[8].as<uint32_t>();
  r.disbursed_at        = row[9].as<uint64_t>();
  return r;
}

Result PgRepository::UpdateLoan(Transaction& t, const model::ActiveLoanRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_loan", I64(r.id), I64(r.outstanding_balance), I64(r.payments_made),
                                          I64(r.payments_missed));
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "loan " + std::to_string(r.id));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Counters
// ------------------------------------------------------------------

model::LedgerStatsRecord PgRepository::GetLedgerStats(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("get_stats");

  model::LedgerStatsRecord r;
  if (res.empty()) return r;

  r.last_application_id    = res[0][0].as<uint64_t>();
  r.total_loans_issued     = res[0][1].as<uint64_t>();
  r.total_amount_disbursed = res[0][2].as<uint64_t>();
  r.model_version          = res[0][3].as<uint32_t>();
  return r;
}

Result PgRepository::UpdateLedgerStats(Transaction& t, const model::LedgerStatsRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_stats", I64(r.last_application_id), I64(r.total_loans_issued),
                                          I64(r.total_amount_disbursed), I64(r.model_version));
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "ledger_stats row missing; bootstrap the schema");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace credit::db::postgres
