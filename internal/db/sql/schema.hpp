#pragma once

#include <string>
#include <vector>

namespace credit::db::sql {

/*
  Canonical DDL used by all SQL backends.

  IMPORTANT:
  DDL is written in the SQLite-compatible subset so the same statements
  bootstrap both engines. The statement constants further down use `?`
  placeholders (SQLite); PgPool prepares the $n equivalents.

  Monetary columns are BIGINT; values above INT64_MAX are rejected by the
  ledger before they reach storage.
*/

inline const std::vector<std::string>& BootstrapStatements() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS borrower_profile ("
      " borrower TEXT PRIMARY KEY,"
      " credit_score INTEGER NOT NULL,"
      " annual_income BIGINT NOT NULL,"
      " total_debt BIGINT NOT NULL,"
      " employment_years INTEGER NOT NULL,"
      " previous_defaults INTEGER NOT NULL,"
      " on_time_payments BIGINT NOT NULL,"
      " total_loans BIGINT NOT NULL,"
      " risk_category SMALLINT NOT NULL,"
      " last_updated BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS loan_application ("
      " id BIGINT PRIMARY KEY,"
      " borrower TEXT NOT NULL,"
      " amount BIGINT NOT NULL,"
      " purpose TEXT NOT NULL,"
      " term_months INTEGER NOT NULL,"
      " risk_score INTEGER NOT NULL,"
      " interest_rate_bps INTEGER NOT NULL,"
      " status SMALLINT NOT NULL,"
      " applied_at BIGINT NOT NULL,"
      " approved_at BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS active_loan ("
      " id BIGINT PRIMARY KEY REFERENCES loan_application(id),"
      " borrower TEXT NOT NULL,"
      " principal_amount BIGINT NOT NULL,"
      " outstanding_balance BIGINT NOT NULL,"
      " interest_rate_bps INTEGER NOT NULL,"
      " monthly_payment BIGINT NOT NULL,"
      " payments_made BIGINT NOT NULL,"
      " payments_missed BIGINT NOT NULL,"
      " term_months INTEGER NOT NULL,"
      " disbursed_at BIGINT NOT NULL,"
      " CHECK (outstanding_balance <= principal_amount));",

      "CREATE TABLE IF NOT EXISTS ledger_stats ("
      " singleton INTEGER PRIMARY KEY CHECK (singleton = 1),"
      " last_application_id BIGINT NOT NULL,"
      " total_loans_issued BIGINT NOT NULL,"
      " total_amount_disbursed BIGINT NOT NULL,"
      " model_version INTEGER NOT NULL);",

      "INSERT INTO ledger_stats(singleton,last_application_id,total_loans_issued,total_amount_disbursed,model_version)"
      " VALUES(1,0,0,0,1) ON CONFLICT(singleton) DO NOTHING;"};
  return kStatements;
}

// profiles

static constexpr const char* UPSERT_PROFILE =
    "INSERT INTO borrower_profile(borrower,credit_score,annual_income,total_debt,employment_years,"
    "previous_defaults,on_time_payments,total_loans,risk_category,last_updated)"
    " VALUES(?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(borrower) DO UPDATE SET"
    " credit_score=excluded.credit_score,"
    " annual_income=excluded.annual_income,"
    " total_debt=excluded.total_debt,"
    " employment_years=excluded.employment_years,"
    " previous_defaults=excluded.previous_defaults,"
    " on_time_payments=excluded.on_time_payments,"
    " total_loans=excluded.total_loans,"
    " risk_category=excluded.risk_category,"
    " last_updated=excluded.last_updated;";

static constexpr const char* SELECT_PROFILE =
    "SELECT borrower,credit_score,annual_income,total_debt,employment_years,"
    "previous_defaults,on_time_payments,total_loans,risk_category,last_updated"
    " FROM borrower_profile WHERE borrower=?;";

// applications

static constexpr const char* INSERT_APPLICATION =
    "INSERT INTO loan_application(id,borrower,amount,purpose,term_months,risk_score,"
    "interest_rate_bps,status,applied_at,approved_at)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_APPLICATION =
    "SELECT id,borrower,amount,purpose,term_months,risk_score,interest_rate_bps,status,applied_at,approved_at"
    " FROM loan_application WHERE id=?;";

static constexpr const char* UPDATE_APPLICATION =
    "UPDATE loan_application SET status=?,approved_at=? WHERE id=?;";

// loans

static constexpr const char* INSERT_LOAN =
    "INSERT INTO active_loan(id,borrower,principal_amount,outstanding_balance,interest_rate_bps,"
    "monthly_payment,payments_made,payments_missed,term_months,disbursed_at)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_LOAN =
    "SELECT id,borrower,principal_amount,outstanding_balance,interest_rate_bps,monthly_payment,"
    "payments_made,payments_missed,term_months,disbursed_at"
    " FROM active_loan WHERE id=?;";

static constexpr const char* UPDATE_LOAN =
    "UPDATE active_loan SET outstanding_balance=?,payments_made=?,payments_missed=? WHERE id=?;";

// counters

static constexpr const char* SELECT_STATS =
    "SELECT last_application_id,total_loans_issued,total_amount_disbursed,model_version"
    " FROM ledger_stats WHERE singleton=1;";

static constexpr const char* UPDATE_STATS =
    "UPDATE ledger_stats SET last_application_id=?,total_loans_issued=?,total_amount_disbursed=?,model_version=?"
    " WHERE singleton=1;";

} // namespace credit::db::sql
