#include "pg_pool.hpp"

#include "internal/db/sql/schema.hpp"

namespace credit::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        std::unique_ptr<pqxx::connection> conn;
        try {
          conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
        return Wrap(conn.release());
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::Bootstrap() {
  // own connection: pooled ones prepare statements against these tables
  pqxx::connection conn(conninfo_);
  pqxx::work       tx(conn);
  for (const auto& sql : db::sql::BootstrapStatements()) {
    tx.exec(sql);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("upsert_profile",
               "INSERT INTO borrower_profile(borrower,credit_score,annual_income,total_debt,employment_years,"
               "previous_defaults,on_time_payments,total_loans,risk_category,last_updated) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) "
               "ON CONFLICT(borrower) DO UPDATE SET credit_score=EXCLUDED.credit_score,annual_income=EXCLUDED.annual_income,"
               "total_debt=EXCLUDED.total_debt,employment_years=EXCLUDED.employment_years,"
               "previous_defaults=EXCLUDED.previous_defaults,on_time_payments=EXCLUDED.on_time_payments,"
               "total_loans=EXCLUDED.total_loans,risk_category=EXCLUDED.risk_category,last_updated=EXCLUDED.last_updated");

  conn.prepare("get_profile",
               "SELECT borrower,credit_score,annual_income,total_debt,employment_years,previous_defaults,"
               "on_time_payments,total_loans,risk_category,last_updated FROM borrower_profile WHERE borrower=$1");

  conn.prepare("insert_application",
               "INSERT INTO loan_application(id,borrower,amount,purpose,term_months,risk_score,interest_rate_bps,"
               "status,applied_at,approved_at) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10)");

  conn.prepare("get_application",
               "SELECT id,borrower,amount,purpose,term_months,risk_score,interest_rate_bps,status,applied_at,approved_at "
               "FROM loan_application WHERE id=$1");

  conn.prepare("update_application", "UPDATE loan_application SET status=$2,approved_at=$3 WHERE id=$1");

  conn.prepare("insert_loan",
               "INSERT INTO active_loan(id,borrower,principal_amount,outstanding_balance,interest_rate_bps,"
               "monthly_payment,payments_made,payments_missed,term_months,disbursed_at) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10)");

  conn.prepare("get_loan",
               "SELECT id,borrower,principal_amount,outstanding_balance,interest_rate_bps,monthly_payment,"
               "payments_made,payments_missed,term_months,disbursed_at FROM active_loan WHERE id=$1");

  conn.prepare("update_loan", "UPDATE active_loan SET outstanding_balance=$2,payments_made=$3,payments_missed=$4 WHERE id=$1");

  conn.prepare("get_stats",
               "SELECT last_application_id,total_loans_issued,total_amount_disbursed,model_version "
               "FROM ledger_stats WHERE singleton=1");

  conn.prepare("update_stats",
               "UPDATE ledger_stats SET last_application_id=$1,total_loans_issued=$2,total_amount_disbursed=$3,"
               "model_version=$4 WHERE singleton=1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace credit::db::postgres
