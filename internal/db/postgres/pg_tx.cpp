#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace credit::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (committed_ || rolled_back_) {
    return;
  }
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    CREDIT_LOG_WARN("postgres abort failed", {credit::observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  rolled_back_ = true;
}

}
