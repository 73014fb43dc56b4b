#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace credit::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertProfile(Transaction&, const model::BorrowerProfileRecord&) override;
  std::optional<model::BorrowerProfileRecord> GetProfile(Transaction&, const std::string&) override;

  Result InsertApplication(Transaction&, const model::LoanApplicationRecord&) override;
  std::optional<model::LoanApplicationRecord> GetApplication(Transaction&, uint64_t) override;
  Result UpdateApplication(Transaction&, const model::LoanApplicationRecord&) override;

  Result InsertLoan(Transaction&, const model::ActiveLoanRecord&) override;
  std::optional<model::ActiveLoanRecord> GetLoan(Transaction&, uint64_t) override;
  Result UpdateLoan(Transaction&, const model::ActiveLoanRecord&) override;

  model::LedgerStatsRecord GetLedgerStats(Transaction&) override;
  Result UpdateLedgerStats(Transaction&, const model::LedgerStatsRecord&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
