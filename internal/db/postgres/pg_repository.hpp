#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace credit::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
