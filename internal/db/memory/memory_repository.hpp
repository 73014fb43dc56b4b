#pragma once

#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace credit::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::BorrowerProfileRecord> profiles;
    std::unordered_map<uint64_t, model::LoanApplicationRecord>    applications;
    std::unordered_map<uint64_t, model::ActiveLoanRecord>         loans;
    model::LedgerStatsRecord                                      stats;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
