#include "internal/ledger/loan_lifecycle.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/ledger_stats.hpp"
#include "internal/math/fixed_point.hpp"
#include "internal/profile/profile_store.hpp"

namespace {

using credit::auth::Caller;
using credit::auth::Role;
using credit::db::memory::MemoryRepository;
using credit::ledger::LedgerStats;
using credit::ledger::LoanLifecycle;
using credit::ledger::LoanPhaseOf;
using credit::model::ApplicationStatus;
using credit::model::LoanPhase;
using credit::profile::ProfileInput;
using credit::profile::ProfileStore;
using credit::util::ErrorCode;
using credit::util::SequenceTimestampSource;

const Caller kOwner{"owner", Role::kOwner};

struct Fixture {
  std::shared_ptr<MemoryRepository>        repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<SequenceTimestampSource> clock      = std::make_shared<SequenceTimestampSource>(1);
  ProfileStore                             profiles{repository, clock};
  LoanLifecycle                            lifecycle{repository, clock};

  void Register(const std::string& borrower, uint32_t credit_score) {
    ProfileInput input;
    input.credit_score  = credit_score;
    input.annual_income = 100000;
    input.total_debt    = 20000;

    auto tx = repository->Begin();
    assert(profiles.Register(*tx, Caller{borrower, Role::kBorrower}, input).ok());
    tx->Commit();
  }

  uint64_t ApplyApproveDisburse(const std::string& borrower, uint64_t amount) {
    auto tx = repository->Begin();
    auto id = lifecycle.Apply(*tx, Caller{borrower, Role::kBorrower}, amount, "inventory", 12);
    assert(id.ok());
    assert(lifecycle.Approve(*tx, kOwner, *id).ok());
    assert(lifecycle.Disburse(*tx, kOwner, *id).ok());
    tx->Commit();
    return *id;
  }
};

void TestApplyValidatesInOrder() {
  Fixture f;
  auto    tx    = f.repository->Begin();
  Caller  alice{"alice", Role::kBorrower};

  // no profile wins over every other violation
  assert(f.lifecycle.Apply(*tx, alice, 0, std::string(500, 'x'), 1).code() == ErrorCode::NotFound);

  f.Register("alice", 499);
  tx = f.repository->Begin();

  assert(f.lifecycle.Apply(*tx, alice, 0, std::string(500, 'x'), 1).code() == ErrorCode::InvalidAmount);
  assert(f.lifecycle.Apply(*tx, alice, credit::math::kMaxAmount + 1, "x", 12).code() == ErrorCode::InvalidAmount);
  assert(f.lifecycle.Apply(*tx, alice, 1000, "x", 5).code() == ErrorCode::InvalidParameters);
  assert(f.lifecycle.Apply(*tx, alice, 1000, "x", 361).code() == ErrorCode::InvalidParameters);
  assert(f.lifecycle.Apply(*tx, alice, 1000, std::string(101, 'x'), 12).code() == ErrorCode::InvalidParameters);
  assert(f.lifecycle.Apply(*tx, alice, 1000, "x", 12).code() == ErrorCode::InsufficientScore);

  // nothing advanced the id nonce
  assert(f.repository->GetLedgerStats(*tx).last_application_id == 0);
}

void TestApplyBoundaries() {
  Fixture f;
  f.Register("edge", 500);

  auto   tx = f.repository->Begin();
  Caller edge{"edge", Role::kBorrower};

  auto first = f.lifecycle.Apply(*tx, edge, 1, std::string(100, 'p'), 6);
  assert(first.ok());
  assert(*first == 1);

  auto second = f.lifecycle.Apply(*tx, edge, 1, "", 360);
  assert(second.ok());
  assert(*second == 2);

  auto application = f.lifecycle.GetApplication(*tx, 1);
  assert(application.ok());
  assert(application->status == ApplicationStatus::kPending);
  assert(application->risk_score == 500);
  assert(application->interest_rate_bps == 1500);
  assert(application->approved_at == 0);
  assert(application->applied_at != 0);
}

void TestApproveRules() {
  Fixture f;
  f.Register("alice", 720);

  auto   tx = f.repository->Begin();
  Caller alice{"alice", Role::kBorrower};
  auto   id = f.lifecycle.Apply(*tx, alice, 5000, "car", 24);
  assert(id.ok());

  assert(f.lifecycle.Approve(*tx, alice, *id).code == ErrorCode::Unauthorized);
  assert(f.lifecycle.Approve(*tx, kOwner, 999).code == ErrorCode::NotFound);
  assert(f.lifecycle.Approve(*tx, kOwner, *id).ok());
  assert(f.lifecycle.Approve(*tx, kOwner, *id).code == ErrorCode::InvalidParameters);

  auto application = f.lifecycle.GetApplication(*tx, *id);
  assert(application->status == ApplicationStatus::kApproved);
  assert(application->approved_at > application->applied_at);
}

void TestDisburseRules() {
  Fixture f;
  f.Register("alice", 720);

  auto   tx = f.repository->Begin();
  Caller alice{"alice", Role::kBorrower};
  auto   id = f.lifecycle.Apply(*tx, alice, 50000, "expansion", 60);
  assert(id.ok());

  assert(f.lifecycle.Disburse(*tx, alice, *id).code() == ErrorCode::Unauthorized);
  assert(f.lifecycle.Disburse(*tx, kOwner, 42).code() == ErrorCode::NotFound);
  assert(f.lifecycle.Disburse(*tx, kOwner, *id).code() == ErrorCode::InvalidParameters);

  assert(f.lifecycle.Approve(*tx, kOwner, *id).ok());
  auto loan = f.lifecycle.Disburse(*tx, kOwner, *id);
  assert(loan.ok());
  assert(loan->principal_amount == 50000);
  assert(loan->outstanding_balance == 50000);
  assert(loan->monthly_payment == 958);
  assert(loan->payments_made == 0);
  assert(loan->borrower == "alice");

  // second disbursement sees the terminal status
  assert(f.lifecycle.Disburse(*tx, kOwner, *id).code() == ErrorCode::InvalidParameters);

  auto application = f.lifecycle.GetApplication(*tx, *id);
  assert(application->status == ApplicationStatus::kDisbursed);

  auto stats = f.repository->GetLedgerStats(*tx);
  assert(stats.total_loans_issued == 1);
  assert(stats.total_amount_disbursed == 50000);
}

void TestDisburseRefusesExistingLoan() {
  Fixture f;
  f.Register("alice", 720);

  auto tx = f.repository->Begin();
  auto id = f.lifecycle.Apply(*tx, Caller{"alice", Role::kBorrower}, 1000, "x", 12);
  assert(id.ok());
  assert(f.lifecycle.Approve(*tx, kOwner, *id).ok());

  credit::db::model::ActiveLoanRecord stray;
  stray.id                  = *id;
  stray.borrower            = "alice";
  stray.principal_amount    = 1;
  stray.outstanding_balance = 1;
  assert(f.repository->InsertLoan(*tx, stray));

  assert(f.lifecycle.Disburse(*tx, kOwner, *id).code() == ErrorCode::AlreadyExists);
  assert(f.lifecycle.GetApplication(*tx, *id)->status == ApplicationStatus::kApproved);
}

void TestDisburseOverflowWritesNothing() {
  Fixture f;
  f.Register("whale", 720);

  auto tx = f.repository->Begin();
  auto id = f.lifecycle.Apply(*tx, Caller{"whale", Role::kBorrower}, credit::math::kMaxAmount, "x", 360);
  assert(id.ok());
  assert(f.lifecycle.Approve(*tx, kOwner, *id).ok());

  assert(f.lifecycle.Disburse(*tx, kOwner, *id).code() == ErrorCode::InvalidAmount);
  assert(f.lifecycle.GetApplication(*tx, *id)->status == ApplicationStatus::kApproved);
  assert(f.lifecycle.GetLoan(*tx, *id).code() == ErrorCode::NotFound);
  assert(f.repository->GetLedgerStats(*tx).total_loans_issued == 0);
}

void TestStatsOverflowIsInvalidAmount() {
  credit::db::model::LedgerStatsRecord stats;
  stats.total_amount_disbursed = credit::math::kMaxAmount - 10;

  assert(LedgerStats::RecordDisbursement(stats, 10).ok());
  assert(LedgerStats::RecordDisbursement(stats, 11).code() == ErrorCode::InvalidAmount);

  auto next = LedgerStats::RecordDisbursement(stats, 5);
  assert(next->total_loans_issued == 1);
  assert(next->total_amount_disbursed == credit::math::kMaxAmount - 5);
  assert(next->model_version == 1);
}

void TestRecordPaymentRules() {
  Fixture f;
  f.Register("alice", 720);
  const auto id = f.ApplyApproveDisburse("alice", 10000);

  auto   tx = f.repository->Begin();
  Caller alice{"alice", Role::kBorrower};

  assert(f.lifecycle.RecordPayment(*tx, alice, 777, 10).code() == ErrorCode::NotFound);
  assert(f.lifecycle.RecordPayment(*tx, Caller{"mallory", Role::kBorrower}, id, 10).code() == ErrorCode::Unauthorized);
  assert(f.lifecycle.RecordPayment(*tx, kOwner, id, 10).code() == ErrorCode::Unauthorized);
  assert(f.lifecycle.RecordPayment(*tx, alice, id, 0).code() == ErrorCode::InvalidAmount);

  // partial payments still count as one payment each
  auto balance = f.lifecycle.RecordPayment(*tx, alice, id, 1);
  assert(balance.ok() && *balance == 9999);
  balance = f.lifecycle.RecordPayment(*tx, alice, id, 1);
  assert(balance.ok() && *balance == 9998);

  // overpayment clamps to zero
  balance = f.lifecycle.RecordPayment(*tx, alice, id, 1000000);
  assert(balance.ok() && *balance == 0);

  auto loan = f.lifecycle.GetLoan(*tx, id);
  assert(loan->payments_made == 3);
  assert(loan->payments_missed == 0);
  assert(loan->principal_amount == 10000);

  assert(f.lifecycle.RecordPayment(*tx, alice, id, 1).code() == ErrorCode::InvalidAmount);
  assert(f.lifecycle.GetLoan(*tx, id)->payments_made == 3);
}

void TestLoanPhase() {
  Fixture f;
  f.Register("alice", 720);

  auto tx = f.repository->Begin();
  auto id = f.lifecycle.Apply(*tx, Caller{"alice", Role::kBorrower}, 100, "x", 6);
  assert(id.ok());

  auto phase_of = [&]() {
    auto application = f.repository->GetApplication(*tx, *id);
    return LoanPhaseOf(*application, f.repository->GetLoan(*tx, *id));
  };

  assert(phase_of() == LoanPhase::kPending);
  assert(f.lifecycle.Approve(*tx, kOwner, *id).ok());
  assert(phase_of() == LoanPhase::kApproved);
  assert(f.lifecycle.Disburse(*tx, kOwner, *id).ok());
  assert(phase_of() == LoanPhase::kRepaying);
  assert(f.lifecycle.RecordPayment(*tx, Caller{"alice", Role::kBorrower}, *id, 100).ok());
  assert(phase_of() == LoanPhase::kRepaid);
  assert(credit::model::ToString(phase_of()) == "repaid");
}

} // namespace

int main() {
  TestApplyValidatesInOrder();
  TestApplyBoundaries();
  TestApproveRules();
  TestDisburseRules();
  TestDisburseRefusesExistingLoan();
  TestDisburseOverflowWritesNothing();
  TestStatsOverflowIsInvalidAmount();
  TestRecordPaymentRules();
  TestLoanPhase();

  std::cout << "credit_ledger_unit_loan_lifecycle: pass\n";
  return 0;
}
