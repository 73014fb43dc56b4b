#include "internal/util/time.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using credit::util::SequenceTimestampSource;
using credit::util::SystemTimestampSource;

void TestSequenceAdvancesByOne() {
  SequenceTimestampSource clock(42);
  assert(clock.Now() == 42);
  assert(clock.Now() == 43);
  assert(clock.Now() == 44);
}

void TestSequenceIsUniqueAcrossThreads() {
  SequenceTimestampSource clock(1);

  std::vector<std::vector<uint64_t>> seen(4);
  std::vector<std::thread>           threads;
  for (std::size_t t = 0; t < seen.size(); ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 1000; ++i) {
        seen[t].push_back(clock.Now());
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<uint64_t> unique;
  for (const auto& values : seen) {
    unique.insert(values.begin(), values.end());
  }
  assert(unique.size() == 4000);
  assert(*unique.rbegin() == 4000);
}

void TestSystemClockNeverGoesBackwards() {
  SystemTimestampSource clock;
  uint64_t              last = clock.Now();
  assert(last > 0);
  for (int i = 0; i < 10000; ++i) {
    const auto now = clock.Now();
    assert(now >= last);
    last = now;
  }
}

void TestErrorCodeNames() {
  using credit::util::ErrorCode;
  assert(credit::util::ToString(ErrorCode::InsufficientScore) == "insufficient_score");
  assert(credit::util::ToString(ErrorCode::StorageFailure) == "storage_failure");

  credit::util::StatusOr<uint64_t> value(uint64_t{7});
  assert(value.ok() && *value == 7);

  credit::util::StatusOr<uint64_t> error(credit::util::Status::Err(ErrorCode::NotFound, "Get: missing"));
  assert(!error.ok());
  assert(error.code() == ErrorCode::NotFound);
  assert(error.status().message == "Get: missing");
}

} // namespace

int main() {
  TestSequenceAdvancesByOne();
  TestSequenceIsUniqueAcrossThreads();
  TestSystemClockNeverGoesBackwards();
  TestErrorCodeNames();

  std::cout << "credit_ledger_unit_timestamp_source: pass\n";
  return 0;
}
