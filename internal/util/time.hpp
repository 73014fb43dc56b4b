#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>

namespace credit::util {

/*
  Monotonic timestamp source.

  Every ledger write stamps its record through one of these; nothing else
  in the core reads a clock. Values never decrease.
*/
class TimestampSource {
 public:
  virtual ~TimestampSource() = default;

  virtual uint64_t Now() = 0;
};

// Unix milliseconds, clamped so a wall-clock step backwards is not observed.
class SystemTimestampSource final : public TimestampSource {
 public:
  uint64_t Now() override;

 private:
  std::mutex mutex_;
  uint64_t   last_ = 0;
};

// Block-height style counter: returns start, start + 1, ...
class SequenceTimestampSource final : public TimestampSource {
 public:
  explicit SequenceTimestampSource(uint64_t start = 1);

  uint64_t Now() override;

 private:
  std::atomic<uint64_t> next_;
};

uint64_t UnixMillisNow();

} // namespace credit::util
