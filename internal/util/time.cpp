#include "time.hpp"

#include <chrono>

namespace credit::util {

uint64_t UnixMillisNow() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

uint64_t SystemTimestampSource::Now() {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto now = UnixMillisNow();
  if (now > last_) {
    last_ = now;
  }
  return last_;
}

SequenceTimestampSource::SequenceTimestampSource(uint64_t start) : next_(start) {
}

uint64_t SequenceTimestampSource::Now() {
  return next_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace credit::util
