#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace credit::runtime::config {
class RuntimeConfig;
}

namespace credit::observability {

// Both read config.observability(); they return false (and install nothing)
// when the matching *_enabled flag is off or OTel is not compiled in.
bool InitializeTracing(const credit::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const credit::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  SpanScope

  One span per ledger operation, active for the lifetime of the object.
  SetOutcome tags the span with "ok" or the error code name and marks it
  failed for anything but "ok".
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view operation);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetOutcome(std::string_view outcome, std::string_view message);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // outcome is "ok" or the ledger error code name.
  void RecordOperation(std::string_view operation, std::string_view outcome);
  void ObserveOperationLatencyMs(std::string_view operation, double latency_ms);
  void AddDisbursedAmount(std::uint64_t amount);
  void RecordLoanRepaid();

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const credit::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const credit::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetOutcome(std::string_view, std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordOperation(std::string_view, std::string_view) {
}

inline void Metrics::ObserveOperationLatencyMs(std::string_view, double) {
}

inline void Metrics::AddDisbursedAmount(std::uint64_t) {
}

inline void Metrics::RecordLoanRepaid() {
}
#endif

} // namespace credit::observability
