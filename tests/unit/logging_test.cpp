#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace {

using credit::observability::BoolField;
using credit::observability::StringField;
using credit::observability::UintField;

// Rebuilds the logger from config and tees it into `out` with a bare pattern.
void CaptureInto(std::ostringstream& out, const credit::runtime::config::RuntimeConfig& config) {
  credit::observability::InitializeLogging(config);
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  sink->set_pattern("%l %v");
  spdlog::default_logger()->sinks().push_back(sink);
}

void TestFieldsAreKeyValueWithQuoting() {
  std::ostringstream                      out;
  credit::runtime::config::RuntimeConfig config;
  CaptureInto(out, config);

  CREDIT_LOG_INFO("ledger op ok", {StringField("route", "CreditLedger.Apply"), StringField("purpose", "bakery oven"),
                                   UintField("amount", 18446744073709551615ULL), BoolField("approved", true),
                                   StringField("principal", ""), StringField("error", "say \"no\"")});
  spdlog::default_logger()->flush();

  const auto line = out.str();
  assert(line.find("info ledger op ok route=CreditLedger.Apply") == 0);
  assert(line.find(" purpose=\"bakery oven\"") != std::string::npos);
  assert(line.find(" amount=18446744073709551615") != std::string::npos);
  assert(line.find(" approved=true") != std::string::npos);
  assert(line.find(" principal=\"\"") != std::string::npos);
  assert(line.find(" error=\"say \\\"no\\\"\"") != std::string::npos);
  // trace context is off by default
  assert(line.find("trace_id=") == std::string::npos);
}

void TestConfiguredLevelFiltersLines() {
  std::ostringstream                      out;
  credit::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("warn");
  config.mutable_logging()->set_include_trace_context(true);
  CaptureInto(out, config);

  {
    credit::observability::SpanScope span("CreditLedger.GetStats");
    CREDIT_LOG_INFO("ledger op ok", {StringField("route", "CreditLedger.GetStats")});
    CREDIT_LOG_WARN("ledger op rejected", {StringField("code", "not_found")});
  }
  spdlog::default_logger()->flush();

  const auto text = out.str();
  assert(text.find("ledger op ok") == std::string::npos);
  assert(text.find("warning ledger op rejected code=not_found") != std::string::npos);
}

} // namespace

int main() {
  TestFieldsAreKeyValueWithQuoting();
  TestConfiguredLevelFiltersLines();
  credit::observability::ShutdownLogging();

  std::cout << "credit_ledger_unit_logging: pass\n";
  return 0;
}
