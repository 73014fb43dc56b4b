#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/auth/caller_resolver.hpp"
#include "internal/core/credit_ledger.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace credit::factory {

/*
  Application

  Owns every long-lived object of the ledger. Callers resolve a principal
  through caller_resolver and hand the Caller to ledger.
*/
struct Application {
  std::shared_ptr<db::Repository>        repository;
  std::shared_ptr<util::TimestampSource> clock;
  std::shared_ptr<auth::CallerResolver>  caller_resolver;
  std::shared_ptr<core::CreditLedger>    ledger;
};

/*
  Build

  Composition root. The ONLY place allowed to know concrete DB types.
  Bootstraps the SQL schema for durable backends and initializes logging,
  tracing and metrics from the config. Throws std::runtime_error when a
  requested backend is not compiled in or cannot be opened.
*/
Application Build(const credit::runtime::config::RuntimeConfig& config);

// Flushes exporters and drops the logger. No ledger call may follow.
void Shutdown();

} // namespace credit::factory
