#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#if CREDIT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CREDIT_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace credit::factory {

using credit::runtime::config::RuntimeConfig;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CREDIT_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->Bootstrap();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("factory: sqlite backend requested but not enabled at build time; rebuild with CREDIT_DB_SQLITE");
#endif
  }

  if (database.has_postgres()) {
#if CREDIT_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->Bootstrap();
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("factory: postgres backend requested but not enabled at build time; rebuild with CREDIT_DB_POSTGRES");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

const char* BackendName(const RuntimeConfig& config) {
  if (config.database().has_sqlite()) return "sqlite";
  if (config.database().has_postgres()) return "postgres";
  return "memory";
}

std::shared_ptr<util::TimestampSource> BuildClock(const RuntimeConfig& config) {
  const auto& ledger = config.ledger();
  if (ledger.timestamp_source() == credit::runtime::config::TIMESTAMP_SOURCE_SEQUENCE) {
    return std::make_shared<util::SequenceTimestampSource>(ledger.sequence_start() == 0 ? 1 : ledger.sequence_start());
  }
  return std::make_shared<util::SystemTimestampSource>();
}

} // namespace

Application Build(const RuntimeConfig& config) {
  observability::InitializeLogging(config);
  const bool tracing = observability::InitializeTracing(config);
  const bool metrics = observability::InitializeMetrics(config);

  Application app;
  app.repository      = BuildRepository(config);
  app.clock           = BuildClock(config);
  app.caller_resolver = std::make_shared<auth::CallerResolver>(config.ledger().owner_principal());
  app.ledger          = std::make_shared<core::CreditLedger>(app.repository, app.clock);

  CREDIT_LOG_INFO("credit ledger ready", {observability::StringField("backend", BackendName(config)),
                                          observability::StringField("owner", config.ledger().owner_principal()),
                                          observability::UintField("sequence_start", config.ledger().sequence_start()),
                                          observability::BoolField("tracing", tracing), observability::BoolField("metrics", metrics)});
  return app;
}

void Shutdown() {
  observability::ShutdownMetrics();
  observability::ShutdownTracing();
  observability::ShutdownLogging();
}

} // namespace credit::factory
