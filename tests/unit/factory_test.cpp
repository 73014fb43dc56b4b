#include "internal/factory.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"

namespace {

using credit::config::ConfigLoader;
using credit::profile::ProfileInput;

ProfileInput Input() {
  ProfileInput input;
  input.credit_score  = 700;
  input.annual_income = 90000;
  input.total_debt    = 1000;
  return input;
}

void TestMemoryBackendWithSequenceClock() {
  auto config = ConfigLoader::LoadFromYamlString(R"(ledger:
  owner_principal: "bank"
  timestamp_source: TIMESTAMP_SOURCE_SEQUENCE
  sequence_start: 800000
)");

  auto app = credit::factory::Build(config);
  assert(app.repository && app.clock && app.caller_resolver && app.ledger);

  const auto owner = app.caller_resolver->Resolve("bank");
  const auto alice = app.caller_resolver->Resolve("alice");
  assert(owner.IsOwner());
  assert(!alice.IsOwner());
  assert(app.caller_resolver->owner_principal() == "bank");

  auto profile = app.ledger->RegisterProfile(alice, Input());
  assert(profile.ok());
  assert(profile->last_updated == 800000);

  auto id = app.ledger->Apply(alice, 1000, "tools", 12);
  assert(id.ok());
  assert(app.ledger->GetApplication(*id)->applied_at == 800001);
  assert(app.ledger->Approve(owner, *id).ok());
  assert(app.ledger->Disburse(owner, *id).ok());
}

void TestMissingOwnerIsRejected() {
  credit::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();

  bool threw = false;
  try {
    (void)credit::factory::Build(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestSqliteBackend() {
  const auto db_path = std::filesystem::temp_directory_path() /
                       ("credit_ledger_factory_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".db");

  credit::runtime::config::RuntimeConfig config;
  config.mutable_ledger()->set_owner_principal("bank");
  config.mutable_database()->mutable_sqlite()->set_path(db_path.string());

#if CREDIT_DB_SQLITE
  uint64_t id = 0;
  {
    auto       app   = credit::factory::Build(config);
    const auto alice = app.caller_resolver->Resolve("alice");
    assert(app.ledger->RegisterProfile(alice, Input()).ok());
    auto applied = app.ledger->Apply(alice, 2500, "van", 24);
    assert(applied.ok());
    id = *applied;
  }

  // reopening keeps records and the id nonce
  {
    auto       app   = credit::factory::Build(config);
    const auto alice = app.caller_resolver->Resolve("alice");
    assert(app.ledger->GetProfile("alice").ok());
    assert(app.ledger->GetApplication(id)->amount == 2500);

    auto next = app.ledger->Apply(alice, 100, "fuel", 6);
    assert(next.ok());
    assert(*next == id + 1);
  }
  std::filesystem::remove(db_path);
#else
  bool threw = false;
  try {
    (void)credit::factory::Build(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
#endif
}

} // namespace

int main() {
  TestMemoryBackendWithSequenceClock();
  TestMissingOwnerIsRejected();
  TestSqliteBackend();
  credit::factory::Shutdown();

  std::cout << "credit_ledger_unit_factory: pass\n";
  return 0;
}
