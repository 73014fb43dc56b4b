#pragma once

#include <cstdint>

namespace credit::db::model {

/*
  Singleton counters row.

  last_application_id is the id nonce; it only advances when an
  application is stored, so ids are never reused.
*/
struct LedgerStatsRecord {
  uint64_t last_application_id    = 0;
  uint64_t total_loans_issued     = 0;
  uint64_t total_amount_disbursed = 0;
  uint32_t model_version          = 1;
};

} // namespace credit::db::model
