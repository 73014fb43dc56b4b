#pragma once

#include <cstdint>

#include "internal/db/model/ledger_stats_record.hpp"
#include "internal/util/errors.hpp"

namespace credit::ledger {

/*
  Aggregate counters. Disburse is the only writer; the increments are
  computed here so the caller can validate before any record is written.
*/
class LedgerStats {
 public:
  static util::StatusOr<db::model::LedgerStatsRecord> RecordDisbursement(const db::model::LedgerStatsRecord& current, uint64_t amount);

  static util::StatusOr<db::model::LedgerStatsRecord> NextApplicationId(const db::model::LedgerStatsRecord& current);
};

} // namespace credit::ledger
