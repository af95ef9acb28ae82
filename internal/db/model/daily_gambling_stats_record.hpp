#pragma once

#include <cstdint>
#include <string>

#include "ledger/v1/types.pb.h"

namespace ledger::db::model {

/*
  Per (user_id, day, platform) accumulators, USD in 1e-8 units.

  loss_usd is always max(0, wager_usd - win_usd) of the row.
*/
struct DailyGamblingStatsRecord {
  std::string user_id;
  std::string day; // YYYY-MM-DD (UTC)

  ledger::v1::PlatformType platform = ledger::v1::PLATFORM_TYPE_PLATFORM;

  int64_t wager_usd   = 0;
  int64_t win_usd     = 0;
  int64_t loss_usd    = 0;
  int64_t deposit_usd = 0;
};

} // namespace ledger::db::model
