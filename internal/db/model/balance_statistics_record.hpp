#pragma once

#include <cstdint>
#include <string>

namespace ledger::db::model {

// Lifetime totals per user, in USD cents.
struct BalanceStatisticsRecord {
  std::string user_id;

  int64_t deposits_cents    = 0;
  int64_t withdrawals_cents = 0;
  int64_t bets_cents        = 0;
  int64_t wins_cents        = 0;
  int64_t refunds_cents     = 0;

  int64_t bet_count = 0;
  int64_t win_count = 0;
};

} // namespace ledger::db::model
