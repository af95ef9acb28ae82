#pragma once

#include <cstdint>
#include <string>

namespace ledger::db::model {

/*
  One wallet: (user_id, asset).

  balance is in 1e-8 units. Only mutated while the balance lock
  for (user_id, asset) is held.
*/
struct BalanceRecord {
  std::string user_id;
  std::string asset;

  int64_t balance = 0;

  // First wallet a user ever gets.
  bool is_primary = false;

  int64_t updated_at_ms = 0;
};

} // namespace ledger::db::model
