#pragma once

#include <cstdint>
#include <string>

namespace ledger::db::model {

// Row of lock_entries. Rows with expires_at_ms <= now are treated as absent.
struct LockEntryRecord {
  std::string key;
  std::string token;
  int64_t     expires_at_ms = 0;
};

} // namespace ledger::db::model
