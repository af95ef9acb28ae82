#pragma once

#include <cstdint>
#include <string>

namespace ledger::lock {

/*
  Acquisition settings. Defaults are overridden from config `locks:`.

  Worst case acquisition time is
  retry_count * (retry_delay_ms + retry_jitter_ms).
*/
struct LockOptions {
  int64_t  ttl_ms          = 10000;
  uint32_t retry_count     = 3;
  int64_t  retry_delay_ms  = 200;
  int64_t  retry_jitter_ms = 100;
};

/*
  A held lock.

  token is the fencing token: release and extend only succeed while
  the store still holds this token for the resource.
*/
struct Lock {
  std::string resource;
  std::string token;

  int64_t ttl_ms         = 0;
  int64_t acquired_at_ms = 0;
  int64_t expires_at_ms  = 0;
};

} // namespace ledger::lock
