#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ledger::lock {

/*
  Shared key-value primitives the lock coordinator and the rate
  counters are built on.

  Every operation is atomic with respect to all workers sharing the
  store. Expired entries behave exactly like absent ones.
*/
class LockStore {
 public:
  virtual ~LockStore() = default;

  // Stores token under key for ttl when key is absent or expired.
  virtual bool SetIfAbsent(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) = 0;

  // Deletes key only while it still holds token.
  virtual bool CompareAndDelete(const std::string& key, const std::string& token) = 0;

  // Pushes expiry to now + ttl only while key holds token and is unexpired.
  virtual bool CompareAndExtend(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) = 0;

  virtual bool Exists(const std::string& key) = 0;

  // Increments a counter that resets window after its first increment.
  // Returns the value after incrementing.
  virtual uint64_t Increment(const std::string& key, std::chrono::milliseconds window) = 0;
};

} // namespace ledger::lock
