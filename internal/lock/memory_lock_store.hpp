#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/lock/lock_store.hpp"
#include "internal/util/time.hpp"

namespace ledger::lock {

// Process local store. Only correct when a single worker serves traffic.
class MemoryLockStore final : public LockStore {
 public:
  bool     SetIfAbsent(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) override;
  bool     CompareAndDelete(const std::string& key, const std::string& token) override;
  bool     CompareAndExtend(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) override;
  bool     Exists(const std::string& key) override;
  uint64_t Increment(const std::string& key, std::chrono::milliseconds window) override;

 private:
  struct Entry {
    std::string     token;
    util::TimePoint expires_at;
  };

  struct Counter {
    uint64_t        count = 0;
    util::TimePoint expires_at;
  };

  std::mutex mutex_;

  std::unordered_map<std::string, Entry>   entries_;
  std::unordered_map<std::string, Counter> counters_;

  void PurgeExpired(util::TimePoint now);
};

} // namespace ledger::lock
