#include "memory_lock_store.hpp"

namespace ledger::lock {

void MemoryLockStore::PurgeExpired(util::TimePoint now) {
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.expires_at <= now) {
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
  for (auto it = counters_.begin(); it != counters_.end();) {
    if (it->second.expires_at <= now) {
      it = counters_.erase(it);
    } else {
      ++it;
    }
  }
}

bool MemoryLockStore::SetIfAbsent(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);

  const auto now = util::Now();
  if (auto it = entries_.find(key); it != entries_.end() && it->second.expires_at > now) {
    return false;
  }

  PurgeExpired(now);
  entries_[key] = Entry{token, now + ttl};
  return true;
}

bool MemoryLockStore::CompareAndDelete(const std::string& key, const std::string& token) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end() || it->second.token != token) return false;

  entries_.erase(it);
  return true;
}

bool MemoryLockStore::CompareAndExtend(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);

  const auto now = util::Now();
  auto       it  = entries_.find(key);
  if (it == entries_.end() || it->second.token != token || it->second.expires_at <= now) return false;

  it->second.expires_at = now + ttl;
  return true;
}

bool MemoryLockStore::Exists(const std::string& key) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(key);
  return it != entries_.end() && it->second.expires_at > util::Now();
}

uint64_t MemoryLockStore::Increment(const std::string& key, std::chrono::milliseconds window) {
  std::lock_guard lock(mutex_);

  const auto now     = util::Now();
  auto&      counter = counters_[key];
  if (counter.count == 0 || counter.expires_at <= now) {
    counter.count      = 1;
    counter.expires_at = now + window;
  } else {
    ++counter.count;
  }
  return counter.count;
}

} // namespace ledger::lock
