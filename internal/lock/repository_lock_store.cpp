#include "repository_lock_store.hpp"

#include "internal/db/api/unit_of_work.hpp"
#include "internal/util/time.hpp"

namespace ledger::lock {

namespace {

// Maps an expected "no" answer to false and everything else to an exception.
bool Accept(const db::Result& result, db::ErrorCode expected_miss, const std::string& context) {
  if (result) return true;
  if (result.code == expected_miss) return false;
  db::ThrowIfDbError(result, context);
  return false;
}

} // namespace

RepositoryLockStore::RepositoryLockStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

bool RepositoryLockStore::SetIfAbsent(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) {
  try {
    return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
      const auto now = util::NowMs();

      db::model::LockEntryRecord entry;
      entry.key           = key;
      entry.token         = token;
      entry.expires_at_ms = now + ttl.count();

      return Accept(repository_->TryAcquireLock(tx, entry, now), db::ErrorCode::Conflict, "acquire lock entry");
    });
  } catch (const db::TransactionConflict&) {
    // Lost to a concurrent writer; the coordinator retries.
    return false;
  }
}

bool RepositoryLockStore::CompareAndDelete(const std::string& key, const std::string& token) {
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    return Accept(repository_->ReleaseLock(tx, key, token), db::ErrorCode::NotFound, "release lock entry");
  });
}

bool RepositoryLockStore::CompareAndExtend(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) {
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    const auto now = util::NowMs();
    return Accept(repository_->ExtendLock(tx, key, token, now + ttl.count(), now), db::ErrorCode::NotFound, "extend lock entry");
  });
}

bool RepositoryLockStore::Exists(const std::string& key) {
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    return repository_->GetLock(tx, key, util::NowMs()).has_value();
  });
}

uint64_t RepositoryLockStore::Increment(const std::string& key, std::chrono::milliseconds window) {
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    const auto now   = util::NowMs();
    uint64_t   count = 0;
    db::ThrowIfDbError(repository_->IncrementCounter(tx, key, now + window.count(), now, count), "increment counter");
    return count;
  });
}

} // namespace ledger::lock
