#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/lock/lock_store.hpp"

namespace ledger::lock {

/*
  LockStore on the relational store every worker already shares
  (tables lock_entries and rate_counters).

  Each call is its own short transaction built from one conditional
  statement, so workers never block each other beyond that statement.
*/
class RepositoryLockStore final : public LockStore {
 public:
  explicit RepositoryLockStore(std::shared_ptr<db::Repository> repository);

  bool     SetIfAbsent(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) override;
  bool     CompareAndDelete(const std::string& key, const std::string& token) override;
  bool     CompareAndExtend(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) override;
  bool     Exists(const std::string& key) override;
  uint64_t Increment(const std::string& key, std::chrono::milliseconds window) override;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace ledger::lock
