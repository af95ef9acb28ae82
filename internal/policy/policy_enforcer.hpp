#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/lock/lock_store.hpp"
#include "internal/policy/operation_policy.hpp"

namespace ledger::policy {

struct RateLimitOptions {
  bool     enabled             = false;
  uint32_t requests_per_window = 100;
  int64_t  window_ms           = 60000;
};

/*
  Applies an OperationPolicy to a caller before the service runs.

  Rate counters live in the shared LockStore keyed by route and user,
  so the limit holds across all workers.
*/
class PolicyEnforcer {
 public:
  PolicyEnforcer(std::shared_ptr<lock::LockStore> store, RateLimitOptions options);

  // Throws util::PermissionDenied or util::RateLimited.
  void Enforce(const OperationPolicy& policy, const Caller& caller);

  // Acting on another user's data requires the admin role.
  static void RequireSelfOrAdmin(const Caller& caller, const std::string& user_id);

 private:
  std::shared_ptr<lock::LockStore> store_;
  RateLimitOptions                 options_;
};

} // namespace ledger::policy
