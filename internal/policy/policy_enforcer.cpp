#include "policy_enforcer.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledger::policy {

PolicyEnforcer::PolicyEnforcer(std::shared_ptr<lock::LockStore> store, RateLimitOptions options)
    : store_(std::move(store)), options_(options) {
}

void PolicyEnforcer::Enforce(const OperationPolicy& policy, const Caller& caller) {
  if (caller.user_id.empty() && !caller.HasRole(kAdminRole)) {
    throw util::PermissionDenied("caller identity is required");
  }

  for (const auto& role : policy.required_roles) {
    if (!caller.HasRole(role)) {
      throw util::PermissionDenied("role '" + role + "' is required for " + policy.route);
    }
  }

  if (!options_.enabled || !policy.rate_limited) return;

  const uint32_t limit  = policy.max_requests > 0 ? policy.max_requests : options_.requests_per_window;
  const int64_t  window = policy.window_ms > 0 ? policy.window_ms : options_.window_ms;

  const auto count = store_->Increment("rate:" + policy.route + ":" + caller.user_id, std::chrono::milliseconds(window));
  if (count > limit) {
    LEDGER_LOG_WARN("rate limit exceeded", {observability::StringField("route", policy.route), observability::StringField("user_id", caller.user_id),
                                            observability::IntField("count", static_cast<int64_t>(count))});
    throw util::RateLimited("Too many requests. Please try again later.");
  }
}

void PolicyEnforcer::RequireSelfOrAdmin(const Caller& caller, const std::string& user_id) {
  if (caller.user_id != user_id && !caller.HasRole(kAdminRole)) {
    throw util::PermissionDenied("acting on another user requires the admin role");
  }
}

} // namespace ledger::policy
