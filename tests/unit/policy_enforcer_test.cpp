#include "internal/policy/policy_enforcer.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/lock/memory_lock_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using ledger::policy::Caller;
using ledger::policy::PolicyEnforcer;
using ledger::policy::PolicyFor;

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

Caller User(const std::string& id) {
  return Caller{id, {}};
}

Caller Admin() {
  return Caller{"ops", {"admin"}};
}

void TestEveryRouteHasAPolicy() {
  for (const auto* route : {"BalanceService.UpdateBalance", "BalanceService.GetAssetLimits", "ExclusionService.CheckAccess",
                            "ExclusionService.ExtendSelfExclusion", "AdminService.RunExpiry", "AdminService.ForceExpireRemoval"}) {
    assert(PolicyFor(route).route == route);
  }
  assert(Throws<ledger::util::InvalidState>([] { (void)PolicyFor("BalanceService.Nope"); }));
}

void TestRolesAndIdentity() {
  PolicyEnforcer enforcer(std::make_shared<ledger::lock::MemoryLockStore>(), {});

  enforcer.Enforce(PolicyFor("BalanceService.GetBalances"), User("u1"));
  assert(Throws<ledger::util::PermissionDenied>([&] { enforcer.Enforce(PolicyFor("BalanceService.GetBalances"), User("")); }));

  assert(Throws<ledger::util::PermissionDenied>([&] { enforcer.Enforce(PolicyFor("AdminService.GetLockStats"), User("u1")); }));
  enforcer.Enforce(PolicyFor("AdminService.GetLockStats"), Admin());

  PolicyEnforcer::RequireSelfOrAdmin(User("u1"), "u1");
  PolicyEnforcer::RequireSelfOrAdmin(Admin(), "u1");
  assert(Throws<ledger::util::PermissionDenied>([] { PolicyEnforcer::RequireSelfOrAdmin(User("u2"), "u1"); }));
}

void TestRateLimitPerRouteAndUser() {
  ledger::policy::RateLimitOptions options;
  options.enabled             = true;
  options.requests_per_window = 3;
  options.window_ms           = 60000;
  PolicyEnforcer enforcer(std::make_shared<ledger::lock::MemoryLockStore>(), options);

  const auto& balances = PolicyFor("BalanceService.GetBalances");
  for (int i = 0; i < 3; ++i) enforcer.Enforce(balances, User("u1"));
  assert(Throws<ledger::util::RateLimited>([&] { enforcer.Enforce(balances, User("u1")); }));

  // Counters are per user and per route.
  enforcer.Enforce(balances, User("u2"));
  enforcer.Enforce(PolicyFor("BalanceService.GetStatistics"), User("u1"));

  // Exempt routes never count.
  for (int i = 0; i < 10; ++i) enforcer.Enforce(PolicyFor("BalanceService.GetAssetLimits"), User("u1"));

  // Route specific ceilings override the default.
  const auto& create = PolicyFor("ExclusionService.CreateSelfExclusion");
  for (uint32_t i = 0; i < create.max_requests; ++i) enforcer.Enforce(create, User("u3"));
  assert(Throws<ledger::util::RateLimited>([&] { enforcer.Enforce(create, User("u3")); }));
}

void TestDisabledRateLimit() {
  ledger::policy::RateLimitOptions options;
  options.requests_per_window = 1;
  PolicyEnforcer enforcer(std::make_shared<ledger::lock::MemoryLockStore>(), options);

  for (int i = 0; i < 5; ++i) enforcer.Enforce(PolicyFor("BalanceService.UpdateBalance"), User("u1"));
}

} // namespace

int main() {
  TestEveryRouteHasAPolicy();
  TestRolesAndIdentity();
  TestRateLimitPerRouteAndUser();
  TestDisabledRateLimit();

  std::cout << "ledger_unit_policy_enforcer: pass\n";
  return 0;
}
