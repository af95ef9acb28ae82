#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace ledger::policy {

inline constexpr std::string_view kAdminRole = "admin";

// Identity of the caller, as forwarded by the gateway in metadata.
struct Caller {
  std::string           user_id;
  std::set<std::string> roles;

  bool HasRole(std::string_view role) const {
    return roles.find(std::string(role)) != roles.end();
  }
};

/*
  Per route access rule.

  max_requests / window_ms of 0 fall back to the configured default.
  rate_limited=false exempts a route from counting.
*/
struct OperationPolicy {
  std::string              route;
  std::vector<std::string> required_roles;

  bool     rate_limited = true;
  uint32_t max_requests = 0;
  int64_t  window_ms    = 0;
};

// Throws util::InvalidState for an unknown route.
const OperationPolicy& PolicyFor(std::string_view route);

const std::vector<OperationPolicy>& OperationPolicies();

} // namespace ledger::policy
