#include "lock_keys.hpp"

#include "internal/util/errors.hpp"

namespace ledger::lock {

namespace {

void ValidateComponent(std::string_view name, std::string_view value) {
  if (value.empty()) {
    throw util::ValidationError("lock key component '" + std::string(name) + "' must not be empty");
  }
  if (value.find(':') != std::string_view::npos) {
    throw util::ValidationError("lock key component '" + std::string(name) + "' must not contain ':'");
  }
}

} // namespace

std::string BalanceResource(std::string_view user_id, std::string_view asset) {
  ValidateComponent("user_id", user_id);
  ValidateComponent("asset", asset);
  return "balance:" + std::string(user_id) + ":" + std::string(asset);
}

std::string SelfExclusionResource(std::string_view user_id) {
  ValidateComponent("user_id", user_id);
  return "self-exclusion:" + std::string(user_id);
}

std::string SchedulerResource() {
  return "scheduler:expiry";
}

std::string StoreKey(std::string_view resource) {
  return "locks:" + std::string(resource);
}

std::string ResourceKind(std::string_view resource) {
  return std::string(resource.substr(0, resource.find(':')));
}

} // namespace ledger::lock
