#pragma once

#include <string>
#include <string_view>

namespace ledger::lock {

/*
  Lock resource names. Components must be non-empty and free of ':'
  (ValidationError otherwise) so distinct resources never collide.
*/

std::string BalanceResource(std::string_view user_id, std::string_view asset);
std::string SelfExclusionResource(std::string_view user_id);
std::string SchedulerResource();

// Key the resource is stored under: "locks:{resource}".
std::string StoreKey(std::string_view resource);

// Leading component of a resource ("balance" for "balance:u1:BTC").
std::string ResourceKind(std::string_view resource);

} // namespace ledger::lock
