#pragma once

#include <memory>
#include <string>

#include "internal/exclusion/exclusion_manager.hpp"

namespace ledger::exclusion {

// "2 days, 3 hours", "45 minutes", "less than a minute"
std::string FormatRemaining(int64_t remaining_ms);

// User facing denial text. Contains exactly one of "cooldown",
// "post-cooldown window", "temporarily excluded", "permanently excluded"
// as the distinguishing phrase.
std::string DenialMessage(const ActiveExclusion& exclusion);

// Throws util::SelfExclusionActive carrying DenialMessage.
[[noreturn]] void ThrowDenied(const ActiveExclusion& exclusion);

/*
  Access guard consulted before gambling actions.

    BET, DEPOSIT, BONUS      any access exclusion for the segment
    LOGIN, REFRESH_TOKEN     only a platform wide permanent exclusion
    WITHDRAW                 never blocked
*/
class AccessGuard {
 public:
  explicit AccessGuard(std::shared_ptr<ExclusionManager> exclusions);

  void CheckAccess(const std::string& user_id, ledger::v1::PlatformType segment, ledger::v1::AccessAction action);

 private:
  std::shared_ptr<ExclusionManager> exclusions_;
};

} // namespace ledger::exclusion
