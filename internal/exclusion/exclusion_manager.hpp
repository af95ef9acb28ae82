#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/limits/limit_evaluator.hpp"
#include "internal/lock/lock_coordinator.hpp"

namespace ledger::exclusion {

constexpr int64_t kCooldownDurationMs      = 24LL * 60 * 60 * 1000;
constexpr int64_t kPostCooldownWindowMs    = 24LL * 60 * 60 * 1000;
constexpr int64_t kLimitRemovalGracePeriod = 24LL * 60 * 60 * 1000;

struct CreateRequest {
  std::string user_id;

  ledger::v1::ExclusionType type     = ledger::v1::EXCLUSION_TYPE_UNSPECIFIED;
  ledger::v1::PlatformType  platform = ledger::v1::PLATFORM_TYPE_PLATFORM;

  std::optional<ledger::v1::LimitPeriod> period;

  // 1e-8 units. Absent or 0 on a limit type requests removal.
  std::optional<int64_t> limit_amount;

  std::optional<int64_t> end_ms;
};

// Most restrictive access exclusion in force for a user and segment.
struct ActiveExclusion {
  std::string id;

  ledger::v1::ExclusionType type     = ledger::v1::EXCLUSION_TYPE_UNSPECIFIED;
  ledger::v1::PlatformType  platform = ledger::v1::PLATFORM_TYPE_PLATFORM;

  std::optional<int64_t> end_ms;
  int64_t                remaining_ms = 0;

  bool in_post_cooldown_window = false;
};

struct CancelResult {
  db::model::SelfExclusionRecord exclusion;
  bool                           deleted = false;
};

struct GamblingLimit {
  db::model::SelfExclusionRecord limit;
  limits::LimitUsage             usage;
};

struct GamblingLimits {
  std::vector<GamblingLimit> deposit;
  std::vector<GamblingLimit> loss;
  std::vector<GamblingLimit> wager;
};

bool IsLimitType(ledger::v1::ExclusionType type);
bool IsInPostCooldownWindow(const db::model::SelfExclusionRecord& record, int64_t now_ms);

/*
  Self-exclusion state machine.

    none -> cooldown -> post-cooldown window -> temporary | permanent
    limits:  active -> removal pending -> deleted (scheduler)

  Every mutation for a user runs under the lock self-exclusion:{user}
  inside a single repository transaction.
*/
class ExclusionManager {
 public:
  ExclusionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<lock::LockCoordinator> locks,
                   std::shared_ptr<limits::LimitEvaluator> evaluator);

  db::model::SelfExclusionRecord Create(const CreateRequest& request);

  CancelResult Cancel(const std::string& user_id, const std::string& id);

  // Replaces a cooldown in its post-cooldown window by a temporary
  // (duration_days set) or permanent exclusion.
  db::model::SelfExclusionRecord Extend(const std::string& user_id, const std::string& cooldown_id, ledger::v1::PlatformType platform,
                                        std::optional<int32_t> duration_days);

  // Newest first.
  std::vector<db::model::SelfExclusionRecord> List(const std::string& user_id);

  std::vector<db::model::SelfExclusionRecord> GetActive(const std::string& user_id, std::optional<ledger::v1::PlatformType> segment);

  std::optional<ActiveExclusion> HasActive(const std::string& user_id, std::optional<ledger::v1::PlatformType> segment);

  // Same query inside a caller owned transaction.
  std::optional<ActiveExclusion> HasActive(db::Transaction& tx, const std::string& user_id, std::optional<ledger::v1::PlatformType> segment,
                                           int64_t now_ms);

  GamblingLimits GetGamblingLimits(const std::string& user_id);

  // Active limits of a user, read inside a caller owned transaction.
  std::vector<db::model::SelfExclusionRecord> ActiveLimits(db::Transaction& tx, const std::string& user_id);

  // Time travel for lifecycle testing.
  db::model::SelfExclusionRecord ForceExpireCooldown(const std::string& id);
  db::model::SelfExclusionRecord ForceExpireWindow(const std::string& id);
  db::model::SelfExclusionRecord ForceExpireRemoval(const std::string& id);

 private:
  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<lock::LockCoordinator>  locks_;
  std::shared_ptr<limits::LimitEvaluator> evaluator_;

  db::model::SelfExclusionRecord CreateCooldown(db::Transaction& tx, const CreateRequest& request, int64_t now_ms);
  db::model::SelfExclusionRecord CreateAccessExclusion(db::Transaction& tx, const CreateRequest& request, int64_t now_ms);
  db::model::SelfExclusionRecord CreateOrUpdateLimit(db::Transaction& tx, const CreateRequest& request, int64_t now_ms);

  template <typename Fn>
  db::model::SelfExclusionRecord Mutate(const std::string& id, Fn&& fn);
};

} // namespace ledger::exclusion
