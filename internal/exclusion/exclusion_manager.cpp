#include "exclusion_manager.hpp"

#include <cctype>

#include "internal/db/api/unit_of_work.hpp"
#include "internal/db/model/enum_codec.hpp"
#include "internal/lock/lock_keys.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace ledger::exclusion {

using db::model::SelfExclusionRecord;
using observability::IntField;
using observability::StringField;

using ledger::v1::EXCLUSION_TYPE_COOLDOWN;
using ledger::v1::EXCLUSION_TYPE_DEPOSIT_LIMIT;
using ledger::v1::EXCLUSION_TYPE_LOSS_LIMIT;
using ledger::v1::EXCLUSION_TYPE_PERMANENT;
using ledger::v1::EXCLUSION_TYPE_TEMPORARY;
using ledger::v1::EXCLUSION_TYPE_WAGER_LIMIT;
using ledger::v1::PLATFORM_TYPE_PLATFORM;

namespace {

bool IsConstraintError(const db::Result& result) {
  return result.code == db::ErrorCode::ConstraintViolation || result.code == db::ErrorCode::AlreadyExists;
}

bool AppliesToSegment(const SelfExclusionRecord& r, std::optional<ledger::v1::PlatformType> segment) {
  if (!segment) return true;
  return r.platform == *segment || r.platform == PLATFORM_TYPE_PLATFORM;
}

bool EndsAfter(const SelfExclusionRecord& r, int64_t now_ms) {
  return r.end_ms && *r.end_ms > now_ms;
}

std::string LowerCode(ledger::v1::ExclusionType type) {
  auto code = db::model::ExclusionTypeCode(type);
  for (auto& c : code) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return code;
}

SelfExclusionRecord NewRecord(const CreateRequest& request, int64_t now_ms) {
  SelfExclusionRecord r;
  r.id            = util::GenerateUUIDString();
  r.user_id       = request.user_id;
  r.type          = request.type;
  r.platform      = request.platform;
  r.start_ms      = now_ms;
  r.is_active     = true;
  r.created_at_ms = now_ms;
  r.updated_at_ms = now_ms;
  return r;
}

void LogTransition(std::string_view message, const SelfExclusionRecord& r) {
  LEDGER_LOG_INFO(message, {StringField("user_id", r.user_id), StringField("exclusion_id", r.id),
                            StringField("type", db::model::ExclusionTypeCode(r.type)), StringField("platform", db::model::PlatformCode(r.platform))});
}

} // namespace

bool IsLimitType(ledger::v1::ExclusionType type) {
  return type == EXCLUSION_TYPE_DEPOSIT_LIMIT || type == EXCLUSION_TYPE_LOSS_LIMIT || type == EXCLUSION_TYPE_WAGER_LIMIT;
}

bool IsInPostCooldownWindow(const SelfExclusionRecord& record, int64_t now_ms) {
  return record.type == EXCLUSION_TYPE_COOLDOWN && record.post_cooldown_window_end_ms && *record.post_cooldown_window_end_ms > now_ms;
}

ExclusionManager::ExclusionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<lock::LockCoordinator> locks,
                                   std::shared_ptr<limits::LimitEvaluator> evaluator)
    : repository_(std::move(repository)), locks_(std::move(locks)), evaluator_(std::move(evaluator)) {
}

// ---------------------------------------------------------------------------
// Create
// ---------------------------------------------------------------------------

SelfExclusionRecord ExclusionManager::Create(const CreateRequest& request) {
  if (request.user_id.empty()) {
    throw util::ValidationError("user_id is required");
  }
  if (request.type == ledger::v1::EXCLUSION_TYPE_UNSPECIFIED) {
    throw util::ValidationError("exclusion type is required");
  }

  CreateRequest normalized = request;
  if (normalized.platform == ledger::v1::PLATFORM_TYPE_UNSPECIFIED) {
    normalized.platform = PLATFORM_TYPE_PLATFORM;
  }

  if (normalized.type == EXCLUSION_TYPE_TEMPORARY && !normalized.end_ms) {
    throw util::ValidationError("End date is required for temporary exclusion");
  }
  if (IsLimitType(normalized.type)) {
    if (!normalized.period || *normalized.period == ledger::v1::LIMIT_PERIOD_UNSPECIFIED) {
      throw util::ValidationError("Period is required for " + LowerCode(normalized.type));
    }
    if (normalized.limit_amount && *normalized.limit_amount < 0) {
      throw util::ValidationError("Limit amount must not be negative");
    }
  } else {
    normalized.period.reset();
    normalized.limit_amount.reset();
  }

  auto created = locks_->WithLock(lock::SelfExclusionResource(normalized.user_id), [&] {
    return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
      const auto now = util::NowMs();

      switch (normalized.type) {
        case EXCLUSION_TYPE_COOLDOWN:
          return CreateCooldown(tx, normalized, now);
        case EXCLUSION_TYPE_TEMPORARY:
        case EXCLUSION_TYPE_PERMANENT:
          return CreateAccessExclusion(tx, normalized, now);
        default:
          return CreateOrUpdateLimit(tx, normalized, now);
      }
    });
  });

  LogTransition("self-exclusion saved", created);
  return created;
}

SelfExclusionRecord ExclusionManager::CreateCooldown(db::Transaction& tx, const CreateRequest& request, int64_t now_ms) {
  for (auto existing : repository_->ListSelfExclusions(tx, request.user_id)) {
    if (existing.type != EXCLUSION_TYPE_COOLDOWN || existing.platform != request.platform || !existing.is_active) continue;

    existing.is_active     = false;
    existing.updated_at_ms = now_ms;
    db::ThrowIfDbError(repository_->UpdateSelfExclusion(tx, existing), "deactivate cooldown");
  }

  auto cooldown   = NewRecord(request, now_ms);
  cooldown.end_ms = now_ms + kCooldownDurationMs;
  db::ThrowIfDbError(repository_->InsertSelfExclusion(tx, cooldown), "insert cooldown");
  return cooldown;
}

SelfExclusionRecord ExclusionManager::CreateAccessExclusion(db::Transaction& tx, const CreateRequest& request, int64_t now_ms) {
  if (request.type == EXCLUSION_TYPE_TEMPORARY && *request.end_ms <= now_ms) {
    throw util::ValidationError("End date must be in the future");
  }

  const auto existing = repository_->ListSelfExclusions(tx, request.user_id);

  bool has_cooldown = false;
  for (const auto& r : existing) {
    if (r.type != EXCLUSION_TYPE_COOLDOWN || r.platform != request.platform) continue;
    if (r.is_active || (r.end_ms && *r.end_ms > now_ms - kCooldownDurationMs)) {
      has_cooldown = true;
      break;
    }
  }
  if (!has_cooldown) {
    throw util::ValidationError("You must first take a 24-hour cooldown before setting up self-exclusion");
  }

  for (auto r : existing) {
    if (r.type != request.type || r.platform != request.platform || !r.is_active) continue;

    r.is_active     = false;
    r.updated_at_ms = now_ms;
    db::ThrowIfDbError(repository_->UpdateSelfExclusion(tx, r), "deactivate exclusion");
  }

  auto exclusion   = NewRecord(request, now_ms);
  exclusion.end_ms = request.type == EXCLUSION_TYPE_TEMPORARY ? request.end_ms : std::nullopt;
  db::ThrowIfDbError(repository_->InsertSelfExclusion(tx, exclusion), "insert exclusion");
  return exclusion;
}

SelfExclusionRecord ExclusionManager::CreateOrUpdateLimit(db::Transaction& tx, const CreateRequest& request, int64_t now_ms) {
  const auto existing = repository_->ListSelfExclusions(tx, request.user_id);

  std::optional<SelfExclusionRecord> same_period;
  bool                               any_of_type = false;
  for (const auto& r : existing) {
    if (r.type != request.type || !r.is_active) continue;
    any_of_type = true;
    if (r.platform == request.platform && r.period == request.period && !same_period) {
      same_period = r;
    }
  }

  const std::string type_name = LowerCode(request.type);

  // Absent or zero amount asks to remove the limit for that period.
  if (!request.limit_amount || *request.limit_amount == 0) {
    if (!same_period) {
      throw util::NotFound("No active " + type_name + " found for " + limits::PeriodName(*request.period) + " period");
    }
    if (!same_period->removal_requested_at_ms) {
      same_period->removal_requested_at_ms = now_ms;
      same_period->updated_at_ms           = now_ms;
      db::ThrowIfDbError(repository_->UpdateSelfExclusion(tx, *same_period), "request limit removal");
    }
    return *same_period;
  }

  const bool single_active = request.type == EXCLUSION_TYPE_LOSS_LIMIT || request.type == EXCLUSION_TYPE_WAGER_LIMIT;
  const std::string single_message =
      request.type == EXCLUSION_TYPE_LOSS_LIMIT ? "You can only have one active loss limit at a time" : "You can only have one active wager limit at a time";

  if (same_period) {
    same_period->limit_amount = request.limit_amount;
    same_period->removal_requested_at_ms.reset();
    same_period->updated_at_ms = now_ms;
    db::ThrowIfDbError(repository_->UpdateSelfExclusion(tx, *same_period), "update limit");
    return *same_period;
  }

  if (single_active && any_of_type) {
    throw util::Conflict(single_message);
  }

  auto limit         = NewRecord(request, now_ms);
  limit.period       = request.period;
  limit.limit_amount = request.limit_amount;

  const auto result = repository_->InsertSelfExclusion(tx, limit);
  if (!result && IsConstraintError(result)) {
    throw util::Conflict(single_active ? single_message : "A matching " + type_name + " already exists");
  }
  db::ThrowIfDbError(result, "insert limit");
  return limit;
}

// ---------------------------------------------------------------------------
// Cancel / Extend
// ---------------------------------------------------------------------------

CancelResult ExclusionManager::Cancel(const std::string& user_id, const std::string& id) {
  if (!util::IsUUID(id)) {
    throw util::ValidationError("Invalid exclusion ID format");
  }

  auto result = locks_->WithLock(lock::SelfExclusionResource(user_id), [&] {
    return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
      auto record = repository_->GetSelfExclusion(tx, id);
      if (!record || record->user_id != user_id) {
        throw util::NotFound("Self-exclusion not found");
      }

      if (record->type == EXCLUSION_TYPE_PERMANENT) {
        throw util::Conflict("Permanent exclusions cannot be canceled before their end date");
      }
      if (record->type == EXCLUSION_TYPE_TEMPORARY) {
        throw util::Conflict("Temporary exclusions cannot be canceled before their end date");
      }

      if (record->type == EXCLUSION_TYPE_COOLDOWN) {
        db::ThrowIfDbError(repository_->DeleteSelfExclusion(tx, id), "delete cooldown");
        return CancelResult{*record, true};
      }

      // Limits stay enforced until the grace period runs out.
      if (!record->removal_requested_at_ms) {
        const auto now                  = util::NowMs();
        record->removal_requested_at_ms = now;
        record->updated_at_ms           = now;
        db::ThrowIfDbError(repository_->UpdateSelfExclusion(tx, *record), "request limit removal");
      }
      return CancelResult{*record, false};
    });
  });

  LogTransition(result.deleted ? "cooldown canceled" : "limit removal requested", result.exclusion);
  return result;
}

SelfExclusionRecord ExclusionManager::Extend(const std::string& user_id, const std::string& cooldown_id, ledger::v1::PlatformType platform,
                                             std::optional<int32_t> duration_days) {
  if (!util::IsUUID(cooldown_id)) {
    throw util::ValidationError("Invalid cooldown ID format");
  }
  if (duration_days && *duration_days != 1 && *duration_days != 7 && *duration_days != 30 && *duration_days != 180) {
    throw util::ValidationError("Duration must be one of 1, 7, 30 or 180 days");
  }
  if (platform == ledger::v1::PLATFORM_TYPE_UNSPECIFIED) {
    platform = PLATFORM_TYPE_PLATFORM;
  }

  auto extended = locks_->WithLock(lock::SelfExclusionResource(user_id), [&] {
    return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
      const auto now      = util::NowMs();
      auto       cooldown = repository_->GetSelfExclusion(tx, cooldown_id);
      if (!cooldown || cooldown->user_id != user_id) {
        throw util::NotFound("Cooldown not found");
      }

      if (cooldown->type != EXCLUSION_TYPE_COOLDOWN) {
        throw util::ValidationError("Only cooldown exclusions can be extended");
      }
      if (!cooldown->post_cooldown_window_end_ms) {
        throw util::ValidationError(
            "This cooldown is not in the post-cooldown window. You can only extend a cooldown within 24 hours after it expires.");
      }
      if (*cooldown->post_cooldown_window_end_ms < now) {
        throw util::ValidationError("The post-cooldown window has expired. You can no longer extend this cooldown.");
      }
      if (cooldown->platform != platform) {
        throw util::ValidationError("Platform type mismatch. This cooldown is for " + db::model::PlatformCode(cooldown->platform) +
                                    ", but you requested " + db::model::PlatformCode(platform));
      }

      db::ThrowIfDbError(repository_->DeleteSelfExclusion(tx, cooldown_id), "delete cooldown");

      CreateRequest request;
      request.user_id  = user_id;
      request.type     = duration_days ? EXCLUSION_TYPE_TEMPORARY : EXCLUSION_TYPE_PERMANENT;
      request.platform = platform;

      auto exclusion = NewRecord(request, now);
      if (duration_days) {
        exclusion.end_ms = now + *duration_days * util::kDayMs;
      }
      db::ThrowIfDbError(repository_->InsertSelfExclusion(tx, exclusion), "insert exclusion");
      return exclusion;
    });
  });

  LEDGER_LOG_INFO("cooldown extended", {StringField("user_id", user_id), StringField("cooldown_id", cooldown_id),
                                        StringField("type", db::model::ExclusionTypeCode(extended.type)),
                                        IntField("duration_days", duration_days.value_or(0))});
  return extended;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::vector<SelfExclusionRecord> ExclusionManager::List(const std::string& user_id) {
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) { return repository_->ListSelfExclusions(tx, user_id); });
}

std::vector<SelfExclusionRecord> ExclusionManager::GetActive(const std::string& user_id, std::optional<ledger::v1::PlatformType> segment) {
  const auto now  = util::NowMs();
  const auto rows = List(user_id);

  std::vector<SelfExclusionRecord> out;
  for (const auto& r : rows) {
    if (!r.is_active || !AppliesToSegment(r, segment)) continue;

    const bool applicable = r.type == EXCLUSION_TYPE_PERMANENT || (r.type == EXCLUSION_TYPE_TEMPORARY && EndsAfter(r, now)) ||
                            (r.type == EXCLUSION_TYPE_COOLDOWN && (EndsAfter(r, now) || IsInPostCooldownWindow(r, now))) ||
                            IsLimitType(r.type);
    if (applicable) out.push_back(r);
  }
  return out;
}

std::optional<ActiveExclusion> ExclusionManager::HasActive(const std::string& user_id, std::optional<ledger::v1::PlatformType> segment) {
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) { return HasActive(tx, user_id, segment, util::NowMs()); });
}

std::optional<ActiveExclusion> ExclusionManager::HasActive(db::Transaction& tx, const std::string& user_id,
                                                           std::optional<ledger::v1::PlatformType> segment, int64_t now_ms) {
  const auto rows = repository_->ListSelfExclusions(tx, user_id);

  auto first = [&](auto&& pred) -> const SelfExclusionRecord* {
    for (const auto& r : rows) {
      if (r.is_active && AppliesToSegment(r, segment) && pred(r)) return &r;
    }
    return nullptr;
  };

  if (const auto* r = first([](const auto& x) { return x.type == EXCLUSION_TYPE_PERMANENT; })) {
    return ActiveExclusion{r->id, r->type, r->platform, std::nullopt, 0, false};
  }
  if (const auto* r = first([&](const auto& x) { return x.type == EXCLUSION_TYPE_TEMPORARY && EndsAfter(x, now_ms); })) {
    return ActiveExclusion{r->id, r->type, r->platform, r->end_ms, *r->end_ms - now_ms, false};
  }
  if (const auto* r = first([&](const auto& x) { return x.type == EXCLUSION_TYPE_COOLDOWN && EndsAfter(x, now_ms); })) {
    return ActiveExclusion{r->id, r->type, r->platform, r->end_ms, *r->end_ms - now_ms, false};
  }
  if (const auto* r = first([&](const auto& x) { return IsInPostCooldownWindow(x, now_ms); })) {
    const auto window_end = *r->post_cooldown_window_end_ms;
    return ActiveExclusion{r->id, r->type, r->platform, window_end, window_end - now_ms, true};
  }
  return std::nullopt;
}

std::vector<SelfExclusionRecord> ExclusionManager::ActiveLimits(db::Transaction& tx, const std::string& user_id) {
  std::vector<SelfExclusionRecord> out;
  for (auto& r : repository_->ListSelfExclusions(tx, user_id)) {
    if (r.is_active && IsLimitType(r.type) && r.period && r.limit_amount) out.push_back(std::move(r));
  }
  return out;
}

GamblingLimits ExclusionManager::GetGamblingLimits(const std::string& user_id) {
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    const auto     now = util::NowMs();
    GamblingLimits out;

    for (auto& limit : ActiveLimits(tx, user_id)) {
      GamblingLimit entry{limit, evaluator_->Evaluate(tx, limit, now)};
      switch (limit.type) {
        case EXCLUSION_TYPE_DEPOSIT_LIMIT:
          out.deposit.push_back(std::move(entry));
          break;
        case EXCLUSION_TYPE_LOSS_LIMIT:
          out.loss.push_back(std::move(entry));
          break;
        default:
          out.wager.push_back(std::move(entry));
          break;
      }
    }
    return out;
  });
}

// ---------------------------------------------------------------------------
// Testing hooks
// ---------------------------------------------------------------------------

template <typename Fn>
SelfExclusionRecord ExclusionManager::Mutate(const std::string& id, Fn&& fn) {
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    auto record = repository_->GetSelfExclusion(tx, id);
    if (!record) {
      throw util::NotFound("Self-exclusion not found");
    }

    const auto now = util::NowMs();
    fn(*record, now);
    record->updated_at_ms = now;
    db::ThrowIfDbError(repository_->UpdateSelfExclusion(tx, *record), "update self-exclusion");
    return *record;
  });
}

SelfExclusionRecord ExclusionManager::ForceExpireCooldown(const std::string& id) {
  return Mutate(id, [](SelfExclusionRecord& r, int64_t now) {
    if (r.type != EXCLUSION_TYPE_COOLDOWN) {
      throw util::ValidationError("Only cooldowns can be force expired");
    }
    r.end_ms = now - util::kHourMs;
  });
}

SelfExclusionRecord ExclusionManager::ForceExpireWindow(const std::string& id) {
  return Mutate(id, [](SelfExclusionRecord& r, int64_t now) {
    if (!r.post_cooldown_window_end_ms) {
      throw util::ValidationError("This cooldown is not in the post-cooldown window");
    }
    r.post_cooldown_window_end_ms = now - util::kHourMs;
  });
}

SelfExclusionRecord ExclusionManager::ForceExpireRemoval(const std::string& id) {
  return Mutate(id, [](SelfExclusionRecord& r, int64_t now) {
    if (!IsLimitType(r.type)) {
      throw util::ValidationError("Only limits have a removal countdown");
    }
    r.removal_requested_at_ms = now - kLimitRemovalGracePeriod - util::kHourMs;
  });
}

} // namespace ledger::exclusion
