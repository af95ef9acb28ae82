#include "access_guard.hpp"

#include <cctype>

#include "internal/db/model/enum_codec.hpp"
#include "internal/util/errors.hpp"

namespace ledger::exclusion {

namespace {

std::string SegmentName(ledger::v1::PlatformType platform) {
  if (platform == ledger::v1::PLATFORM_TYPE_PLATFORM) return "the platform";

  auto name = db::model::PlatformCode(platform);
  for (auto& c : name) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return name;
}

std::string Plural(int64_t n, const char* unit) {
  return std::to_string(n) + " " + unit + (n == 1 ? "" : "s");
}

} // namespace

std::string FormatRemaining(int64_t remaining_ms) {
  const int64_t minutes = remaining_ms / 60000;
  const int64_t hours   = minutes / 60;
  const int64_t days    = hours / 24;

  std::string out;
  auto        append = [&out](const std::string& part) {
    if (!out.empty()) out += ", ";
    out += part;
  };

  if (days > 0) append(Plural(days, "day"));
  if (hours % 24 > 0) append(Plural(hours % 24, "hour"));
  if (minutes % 60 > 0) append(Plural(minutes % 60, "minute"));

  return out.empty() ? "less than a minute" : out;
}

std::string DenialMessage(const ActiveExclusion& exclusion) {
  const auto segment   = SegmentName(exclusion.platform);
  const auto remaining = FormatRemaining(exclusion.remaining_ms);

  switch (exclusion.type) {
    case ledger::v1::EXCLUSION_TYPE_PERMANENT:
      return "You are permanently excluded from gambling on " + segment + ". You may still withdraw your funds.";
    case ledger::v1::EXCLUSION_TYPE_TEMPORARY:
      return "You are temporarily excluded from gambling on " + segment + " for another " + remaining +
             ". You may still withdraw your funds.";
    default:
      if (exclusion.in_post_cooldown_window) {
        return "You are in the post-cooldown window on " + segment + " for another " + remaining +
               ". Extend it to a self-exclusion or wait for it to close.";
      }
      return "You are on a cooldown on " + segment + ". You can resume in " + remaining + ".";
  }
}

void ThrowDenied(const ActiveExclusion& exclusion) {
  util::ExclusionKind kind = util::ExclusionKind::kCooldown;
  switch (exclusion.type) {
    case ledger::v1::EXCLUSION_TYPE_PERMANENT:
      kind = util::ExclusionKind::kPermanent;
      break;
    case ledger::v1::EXCLUSION_TYPE_TEMPORARY:
      kind = util::ExclusionKind::kTemporary;
      break;
    default:
      kind = exclusion.in_post_cooldown_window ? util::ExclusionKind::kPostCooldownWindow : util::ExclusionKind::kCooldown;
      break;
  }
  throw util::SelfExclusionActive(kind, DenialMessage(exclusion));
}

AccessGuard::AccessGuard(std::shared_ptr<ExclusionManager> exclusions) : exclusions_(std::move(exclusions)) {
}

void AccessGuard::CheckAccess(const std::string& user_id, ledger::v1::PlatformType segment, ledger::v1::AccessAction action) {
  if (user_id.empty()) {
    throw util::ValidationError("user_id is required");
  }
  if (segment == ledger::v1::PLATFORM_TYPE_UNSPECIFIED) {
    segment = ledger::v1::PLATFORM_TYPE_PLATFORM;
  }

  switch (action) {
    case ledger::v1::ACCESS_ACTION_WITHDRAW:
      return;

    case ledger::v1::ACCESS_ACTION_LOGIN:
    case ledger::v1::ACCESS_ACTION_REFRESH_TOKEN: {
      const auto active = exclusions_->HasActive(user_id, ledger::v1::PLATFORM_TYPE_PLATFORM);
      if (active && active->type == ledger::v1::EXCLUSION_TYPE_PERMANENT && active->platform == ledger::v1::PLATFORM_TYPE_PLATFORM) {
        ThrowDenied(*active);
      }
      return;
    }

    case ledger::v1::ACCESS_ACTION_BET:
    case ledger::v1::ACCESS_ACTION_DEPOSIT:
    case ledger::v1::ACCESS_ACTION_BONUS: {
      const auto active = exclusions_->HasActive(user_id, segment);
      if (active) ThrowDenied(*active);
      return;
    }

    default:
      throw util::ValidationError("access action is required");
  }
}

} // namespace ledger::exclusion
