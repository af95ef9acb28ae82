#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "ledger/v1/types.pb.h"

namespace ledger::db::model {

/*
  Persistent self-exclusion or gambling limit.

  Access types (COOLDOWN, TEMPORARY, PERMANENT) leave period and
  limit_amount empty. Limit types always carry both.
*/
struct SelfExclusionRecord {
  std::string id; // UUID
  std::string user_id;

  ledger::v1::ExclusionType type     = ledger::v1::EXCLUSION_TYPE_UNSPECIFIED;
  ledger::v1::PlatformType  platform = ledger::v1::PLATFORM_TYPE_PLATFORM;

  std::optional<ledger::v1::LimitPeriod> period;
  std::optional<int64_t>                 limit_amount; // 1e-8 units

  int64_t                start_ms = 0;
  std::optional<int64_t> end_ms; // empty = open ended

  bool is_active = true;

  std::optional<int64_t> removal_requested_at_ms;
  std::optional<int64_t> post_cooldown_window_end_ms;

  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
};

} // namespace ledger::db::model
