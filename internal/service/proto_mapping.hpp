#pragma once

#include <cstdint>

#include "internal/balance/asset_limits.hpp"
#include "internal/db/model/balance_operation_record.hpp"
#include "internal/db/model/balance_record.hpp"
#include "internal/db/model/balance_statistics_record.hpp"
#include "internal/db/model/self_exclusion_record.hpp"
#include "internal/exclusion/exclusion_manager.hpp"
#include "internal/lock/lock_metrics.hpp"
#include "ledger/v1/types.pb.h"

namespace ledger::service {

// Computed fields (post-cooldown window, removal countdown) are
// evaluated against now_ms.
ledger::v1::SelfExclusion ToProto(const db::model::SelfExclusionRecord& record, int64_t now_ms);

ledger::v1::ActiveExclusion   ToProto(const exclusion::ActiveExclusion& active);
ledger::v1::GamblingLimit     ToProto(const exclusion::GamblingLimit& limit);
ledger::v1::Wallet            ToProto(const db::model::BalanceRecord& wallet);
ledger::v1::BalanceOperation  ToProto(const db::model::BalanceOperationRecord& op);
ledger::v1::BalanceStatistics ToProto(const db::model::BalanceStatisticsRecord& stats);
ledger::v1::AssetLimit        ToProto(const balance::AssetLimit& limit);
ledger::v1::LockStats         ToProto(const lock::LockStats& stats);

} // namespace ledger::service
