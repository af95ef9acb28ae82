#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/amount.hpp"
#include "ledger/v1/types.pb.h"

namespace ledger::balance {

// Per asset amount bounds, in 1e-8 units.
struct AssetLimit {
  std::string asset;

  int64_t min_deposit  = 0;
  int64_t max_deposit  = 0;
  int64_t min_withdraw = 0;
  int64_t max_withdraw = 0;

  int64_t daily_withdraw_limit = 0;
};

constexpr int64_t kMinBetUnits = 1;
constexpr int64_t kMaxBetUnits = util::kMaxBalanceUnits / 10;

const std::vector<AssetLimit>& AssetLimits();

// nullptr for unsupported assets.
const AssetLimit* FindAssetLimit(std::string_view asset);

// Deposit / withdraw bounds and bet bounds. Other kinds are unbounded.
// Throws util::ValidationError.
void ValidateAmount(const AssetLimit& limit, ledger::v1::OperationKind kind, int64_t amount);

} // namespace ledger::balance
