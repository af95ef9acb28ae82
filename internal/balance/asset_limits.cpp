#include "asset_limits.hpp"

#include "internal/util/errors.hpp"

namespace ledger::balance {

namespace {

AssetLimit Make(std::string asset, const char* min_deposit, const char* max_deposit, const char* min_withdraw, const char* max_withdraw,
                const char* daily_withdraw) {
  return AssetLimit{std::move(asset),
                    util::ParseAmount(min_deposit),
                    util::ParseAmount(max_deposit),
                    util::ParseAmount(min_withdraw),
                    util::ParseAmount(max_withdraw),
                    util::ParseAmount(daily_withdraw)};
}

void CheckRange(const char* what, const AssetLimit& limit, int64_t amount, int64_t min, int64_t max) {
  if (amount < min || amount > max) {
    throw util::ValidationError(std::string(what) + " amount must be between " + util::FormatAmount(min) + " and " + util::FormatAmount(max) +
                                " " + limit.asset);
  }
}

} // namespace

const std::vector<AssetLimit>& AssetLimits() {
  static const std::vector<AssetLimit> limits = {
      Make("BTC", "0.00000001", "100", "0.0001", "10", "50"),
      Make("ETH", "0.000001", "1000", "0.001", "100", "500"),
      Make("USDT", "1", "1000000", "10", "100000", "500000"),
      Make("USDC", "1", "1000000", "10", "100000", "500000"),
      Make("LTC", "0.00000001", "1000", "0.001", "100", "500"),
      Make("DOGE", "1", "1000000", "10", "100000", "500000"),
      Make("TRX", "1", "1000000", "10", "100000", "500000"),
      Make("XRP", "1", "1000000", "10", "100000", "500000"),
      Make("SOL", "0.001", "10000", "0.01", "1000", "5000"),
  };
  return limits;
}

const AssetLimit* FindAssetLimit(std::string_view asset) {
  for (const auto& limit : AssetLimits()) {
    if (limit.asset == asset) return &limit;
  }
  return nullptr;
}

void ValidateAmount(const AssetLimit& limit, ledger::v1::OperationKind kind, int64_t amount) {
  if (amount < 0) {
    throw util::ValidationError("amount must not be negative");
  }

  switch (kind) {
    case ledger::v1::OPERATION_KIND_DEPOSIT:
      CheckRange("Deposit", limit, amount, limit.min_deposit, limit.max_deposit);
      break;
    case ledger::v1::OPERATION_KIND_WITHDRAW:
      CheckRange("Withdraw", limit, amount, limit.min_withdraw, limit.max_withdraw);
      break;
    case ledger::v1::OPERATION_KIND_BET:
      // Zero is a demo bet.
      if (amount != 0) CheckRange("Bet", limit, amount, kMinBetUnits, kMaxBetUnits);
      break;
    default:
      break;
  }
}

} // namespace ledger::balance
