#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace ledger::runtime::config {
class RuntimeConfig;
}

namespace ledger::pricing {

/*
  USD valuation of asset amounts.

  A rate is the USD price of one whole asset unit, stored in 1e-8 fixed
  point like balances. Gambling limits and the daily gambling stats are
  kept in USD at the same 1e-8 scale, so even a sub-cent bet moves the
  totals a limit is checked against.
*/
class RateProvider {
 public:
  virtual ~RateProvider() = default;

  virtual std::optional<int64_t> UsdRate(const std::string& asset) const = 0;
};

class StaticRateProvider : public RateProvider {
 public:
  explicit StaticRateProvider(std::map<std::string, int64_t> rates);

  std::optional<int64_t> UsdRate(const std::string& asset) const override;

 private:
  std::map<std::string, int64_t> rates_;
};

// pricing.usd_rates, or the built-in table when that map is empty.
// Throws std::runtime_error on a rate that is malformed or zero.
std::shared_ptr<RateProvider> RatesFromConfig(const ledger::runtime::config::RuntimeConfig& config);

std::map<std::string, int64_t> DefaultUsdRates();

// USD value of a non-negative amount, 1e-8 units, rounded half up.
// Throws util::InvalidState when the asset has no rate.
int64_t ToUsd(const RateProvider& rates, int64_t units, const std::string& asset);

// Same valuation in whole cents, rounded half up.
int64_t ToCents(const RateProvider& rates, int64_t units, const std::string& asset);

} // namespace ledger::pricing
