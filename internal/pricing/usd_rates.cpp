#include "usd_rates.hpp"

#include <limits>
#include <stdexcept>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/amount.hpp"
#include "internal/util/errors.hpp"

namespace ledger::pricing {

namespace {

__extension__ typedef __int128 Wide;

constexpr std::pair<const char*, const char*> kDefaultRates[] = {
    {"BTC", "45000"}, {"ETH", "3000"}, {"USDC", "1"}, {"USDT", "1"}, {"LTC", "180"},
    {"DOGE", "0.08"}, {"TRX", "0.1"},  {"XRP", "0.6"}, {"SOL", "100"},
};

int64_t RatedValue(const RateProvider& rates, int64_t units, const std::string& asset, Wide divisor) {
  if (units < 0) {
    throw util::ValidationError("cannot value a negative amount");
  }

  const auto rate = rates.UsdRate(asset);
  if (!rate) {
    throw util::InvalidState("No USD rate configured for " + asset);
  }

  const Wide value = (static_cast<Wide>(units) * *rate + divisor / 2) / divisor;
  if (value > std::numeric_limits<int64_t>::max()) {
    throw util::ValidationError("amount too large to value in USD");
  }
  return static_cast<int64_t>(value);
}

} // namespace

StaticRateProvider::StaticRateProvider(std::map<std::string, int64_t> rates) : rates_(std::move(rates)) {
}

std::optional<int64_t> StaticRateProvider::UsdRate(const std::string& asset) const {
  auto it = rates_.find(asset);
  if (it == rates_.end()) return std::nullopt;
  return it->second;
}

std::map<std::string, int64_t> DefaultUsdRates() {
  std::map<std::string, int64_t> rates;
  for (const auto& [asset, rate] : kDefaultRates) {
    rates[asset] = util::ParseAmount(rate);
  }
  return rates;
}

std::shared_ptr<RateProvider> RatesFromConfig(const ledger::runtime::config::RuntimeConfig& config) {
  const auto& configured = config.pricing().usd_rates();
  if (configured.empty()) {
    LEDGER_LOG_WARN("pricing.usd_rates not set, using built-in USD rates");
    return std::make_shared<StaticRateProvider>(DefaultUsdRates());
  }

  std::map<std::string, int64_t> rates;
  for (const auto& [asset, text] : configured) {
    int64_t rate = 0;
    try {
      rate = util::ParseAmount(text);
    } catch (const util::ValidationError& e) {
      throw std::runtime_error("Invalid configuration: pricing.usd_rates." + asset + ": " + e.what());
    }
    if (rate == 0) {
      throw std::runtime_error("Invalid configuration: pricing.usd_rates." + asset + " must be positive");
    }
    rates[asset] = rate;
  }
  return std::make_shared<StaticRateProvider>(std::move(rates));
}

int64_t ToUsd(const RateProvider& rates, int64_t units, const std::string& asset) {
  return RatedValue(rates, units, asset, util::kUnitsPerWhole);
}

int64_t ToCents(const RateProvider& rates, int64_t units, const std::string& asset) {
  return RatedValue(rates, units, asset, static_cast<Wide>(util::kUnitsPerWhole) * util::kUnitsPerCent);
}

} // namespace ledger::pricing
