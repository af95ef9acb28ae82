#include "internal/pricing/usd_rates.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "config/config.pb.h"
#include "internal/util/amount.hpp"
#include "internal/util/errors.hpp"

namespace {

using ledger::pricing::StaticRateProvider;
using ledger::pricing::ToCents;
using ledger::pricing::ToUsd;
using ledger::util::ParseAmount;

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestValuesAmountsAtTheAssetRate() {
  const StaticRateProvider rates(ledger::pricing::DefaultUsdRates());

  assert(ToUsd(rates, ParseAmount("0.9"), "BTC") == ParseAmount("40500"));
  assert(ToUsd(rates, ParseAmount("12.5"), "USDT") == ParseAmount("12.5"));
  assert(ToUsd(rates, ParseAmount("10"), "DOGE") == ParseAmount("0.8"));
  // Sub-cent amounts keep their value.
  assert(ToUsd(rates, ParseAmount("0.0099"), "USDT") == ParseAmount("0.0099"));
  assert(ToUsd(rates, 1, "DOGE") == 0);
  assert(ToUsd(rates, 0, "BTC") == 0);

  assert(ToCents(rates, ParseAmount("1"), "ETH") == 300000);
  assert(ToCents(rates, ParseAmount("0.005"), "USDT") == 1);
  assert(ToCents(rates, ParseAmount("0.0049"), "USDT") == 0);
}

void TestUnknownAssetAndOverflow() {
  const StaticRateProvider rates({{"BTC", ParseAmount("45000")}});

  assert(Throws<ledger::util::InvalidState>([&] { (void)ToUsd(rates, 1, "ETH"); }));
  assert(Throws<ledger::util::ValidationError>([&] { (void)ToUsd(rates, -1, "BTC"); }));
  assert(Throws<ledger::util::ValidationError>([&] { (void)ToUsd(rates, ledger::util::kMaxBalanceUnits, "BTC"); }));
}

void TestRatesFromConfig() {
  ledger::runtime::config::RuntimeConfig config;

  auto defaults = ledger::pricing::RatesFromConfig(config);
  assert(defaults->UsdRate("SOL") == ParseAmount("100"));

  (*config.mutable_pricing()->mutable_usd_rates())["BTC"] = "60000.5";
  auto configured = ledger::pricing::RatesFromConfig(config);
  assert(configured->UsdRate("BTC") == ParseAmount("60000.5"));
  assert(!configured->UsdRate("ETH"));

  (*config.mutable_pricing()->mutable_usd_rates())["ETH"] = "0";
  assert(Throws<std::runtime_error>([&] { (void)ledger::pricing::RatesFromConfig(config); }));
  (*config.mutable_pricing()->mutable_usd_rates())["ETH"] = "cheap";
  assert(Throws<std::runtime_error>([&] { (void)ledger::pricing::RatesFromConfig(config); }));
}

} // namespace

int main() {
  TestValuesAmountsAtTheAssetRate();
  TestUnknownAssetAndOverflow();
  TestRatesFromConfig();

  std::cout << "ledger_unit_usd_rates: pass\n";
  return 0;
}
