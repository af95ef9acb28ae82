#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "client/cpp/ledger_client.h"
#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/runtime/server.hpp"

namespace {

using namespace ledger::v1;
using ledger::client::Identity;
using ledger::client::LedgerClient;

struct Harness {
  ledger::factory::Application              app;
  std::unique_ptr<ledger::runtime::Server>  server;
  std::shared_ptr<::grpc::Channel>          channel;

  Harness() {
    auto config = ledger::config::ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "127.0.0.1:0"
admin:
  testing_hooks_enabled: true
locks:
  backend: LOCK_BACKEND_MEMORY
)");

    app    = ledger::factory::Build(config);
    server = std::make_unique<ledger::runtime::Server>(config.server().bind_address(), std::move(app.grpc_services));
    server->Start();

    channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(server->Port()), ::grpc::InsecureChannelCredentials());
  }

  ~Harness() {
    server->Stop();
  }

  LedgerClient Client(const std::string& user, std::vector<std::string> roles = {}) {
    LedgerClient client(channel, Identity{user, std::move(roles)});
    client.SetTimeout(std::chrono::milliseconds(5000));
    return client;
  }
};

UpdateBalanceRequest Update(const std::string& id, const std::string& user, OperationKind kind, const std::string& amount,
                            PlatformType platform = PLATFORM_TYPE_CASINO) {
  UpdateBalanceRequest req;
  req.set_operation_id(id);
  req.set_user_id(user);
  req.set_kind(kind);
  req.set_amount(amount);
  req.set_asset("USDT");
  req.set_platform(platform);
  return req;
}

void TestBalanceRoundTrip(Harness& h) {
  auto alice = h.Client("alice");

  UpdateBalanceResponse resp;
  assert(alice.UpdateBalance(Update("a-dep", "alice", OPERATION_KIND_DEPOSIT, "100.5"), &resp).ok());
  assert(resp.success() && resp.balance() == "100.5" && !resp.replayed());

  assert(alice.UpdateBalance(Update("a-dep", "alice", OPERATION_KIND_DEPOSIT, "100.5"), &resp).ok());
  assert(resp.replayed() && resp.balance() == "100.5");

  const auto insufficient = alice.UpdateBalance(Update("a-bet", "alice", OPERATION_KIND_BET, "500"), &resp);
  assert(insufficient.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  UpdateBalanceBatchRequest batch;
  batch.set_user_id("alice");
  batch.set_asset("USDT");
  auto* bet = batch.add_operations();
  bet->set_operation_id("a-batch-bet");
  bet->set_kind(OPERATION_KIND_BET);
  bet->set_amount("10");
  bet->set_platform(PLATFORM_TYPE_CASINO);
  auto* win = batch.add_operations();
  win->set_operation_id("a-batch-win");
  win->set_kind(OPERATION_KIND_WIN);
  win->set_amount("4.5");
  win->set_platform(PLATFORM_TYPE_CASINO);

  UpdateBalanceBatchResponse batch_resp;
  assert(alice.UpdateBalanceBatch(batch, &batch_resp).ok());
  assert(batch_resp.results_size() == 2);
  assert(batch_resp.balance() == "95");

  GetBalancesRequest balances_req;
  balances_req.set_user_id("alice");
  GetBalancesResponse balances;
  assert(alice.GetBalances(balances_req, &balances).ok());
  assert(balances.wallets_size() == 1);
  assert(balances.wallets(0).asset() == "USDT" && balances.wallets(0).balance() == "95" && balances.wallets(0).is_primary());

  GetOperationRequest op_req;
  op_req.set_operation_id("a-batch-bet");
  GetOperationResponse op;
  assert(alice.GetOperation(op_req, &op).ok());
  assert(op.operation().signed_amount() == "-10");
  assert(op.operation().previous_balance() == "100.5");

  GetStatisticsRequest stats_req;
  stats_req.set_user_id("alice");
  GetStatisticsResponse stats;
  assert(alice.GetStatistics(stats_req, &stats).ok());

  GetAssetLimitsResponse limits;
  assert(alice.GetAssetLimits(GetAssetLimitsRequest{}, &limits).ok());
  assert(limits.limits_size() == 9);

  // Another user's wallet is off limits without the admin role.
  auto mallory = h.Client("mallory");
  assert(mallory.GetBalances(balances_req, &balances).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(h.Client("ops", {"admin"}).GetBalances(balances_req, &balances).ok());

  // No identity at all.
  LedgerClient anonymous(h.channel, Identity{});
  assert(anonymous.GetBalances(balances_req, &balances).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
}

void TestSelfExclusionLifecycle(Harness& h) {
  auto bob   = h.Client("bob");
  auto admin = h.Client("ops", {"admin"});

  UpdateBalanceResponse resp;
  assert(bob.UpdateBalance(Update("b-dep", "bob", OPERATION_KIND_DEPOSIT, "50"), &resp).ok());

  CreateSelfExclusionRequest create;
  create.set_user_id("bob");
  create.set_type(EXCLUSION_TYPE_COOLDOWN);
  create.set_platform(PLATFORM_TYPE_CASINO);
  CreateSelfExclusionResponse cooldown;
  assert(bob.CreateSelfExclusion(create, &cooldown).ok());

  const auto denied = bob.UpdateBalance(Update("b-bet", "bob", OPERATION_KIND_BET, "5"), &resp);
  assert(denied.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(denied.error_message().find("cooldown") != std::string::npos);

  // Sports is unaffected.
  assert(bob.UpdateBalance(Update("b-sports", "bob", OPERATION_KIND_BET, "5", PLATFORM_TYPE_SPORTS), &resp).ok());

  HasActiveSelfExclusionRequest has_req;
  has_req.set_user_id("bob");
  has_req.set_platform(PLATFORM_TYPE_CASINO);
  HasActiveSelfExclusionResponse has;
  assert(bob.HasActiveSelfExclusion(has_req, &has).ok());
  assert(has.excluded());

  GetActiveSelfExclusionsRequest active_req;
  active_req.set_user_id("bob");
  active_req.set_platform(PLATFORM_TYPE_CASINO);
  GetActiveSelfExclusionsResponse active;
  assert(bob.GetActiveSelfExclusions(active_req, &active).ok());
  assert(active.exclusions_size() == 1 && active.exclusions(0).type() == EXCLUSION_TYPE_COOLDOWN);
  active_req.set_platform(PLATFORM_TYPE_SPORTS);
  assert(bob.GetActiveSelfExclusions(active_req, &active).ok());
  assert(active.exclusions_size() == 0);

  ForceExpireRequest force;
  force.set_exclusion_id(cooldown.exclusion().id());
  ForceExpireResponse forced;
  assert(bob.ForceExpireCooldown(force, &forced).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(admin.ForceExpireCooldown(force, &forced).ok());

  RunExpiryResponse expiry;
  assert(admin.RunExpiry(RunExpiryRequest{}, &expiry).ok());
  assert(expiry.cooldowns_windowed() == 1);

  ExtendSelfExclusionRequest extend;
  extend.set_user_id("bob");
  extend.set_cooldown_id(cooldown.exclusion().id());
  extend.set_platform(PLATFORM_TYPE_CASINO);
  extend.set_duration_days(30);
  ExtendSelfExclusionResponse extended;
  assert(bob.ExtendSelfExclusion(extend, &extended).ok());
  assert(extended.exclusion().type() == EXCLUSION_TYPE_TEMPORARY);

  CancelSelfExclusionRequest cancel;
  cancel.set_user_id("bob");
  cancel.set_id(extended.exclusion().id());
  CancelSelfExclusionResponse canceled;
  assert(bob.CancelSelfExclusion(cancel, &canceled).error_code() == ::grpc::StatusCode::ABORTED);

  CheckAccessRequest check;
  check.set_user_id("bob");
  check.set_platform(PLATFORM_TYPE_CASINO);
  check.set_action(ACCESS_ACTION_WITHDRAW);
  CheckAccessResponse access;
  assert(bob.CheckAccess(check, &access).ok() && access.allowed());
  check.set_action(ACCESS_ACTION_DEPOSIT);
  assert(bob.CheckAccess(check, &access).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);

  ListSelfExclusionsRequest list_req;
  list_req.set_user_id("bob");
  ListSelfExclusionsResponse list;
  assert(bob.ListSelfExclusions(list_req, &list).ok());
  assert(list.exclusions_size() == 1);
}

void TestGamblingLimits(Harness& h) {
  auto carol = h.Client("carol");

  UpdateBalanceResponse resp;
  assert(carol.UpdateBalance(Update("c-dep", "carol", OPERATION_KIND_DEPOSIT, "500"), &resp).ok());

  CreateSelfExclusionRequest limit;
  limit.set_user_id("carol");
  limit.set_type(EXCLUSION_TYPE_WAGER_LIMIT);
  limit.set_platform(PLATFORM_TYPE_PLATFORM);
  limit.set_period(LIMIT_PERIOD_DAILY);
  limit.set_limit_amount("100");
  CreateSelfExclusionResponse created;
  assert(carol.CreateSelfExclusion(limit, &created).ok());

  limit.set_period(LIMIT_PERIOD_WEEKLY);
  assert(carol.CreateSelfExclusion(limit, &created).error_code() == ::grpc::StatusCode::ABORTED);

  assert(carol.UpdateBalance(Update("c-bet-1", "carol", OPERATION_KIND_BET, "70"), &resp).ok());
  const auto exceeded = carol.UpdateBalance(Update("c-bet-2", "carol", OPERATION_KIND_BET, "40"), &resp);
  assert(exceeded.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(exceeded.error_message() == "Wager limit exceeded. Your daily wager limit is $100.00. You have $30.00 remaining.");

  GetGamblingLimitsRequest limits_req;
  limits_req.set_user_id("carol");
  GetGamblingLimitsResponse limits;
  assert(carol.GetGamblingLimits(limits_req, &limits).ok());
  assert(limits.wager_limits_size() == 1);
  assert(limits.wager_limits(0).used_amount() == "70");
  assert(limits.wager_limits(0).remaining_amount() == "30");

  GetLockStatsRequest stats_req;
  GetLockStatsResponse stats;
  assert(h.Client("ops", {"admin"}).GetLockStats(stats_req, &stats).ok());
  assert(stats.stats().total_acquisitions() > 0);

  GetTopContendedResourcesResponse top;
  assert(h.Client("ops", {"admin"}).GetTopContendedResources(GetTopContendedResourcesRequest{}, &top).ok());
  assert(top.resources_size() > 0);
}

} // namespace

int main() {
  Harness harness;

  TestBalanceRoundTrip(harness);
  TestSelfExclusionLifecycle(harness);
  TestGamblingLimits(harness);

  std::cout << "ledger_integration_grpc_roundtrip: pass\n";
  return 0;
}
