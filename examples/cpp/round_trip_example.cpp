#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <iostream>
#include <string>

#include "client/cpp/ledger_client.h"
#include "ledger/v1.hpp"

namespace {

std::string NewOperationId(const std::string& prefix) {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return prefix + "-" + std::to_string(std::chrono::duration_cast<std::chrono::microseconds>(now).count());
}

} // namespace

int main(int argc, char** argv) {
  // Allow overriding the service endpoint and the acting user.
  const std::string target  = argc > 1 ? argv[1] : "localhost:50051";
  const std::string user_id = argc > 2 ? argv[2] : "example-user";

  ledger::client::LedgerClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()), {user_id, {}});
  client.SetTimeout(std::chrono::seconds(5));

  // Deposit, then place a casino bet against the new balance.
  ledger::v1::UpdateBalanceRequest deposit;
  deposit.set_operation_id(NewOperationId("deposit"));
  deposit.set_user_id(user_id);
  deposit.set_kind(ledger::v1::OPERATION_KIND_DEPOSIT);
  deposit.set_amount("25");
  deposit.set_asset("USDT");

  ledger::v1::UpdateBalanceResponse deposited;
  auto status = client.UpdateBalance(deposit, &deposited);
  if (!status.ok()) {
    std::cerr << "deposit failed: " << status.error_message() << '\n';
    return 1;
  }

  // Sending the same request again is a replay, not a second deposit.
  ledger::v1::UpdateBalanceResponse replay;
  status = client.UpdateBalance(deposit, &replay);
  if (!status.ok() || !replay.replayed()) {
    std::cerr << "expected an idempotent replay\n";
    return 1;
  }

  ledger::v1::UpdateBalanceRequest bet = deposit;
  bet.set_operation_id(NewOperationId("bet"));
  bet.set_kind(ledger::v1::OPERATION_KIND_BET);
  bet.set_amount("2.5");
  bet.set_platform(ledger::v1::PLATFORM_TYPE_CASINO);

  ledger::v1::UpdateBalanceResponse placed;
  status = client.UpdateBalance(bet, &placed);
  if (!status.ok()) {
    std::cerr << "bet rejected (" << status.error_code() << "): " << status.error_message() << '\n';
    return 1;
  }

  ledger::v1::GetBalancesRequest balances_req;
  balances_req.set_user_id(user_id);
  ledger::v1::GetBalancesResponse balances;
  status = client.GetBalances(balances_req, &balances);
  if (!status.ok()) {
    std::cerr << "GetBalances failed: " << status.error_message() << '\n';
    return 1;
  }

  std::cout << "wallets for " << user_id << ":\n";
  for (const auto& wallet : balances.wallets()) {
    std::cout << "  " << wallet.asset() << " " << wallet.balance() << (wallet.is_primary() ? " (primary)" : "") << '\n';
  }
  return 0;
}
