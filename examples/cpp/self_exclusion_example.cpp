#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <string>

#include "client/cpp/ledger_client.h"
#include "ledger/v1.hpp"

int main(int argc, char** argv) {
  const std::string target  = argc > 1 ? argv[1] : "localhost:50051";
  const std::string user_id = argc > 2 ? argv[2] : "example-user";

  ledger::client::LedgerClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()), {user_id, {}});

  // A daily loss limit across every segment.
  ledger::v1::CreateSelfExclusionRequest limit;
  limit.set_user_id(user_id);
  limit.set_type(ledger::v1::EXCLUSION_TYPE_LOSS_LIMIT);
  limit.set_platform(ledger::v1::PLATFORM_TYPE_PLATFORM);
  limit.set_period(ledger::v1::LIMIT_PERIOD_DAILY);
  limit.set_limit_amount("50");

  ledger::v1::CreateSelfExclusionResponse created;
  auto status = client.CreateSelfExclusion(limit, &created);
  if (!status.ok()) {
    std::cerr << "CreateSelfExclusion failed: " << status.error_message() << '\n';
    return 1;
  }

  // Then a cooldown on the casino only.
  ledger::v1::CreateSelfExclusionRequest cooldown;
  cooldown.set_user_id(user_id);
  cooldown.set_type(ledger::v1::EXCLUSION_TYPE_COOLDOWN);
  cooldown.set_platform(ledger::v1::PLATFORM_TYPE_CASINO);
  status = client.CreateSelfExclusion(cooldown, &created);
  if (!status.ok()) {
    std::cerr << "cooldown failed: " << status.error_message() << '\n';
    return 1;
  }

  for (auto platform : {ledger::v1::PLATFORM_TYPE_CASINO, ledger::v1::PLATFORM_TYPE_SPORTS}) {
    ledger::v1::CheckAccessRequest check;
    check.set_user_id(user_id);
    check.set_platform(platform);
    check.set_action(ledger::v1::ACCESS_ACTION_BET);

    ledger::v1::CheckAccessResponse access;
    status = client.CheckAccess(check, &access);
    std::cout << ledger::v1::PlatformType_Name(platform) << ": " << (status.ok() ? "allowed" : status.error_message()) << '\n';
  }

  ledger::v1::GetGamblingLimitsRequest limits_req;
  limits_req.set_user_id(user_id);
  ledger::v1::GetGamblingLimitsResponse limits;
  status = client.GetGamblingLimits(limits_req, &limits);
  if (!status.ok()) {
    std::cerr << "GetGamblingLimits failed: " << status.error_message() << '\n';
    return 1;
  }
  for (const auto& loss : limits.loss_limits()) {
    std::cout << "loss limit " << loss.limit_amount() << ", used " << loss.used_amount() << ", remaining " << loss.remaining_amount() << '\n';
  }
  return 0;
}
