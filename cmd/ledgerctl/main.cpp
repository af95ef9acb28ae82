#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "client/cpp/ledger_client.h"

using namespace ledger::v1;
using ledger::client::Identity;
using ledger::client::LedgerClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  ledgerctl [--user <id>] [--roles <r1,r2>] <addr> <command> [args]\n\n"
            << "Balance:\n"
            << "  update <operation_id> <user> <kind> <amount> <asset> [platform] [description]\n"
            << "  batch <user> <asset> <operation_id:kind:amount[:platform]>...\n"
            << "  balances <user>\n"
            << "  operation <operation_id>\n"
            << "  stats <user>\n"
            << "  asset-limits\n"
            << "Self-exclusion:\n"
            << "  exclude <user> <type> <platform> [period] [amount] [end_ms]\n"
            << "  cancel <user> <id>\n"
            << "  list <user>\n"
            << "  active <user> [platform]\n"
            << "  limits <user>\n"
            << "  extend <user> <cooldown_id> <platform> [duration_days]\n"
            << "  has-active <user> [platform]\n"
            << "  check <user> <platform> <action>\n"
            << "Admin:\n"
            << "  lock-stats [resource]\n"
            << "  top-locks [limit]\n"
            << "  run-expiry\n"
            << "  force-expire <cooldown|window|removal> <exclusion_id>\n\n"
            << "Enum values are the lowercase names without prefix, e.g. bet, casino, loss_limit, weekly.\n";
}

static std::string EnumName(const std::string& prefix, const std::string& value) {
  std::string out = prefix;
  for (char c : value) {
    out.push_back(c == '-' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return out;
}

template <typename Enum, typename ParseFn>
static Enum ParseEnum(const std::string& prefix, const std::string& value, ParseFn parse) {
  Enum out{};
  if (!parse(EnumName(prefix, value), &out)) {
    std::cerr << "unsupported value: " << value << "\n";
    std::exit(1);
  }
  return out;
}

static PlatformType ParsePlatform(const std::string& value) {
  return ParseEnum<PlatformType>("PLATFORM_TYPE_", value, PlatformType_Parse);
}

static std::vector<std::string> Split(const std::string& value, char sep) {
  std::vector<std::string> parts;
  std::istringstream       in(value);
  std::string              part;
  while (std::getline(in, part, sep)) {
    if (!part.empty()) parts.push_back(part);
  }
  return parts;
}

static int Print(const ::grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
    return 2;
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(resp, &json, options).ok()) {
    std::cerr << "failed to render response\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

int main(int argc, char** argv) {
  Identity identity;

  int i = 1;
  for (; i + 1 < argc; i += 2) {
    const std::string flag = argv[i];
    if (flag == "--user") {
      identity.user_id = argv[i + 1];
    } else if (flag == "--roles") {
      identity.roles = Split(argv[i + 1], ',');
    } else {
      break;
    }
  }

  if (argc - i < 2) {
    Usage();
    return 1;
  }

  const std::string addr = argv[i];
  const std::string cmd  = argv[i + 1];

  std::vector<std::string> args(argv + i + 2, argv + argc);
  auto                     arg = [&](std::size_t n) -> const std::string& { return args.at(n); };

  LedgerClient client(::grpc::CreateChannel(addr, ::grpc::InsecureChannelCredentials()), identity);

  try {
    // ------------------------------------------------------------
    // Balance
    // ------------------------------------------------------------

    if (cmd == "update") {
      if (args.size() < 5) return 1;

      UpdateBalanceRequest req;
      req.set_operation_id(arg(0));
      req.set_user_id(arg(1));
      req.set_kind(ParseEnum<OperationKind>("OPERATION_KIND_", arg(2), OperationKind_Parse));
      req.set_amount(arg(3));
      req.set_asset(arg(4));
      req.set_platform(args.size() > 5 ? ParsePlatform(arg(5)) : PLATFORM_TYPE_PLATFORM);
      if (args.size() > 6) req.set_description(arg(6));

      UpdateBalanceResponse resp;
      return Print(client.UpdateBalance(req, &resp), resp);
    }

    if (cmd == "batch") {
      if (args.size() < 3) return 1;

      UpdateBalanceBatchRequest req;
      req.set_user_id(arg(0));
      req.set_asset(arg(1));
      for (std::size_t n = 2; n < args.size(); ++n) {
        const auto parts = Split(arg(n), ':');
        if (parts.size() < 3) {
          std::cerr << "expected operation_id:kind:amount[:platform], got " << arg(n) << "\n";
          return 1;
        }

        auto* op = req.add_operations();
        op->set_operation_id(parts[0]);
        op->set_kind(ParseEnum<OperationKind>("OPERATION_KIND_", parts[1], OperationKind_Parse));
        op->set_amount(parts[2]);
        op->set_platform(parts.size() > 3 ? ParsePlatform(parts[3]) : PLATFORM_TYPE_PLATFORM);
      }

      UpdateBalanceBatchResponse resp;
      return Print(client.UpdateBalanceBatch(req, &resp), resp);
    }

    if (cmd == "balances") {
      if (args.empty()) return 1;

      GetBalancesRequest req;
      req.set_user_id(arg(0));

      GetBalancesResponse resp;
      return Print(client.GetBalances(req, &resp), resp);
    }

    if (cmd == "operation") {
      if (args.empty()) return 1;

      GetOperationRequest req;
      req.set_operation_id(arg(0));

      GetOperationResponse resp;
      return Print(client.GetOperation(req, &resp), resp);
    }

    if (cmd == "stats") {
      if (args.empty()) return 1;

      GetStatisticsRequest req;
      req.set_user_id(arg(0));

      GetStatisticsResponse resp;
      return Print(client.GetStatistics(req, &resp), resp);
    }

    if (cmd == "asset-limits") {
      GetAssetLimitsResponse resp;
      return Print(client.GetAssetLimits(GetAssetLimitsRequest{}, &resp), resp);
    }

    // ------------------------------------------------------------
    // Self-exclusion
    // ------------------------------------------------------------

    if (cmd == "exclude") {
      if (args.size() < 3) return 1;

      CreateSelfExclusionRequest req;
      req.set_user_id(arg(0));
      req.set_type(ParseEnum<ExclusionType>("EXCLUSION_TYPE_", arg(1), ExclusionType_Parse));
      req.set_platform(ParsePlatform(arg(2)));
      if (args.size() > 3 && arg(3) != "-") req.set_period(ParseEnum<LimitPeriod>("LIMIT_PERIOD_", arg(3), LimitPeriod_Parse));
      if (args.size() > 4 && arg(4) != "-") req.set_limit_amount(arg(4));
      if (args.size() > 5) req.set_end_ms(std::stoll(arg(5)));

      CreateSelfExclusionResponse resp;
      return Print(client.CreateSelfExclusion(req, &resp), resp);
    }

    if (cmd == "cancel") {
      if (args.size() < 2) return 1;

      CancelSelfExclusionRequest req;
      req.set_user_id(arg(0));
      req.set_id(arg(1));

      CancelSelfExclusionResponse resp;
      return Print(client.CancelSelfExclusion(req, &resp), resp);
    }

    if (cmd == "list") {
      if (args.empty()) return 1;

      ListSelfExclusionsRequest req;
      req.set_user_id(arg(0));

      ListSelfExclusionsResponse resp;
      return Print(client.ListSelfExclusions(req, &resp), resp);
    }

    if (cmd == "active") {
      if (args.empty()) return 1;

      GetActiveSelfExclusionsRequest req;
      req.set_user_id(arg(0));
      if (args.size() > 1) req.set_platform(ParsePlatform(arg(1)));

      GetActiveSelfExclusionsResponse resp;
      return Print(client.GetActiveSelfExclusions(req, &resp), resp);
    }

    if (cmd == "limits") {
      if (args.empty()) return 1;

      GetGamblingLimitsRequest req;
      req.set_user_id(arg(0));

      GetGamblingLimitsResponse resp;
      return Print(client.GetGamblingLimits(req, &resp), resp);
    }

    if (cmd == "extend") {
      if (args.size() < 3) return 1;

      ExtendSelfExclusionRequest req;
      req.set_user_id(arg(0));
      req.set_cooldown_id(arg(1));
      req.set_platform(ParsePlatform(arg(2)));
      if (args.size() > 3) req.set_duration_days(std::stoi(arg(3)));

      ExtendSelfExclusionResponse resp;
      return Print(client.ExtendSelfExclusion(req, &resp), resp);
    }

    if (cmd == "has-active") {
      if (args.empty()) return 1;

      HasActiveSelfExclusionRequest req;
      req.set_user_id(arg(0));
      if (args.size() > 1) req.set_platform(ParsePlatform(arg(1)));

      HasActiveSelfExclusionResponse resp;
      return Print(client.HasActiveSelfExclusion(req, &resp), resp);
    }

    if (cmd == "check") {
      if (args.size() < 3) return 1;

      CheckAccessRequest req;
      req.set_user_id(arg(0));
      req.set_platform(ParsePlatform(arg(1)));
      req.set_action(ParseEnum<AccessAction>("ACCESS_ACTION_", arg(2), AccessAction_Parse));

      CheckAccessResponse resp;
      return Print(client.CheckAccess(req, &resp), resp);
    }

    // ------------------------------------------------------------
    // Admin
    // ------------------------------------------------------------

    if (cmd == "lock-stats") {
      GetLockStatsRequest req;
      if (!args.empty()) req.set_resource(arg(0));

      GetLockStatsResponse resp;
      return Print(client.GetLockStats(req, &resp), resp);
    }

    if (cmd == "top-locks") {
      GetTopContendedResourcesRequest req;
      if (!args.empty()) req.set_limit(static_cast<uint32_t>(std::stoul(arg(0))));

      GetTopContendedResourcesResponse resp;
      return Print(client.GetTopContendedResources(req, &resp), resp);
    }

    if (cmd == "run-expiry") {
      RunExpiryResponse resp;
      return Print(client.RunExpiry(RunExpiryRequest{}, &resp), resp);
    }

    if (cmd == "force-expire") {
      if (args.size() < 2) return 1;

      ForceExpireRequest req;
      req.set_exclusion_id(arg(1));

      ForceExpireResponse resp;
      if (arg(0) == "cooldown") return Print(client.ForceExpireCooldown(req, &resp), resp);
      if (arg(0) == "window") return Print(client.ForceExpireWindow(req, &resp), resp);
      if (arg(0) == "removal") return Print(client.ForceExpireRemoval(req, &resp), resp);
      std::cerr << "unsupported target: " << arg(0) << "\n";
      return 1;
    }
  } catch (const std::exception& e) {
    std::cerr << "invalid arguments: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
