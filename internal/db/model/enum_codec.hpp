#pragma once

#include <string>

#include "ledger/v1/types.pb.h"

namespace ledger::db::model {

/*
  Enum <-> storage code.

  Enums are persisted as short text codes ("COOLDOWN", "SPORTS",
  "DAILY", "BET", "CONFIRMED") so SQL conditions and the unique
  wager limit index can name them directly. The code is the proto
  enum name with its type prefix stripped.

  Parse* throws std::runtime_error on an unknown code.
*/

std::string PlatformCode(ledger::v1::PlatformType v);
ledger::v1::PlatformType ParsePlatform(const std::string& code);

std::string ExclusionTypeCode(ledger::v1::ExclusionType v);
ledger::v1::ExclusionType ParseExclusionType(const std::string& code);

std::string LimitPeriodCode(ledger::v1::LimitPeriod v);
ledger::v1::LimitPeriod ParseLimitPeriod(const std::string& code);

std::string OperationKindCode(ledger::v1::OperationKind v);
ledger::v1::OperationKind ParseOperationKind(const std::string& code);

std::string OperationStatusCode(ledger::v1::OperationStatus v);
ledger::v1::OperationStatus ParseOperationStatus(const std::string& code);

} // namespace ledger::db::model
