#pragma once

#include <cstdint>
#include <string>

#include "ledger/v1/types.pb.h"

namespace ledger::db::model {

/*
  Applied ledger operation. Append only.

  operation_id is the idempotency key (primary key).
*/
struct BalanceOperationRecord {
  std::string operation_id;
  std::string user_id;
  std::string asset;

  ledger::v1::OperationKind kind = ledger::v1::OPERATION_KIND_UNSPECIFIED;

  // Magnitude and the signed delta actually applied.
  int64_t amount        = 0;
  int64_t signed_amount = 0;

  int64_t previous_balance = 0;
  int64_t balance_after    = 0;

  ledger::v1::OperationStatus status = ledger::v1::OPERATION_STATUS_CONFIRMED;

  std::string description;

  ledger::v1::PlatformType platform = ledger::v1::PLATFORM_TYPE_PLATFORM;

  int64_t created_at_ms = 0;
};

} // namespace ledger::db::model
