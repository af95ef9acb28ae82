#pragma once

#include "ledger/v1/types.pb.h"

namespace ledger::balance {

enum class Sign { kCredit, kDebit };

// Lifetime statistics column an operation counts towards.
enum class StatsBucket { kNone, kDeposits, kWithdrawals, kBets, kWins, kRefunds };

// Daily gambling stats column an operation counts towards.
enum class DailyBucket { kNone, kWager, kWin, kDeposit };

struct OperationKindTraits {
  Sign        sign;
  bool        can_go_negative; // debits only (corrections)
  bool        risks_money;     // consults exclusions before applying
  StatsBucket stats_bucket;
  DailyBucket daily_bucket;
};

// Throws util::ValidationError for OPERATION_KIND_UNSPECIFIED or an unknown value.
const OperationKindTraits& TraitsOf(ledger::v1::OperationKind kind);

} // namespace ledger::balance
