#include "operation_kind.hpp"

#include <string>
#include <unordered_map>

#include "internal/util/errors.hpp"

namespace ledger::balance {

namespace {

using ledger::v1::OperationKind;

const std::unordered_map<int, OperationKindTraits>& Table() {
  static const std::unordered_map<int, OperationKindTraits> table = {
      {ledger::v1::OPERATION_KIND_DEPOSIT, {Sign::kCredit, false, false, StatsBucket::kDeposits, DailyBucket::kDeposit}},
      {ledger::v1::OPERATION_KIND_WITHDRAW, {Sign::kDebit, false, false, StatsBucket::kWithdrawals, DailyBucket::kNone}},
      {ledger::v1::OPERATION_KIND_BET, {Sign::kDebit, false, true, StatsBucket::kBets, DailyBucket::kWager}},
      {ledger::v1::OPERATION_KIND_WIN, {Sign::kCredit, false, false, StatsBucket::kWins, DailyBucket::kWin}},
      {ledger::v1::OPERATION_KIND_REFUND, {Sign::kCredit, false, false, StatsBucket::kRefunds, DailyBucket::kNone}},
      {ledger::v1::OPERATION_KIND_PAYOUT, {Sign::kCredit, false, false, StatsBucket::kDeposits, DailyBucket::kNone}},
      {ledger::v1::OPERATION_KIND_BUYIN, {Sign::kDebit, false, true, StatsBucket::kWithdrawals, DailyBucket::kNone}},
      {ledger::v1::OPERATION_KIND_WIN_CANCEL, {Sign::kDebit, true, false, StatsBucket::kNone, DailyBucket::kNone}},
      {ledger::v1::OPERATION_KIND_CORRECTION_DEBIT, {Sign::kDebit, true, false, StatsBucket::kNone, DailyBucket::kNone}},
      {ledger::v1::OPERATION_KIND_CORRECTION_BUYIN, {Sign::kDebit, true, false, StatsBucket::kNone, DailyBucket::kNone}},
      {ledger::v1::OPERATION_KIND_CORRECTION_CREDIT, {Sign::kCredit, false, false, StatsBucket::kNone, DailyBucket::kNone}},
      {ledger::v1::OPERATION_KIND_VAULT_DEPOSIT, {Sign::kDebit, false, false, StatsBucket::kNone, DailyBucket::kNone}},
      {ledger::v1::OPERATION_KIND_VAULT_WITHDRAW, {Sign::kCredit, false, false, StatsBucket::kNone, DailyBucket::kNone}},
      {ledger::v1::OPERATION_KIND_TIP_SEND, {Sign::kDebit, false, false, StatsBucket::kNone, DailyBucket::kNone}},
      {ledger::v1::OPERATION_KIND_TIP_RECEIVE, {Sign::kCredit, false, false, StatsBucket::kNone, DailyBucket::kNone}},
      {ledger::v1::OPERATION_KIND_RACE_CREATION, {Sign::kDebit, false, false, StatsBucket::kNone, DailyBucket::kNone}},
      {ledger::v1::OPERATION_KIND_BONUS, {Sign::kCredit, false, false, StatsBucket::kNone, DailyBucket::kNone}},
  };
  return table;
}

} // namespace

const OperationKindTraits& TraitsOf(OperationKind kind) {
  const auto& table = Table();
  auto        it    = table.find(kind);
  if (it == table.end()) {
    throw util::ValidationError("unsupported operation kind " + std::to_string(static_cast<int>(kind)));
  }
  return it->second;
}

} // namespace ledger::balance
