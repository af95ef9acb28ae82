#include "proto_mapping.hpp"

#include "internal/util/amount.hpp"

namespace ledger::service {

ledger::v1::SelfExclusion ToProto(const db::model::SelfExclusionRecord& r, int64_t now_ms) {
  ledger::v1::SelfExclusion out;
  out.set_id(r.id);
  out.set_user_id(r.user_id);
  out.set_type(r.type);
  out.set_platform(r.platform);
  if (r.period) out.set_period(*r.period);
  if (r.limit_amount) out.set_limit_amount(util::FormatAmount(*r.limit_amount));
  out.set_start_ms(r.start_ms);
  if (r.end_ms) out.set_end_ms(*r.end_ms);
  out.set_is_active(r.is_active);
  if (r.removal_requested_at_ms) {
    out.set_removal_requested_at_ms(*r.removal_requested_at_ms);
    out.set_removal_expires_at_ms(*r.removal_requested_at_ms + exclusion::kLimitRemovalGracePeriod);
  }
  if (r.post_cooldown_window_end_ms) out.set_post_cooldown_window_end_ms(*r.post_cooldown_window_end_ms);
  out.set_created_at_ms(r.created_at_ms);
  out.set_updated_at_ms(r.updated_at_ms);

  out.set_is_in_post_cooldown_window(exclusion::IsInPostCooldownWindow(r, now_ms));
  out.set_is_removal_pending(r.removal_requested_at_ms.has_value());
  return out;
}

ledger::v1::ActiveExclusion ToProto(const exclusion::ActiveExclusion& active) {
  ledger::v1::ActiveExclusion out;
  out.set_id(active.id);
  out.set_type(active.type);
  out.set_platform(active.platform);
  if (active.end_ms) out.set_end_ms(*active.end_ms);
  out.set_remaining_ms(active.remaining_ms);
  out.set_is_in_post_cooldown_window(active.in_post_cooldown_window);
  return out;
}

ledger::v1::GamblingLimit ToProto(const exclusion::GamblingLimit& entry) {
  ledger::v1::GamblingLimit out;
  out.set_id(entry.limit.id);
  out.set_type(entry.limit.type);
  if (entry.limit.period) out.set_period(*entry.limit.period);
  out.set_platform(entry.limit.platform);
  out.set_limit_amount(util::FormatAmount(entry.limit.limit_amount.value_or(0)));
  out.set_used_amount(util::FormatAmount(entry.usage.used_usd));
  out.set_remaining_amount(util::FormatAmount(entry.usage.remaining_usd));
  out.set_period_start_ms(entry.usage.window.start_ms);
  out.set_period_end_ms(entry.usage.window.end_ms);
  out.set_is_removal_pending(entry.limit.removal_requested_at_ms.has_value());
  return out;
}

ledger::v1::Wallet ToProto(const db::model::BalanceRecord& wallet) {
  ledger::v1::Wallet out;
  out.set_asset(wallet.asset);
  out.set_balance(util::FormatAmount(wallet.balance));
  out.set_is_primary(wallet.is_primary);
  out.set_updated_at_ms(wallet.updated_at_ms);
  return out;
}

ledger::v1::BalanceOperation ToProto(const db::model::BalanceOperationRecord& op) {
  ledger::v1::BalanceOperation out;
  out.set_operation_id(op.operation_id);
  out.set_user_id(op.user_id);
  out.set_asset(op.asset);
  out.set_kind(op.kind);
  out.set_amount(util::FormatAmount(op.amount));
  out.set_signed_amount(util::FormatAmount(op.signed_amount));
  out.set_previous_balance(util::FormatAmount(op.previous_balance));
  out.set_balance_after(util::FormatAmount(op.balance_after));
  out.set_status(op.status);
  out.set_description(op.description);
  out.set_platform(op.platform);
  out.set_created_at_ms(op.created_at_ms);
  return out;
}

ledger::v1::BalanceStatistics ToProto(const db::model::BalanceStatisticsRecord& stats) {
  ledger::v1::BalanceStatistics out;
  out.set_user_id(stats.user_id);
  out.set_deposits_cents(stats.deposits_cents);
  out.set_withdrawals_cents(stats.withdrawals_cents);
  out.set_bets_cents(stats.bets_cents);
  out.set_wins_cents(stats.wins_cents);
  out.set_refunds_cents(stats.refunds_cents);
  out.set_bet_count(stats.bet_count);
  out.set_win_count(stats.win_count);
  return out;
}

ledger::v1::AssetLimit ToProto(const balance::AssetLimit& limit) {
  ledger::v1::AssetLimit out;
  out.set_asset(limit.asset);
  out.set_min_deposit(util::FormatAmount(limit.min_deposit));
  out.set_max_deposit(util::FormatAmount(limit.max_deposit));
  out.set_min_withdraw(util::FormatAmount(limit.min_withdraw));
  out.set_max_withdraw(util::FormatAmount(limit.max_withdraw));
  out.set_daily_withdraw_limit(util::FormatAmount(limit.daily_withdraw_limit));
  return out;
}

ledger::v1::LockStats ToProto(const lock::LockStats& stats) {
  ledger::v1::LockStats out;
  out.set_resource(stats.resource);
  out.set_total_acquisitions(stats.total_acquisitions);
  out.set_successful(stats.successful_acquisitions);
  out.set_failed(stats.failed_acquisitions);
  out.set_avg_acquisition_ms(stats.avg_acquisition_ms);
  out.set_avg_hold_ms(stats.avg_hold_ms);
  out.set_extensions(stats.extensions);
  return out;
}

} // namespace ledger::service
