#include "schema.hpp"

namespace ledger::db::sql {

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS ledger_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS balances (user_id TEXT NOT NULL, asset TEXT NOT NULL, balance INTEGER NOT NULL, "
      "is_primary INTEGER NOT NULL DEFAULT 0, updated_at_ms INTEGER NOT NULL, PRIMARY KEY (user_id, asset));",

      "CREATE TABLE IF NOT EXISTS balance_operations (operation_id TEXT PRIMARY KEY, user_id TEXT NOT NULL, asset TEXT NOT NULL, "
      "kind TEXT NOT NULL, amount INTEGER NOT NULL, signed_amount INTEGER NOT NULL, previous_balance INTEGER NOT NULL, "
      "balance_after INTEGER NOT NULL, status TEXT NOT NULL, description TEXT, platform TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_balance_operations_user_kind ON balance_operations (user_id, asset, kind, created_at_ms);",

      "CREATE TABLE IF NOT EXISTS balance_statistics (user_id TEXT PRIMARY KEY, deposits_cents INTEGER NOT NULL DEFAULT 0, "
      "withdrawals_cents INTEGER NOT NULL DEFAULT 0, bets_cents INTEGER NOT NULL DEFAULT 0, wins_cents INTEGER NOT NULL DEFAULT 0, "
      "refunds_cents INTEGER NOT NULL DEFAULT 0, bet_count INTEGER NOT NULL DEFAULT 0, win_count INTEGER NOT NULL DEFAULT 0);",

      "CREATE TABLE IF NOT EXISTS daily_gambling_stats (user_id TEXT NOT NULL, day TEXT NOT NULL, platform TEXT NOT NULL, "
      "wager_usd INTEGER NOT NULL DEFAULT 0, win_usd INTEGER NOT NULL DEFAULT 0, loss_usd INTEGER NOT NULL DEFAULT 0, "
      "deposit_usd INTEGER NOT NULL DEFAULT 0, PRIMARY KEY (user_id, day, platform));",

      "CREATE TABLE IF NOT EXISTS self_exclusions (id TEXT PRIMARY KEY, user_id TEXT NOT NULL, type TEXT NOT NULL, "
      "platform TEXT NOT NULL, period TEXT, limit_amount INTEGER, start_ms INTEGER NOT NULL, end_ms INTEGER, "
      "is_active INTEGER NOT NULL, removal_requested_at_ms INTEGER, post_cooldown_window_end_ms INTEGER, "
      "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_self_exclusions_user ON self_exclusions (user_id, created_at_ms);",
      "CREATE UNIQUE INDEX IF NOT EXISTS uq_self_exclusions_active_wager ON self_exclusions (user_id) "
      "WHERE type = 'WAGER_LIMIT' AND is_active = 1;",

      "CREATE TABLE IF NOT EXISTS lock_entries (key TEXT PRIMARY KEY, token TEXT NOT NULL, expires_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS rate_counters (key TEXT PRIMARY KEY, count INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL);",

      "INSERT OR IGNORE INTO ledger_schema_migrations (version, applied_at_ms) "
      "VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);",
  };
  return kStatements;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS ledger_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());",

      "CREATE TABLE IF NOT EXISTS balances (user_id TEXT NOT NULL, asset TEXT NOT NULL, balance BIGINT NOT NULL, "
      "is_primary BOOLEAN NOT NULL DEFAULT FALSE, updated_at_ms BIGINT NOT NULL, PRIMARY KEY (user_id, asset));",

      "CREATE TABLE IF NOT EXISTS balance_operations (operation_id TEXT PRIMARY KEY, user_id TEXT NOT NULL, asset TEXT NOT NULL, "
      "kind TEXT NOT NULL, amount BIGINT NOT NULL, signed_amount BIGINT NOT NULL, previous_balance BIGINT NOT NULL, "
      "balance_after BIGINT NOT NULL, status TEXT NOT NULL, description TEXT, platform TEXT NOT NULL, created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_balance_operations_user_kind ON balance_operations (user_id, asset, kind, created_at_ms);",

      "CREATE TABLE IF NOT EXISTS balance_statistics (user_id TEXT PRIMARY KEY, deposits_cents BIGINT NOT NULL DEFAULT 0, "
      "withdrawals_cents BIGINT NOT NULL DEFAULT 0, bets_cents BIGINT NOT NULL DEFAULT 0, wins_cents BIGINT NOT NULL DEFAULT 0, "
      "refunds_cents BIGINT NOT NULL DEFAULT 0, bet_count BIGINT NOT NULL DEFAULT 0, win_count BIGINT NOT NULL DEFAULT 0);",

      "CREATE TABLE IF NOT EXISTS daily_gambling_stats (user_id TEXT NOT NULL, day TEXT NOT NULL, platform TEXT NOT NULL, "
      "wager_usd BIGINT NOT NULL DEFAULT 0, win_usd BIGINT NOT NULL DEFAULT 0, loss_usd BIGINT NOT NULL DEFAULT 0, "
      "deposit_usd BIGINT NOT NULL DEFAULT 0, PRIMARY KEY (user_id, day, platform));",

      "CREATE TABLE IF NOT EXISTS self_exclusions (id TEXT PRIMARY KEY, user_id TEXT NOT NULL, type TEXT NOT NULL, "
      "platform TEXT NOT NULL, period TEXT, limit_amount BIGINT, start_ms BIGINT NOT NULL, end_ms BIGINT, "
      "is_active BOOLEAN NOT NULL, removal_requested_at_ms BIGINT, post_cooldown_window_end_ms BIGINT, "
      "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_self_exclusions_user ON self_exclusions (user_id, created_at_ms);",
      "CREATE UNIQUE INDEX IF NOT EXISTS uq_self_exclusions_active_wager ON self_exclusions (user_id) "
      "WHERE type = 'WAGER_LIMIT' AND is_active;",

      "CREATE TABLE IF NOT EXISTS lock_entries (key TEXT PRIMARY KEY, token TEXT NOT NULL, expires_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS rate_counters (key TEXT PRIMARY KEY, count BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL);",

      "INSERT INTO ledger_schema_migrations (version) VALUES (1) ON CONFLICT (version) DO NOTHING;",
  };
  return kStatements;
}

} // namespace ledger::db::sql
