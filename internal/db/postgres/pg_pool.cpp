#include "pg_pool.hpp"

namespace ledger::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto* conn = new pqxx::connection(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn);
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_balance",
               "SELECT user_id, asset, balance, is_primary, updated_at_ms "
               "FROM balances WHERE user_id=$1 AND asset=$2");

  conn.prepare("upsert_balance",
               "INSERT INTO balances(user_id,asset,balance,is_primary,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5) "
               "ON CONFLICT(user_id,asset) DO UPDATE SET balance=EXCLUDED.balance,"
               "is_primary=EXCLUDED.is_primary,updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("get_operation",
               "SELECT operation_id,user_id,asset,kind,amount,signed_amount,previous_balance,balance_after,"
               "status,description,platform,created_at_ms FROM balance_operations WHERE operation_id=$1");

  conn.prepare("insert_operation",
               "INSERT INTO balance_operations(operation_id,user_id,asset,kind,amount,signed_amount,"
               "previous_balance,balance_after,status,description,platform,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12)");

  conn.prepare("try_acquire_lock",
               "INSERT INTO lock_entries(key,token,expires_at_ms) VALUES($1,$2,$3) "
               "ON CONFLICT(key) DO UPDATE SET token=EXCLUDED.token, expires_at_ms=EXCLUDED.expires_at_ms "
               "WHERE lock_entries.expires_at_ms <= $4");

  conn.prepare("release_lock", "DELETE FROM lock_entries WHERE key=$1 AND token=$2");

  conn.prepare("extend_lock", "UPDATE lock_entries SET expires_at_ms=$3 WHERE key=$1 AND token=$2 AND expires_at_ms > $4");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      // The server went away mid-transaction; free the slot for a fresh connection.
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace ledger::db::postgres
