#pragma once

#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace ledger::db::postgres {

/*
  One ledger unit of work on a pooled connection.

  Runs at REPEATABLE READ so a balance update reads the wallet, its
  operation id and the day's stats from one snapshot. Two processes
  writing the same wallet make the later one fail with a serialization
  error; Commit() and the repository writes report it as
  TransactionConflict / ErrorCode::WriteConflict and RunInTransaction
  replays the unit.

  Destroying an unfinished transaction aborts it and hands the
  connection back to the pool.
*/
class PgTransaction final : public db::Transaction {
public:
  using SnapshotWork = pqxx::transaction<pqxx::isolation_level::repeatable_read>;

  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  SnapshotWork& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<SnapshotWork> tx_;
  bool committed_ = false;
  bool finished_ = false;
};

}
