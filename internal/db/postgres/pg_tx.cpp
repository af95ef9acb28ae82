#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace ledger::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()), tx_(std::make_unique<SnapshotWork>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    // The connection goes back to the pool either way.
    LEDGER_LOG_WARN("Postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    finished_ = true;
    throw TransactionConflict(e.what());
  } catch (const pqxx::deadlock_detected& e) {
    finished_ = true;
    throw TransactionConflict(e.what());
  }
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
