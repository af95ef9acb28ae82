#include "sqlite_tx.hpp"

#include <stdexcept>

namespace ledger::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)), guard_(db_->TransactionLock()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception&) {
      // connection already rolled back (e.g. after a failed COMMIT)
    }
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const std::runtime_error& e) {
    if (sqlite3_get_autocommit(db_->Handle()) == 0) {
      // still inside the transaction: the commit was refused, not applied
      throw TransactionConflict(e.what());
    }
    throw;
  }
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
}

}
