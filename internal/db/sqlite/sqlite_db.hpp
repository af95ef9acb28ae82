#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace ledger::db::sqlite {

struct SqliteOptions {
  bool wal_mode        = true;
  int  busy_timeout_ms = 5000;
};

/*
  RAII owner of the process-wide sqlite3 connection.

  Transactions on it are serialized with TransactionLock(); other
  processes are kept out by BEGIN IMMEDIATE plus the busy timeout.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Runs one or more statements with no result rows (pragmas, schema).
  void Exec(const std::string& sql);

  // Caller owns the statement and must sqlite3_finalize it.
  sqlite3_stmt* Prepare(const std::string& sql);

  std::unique_lock<std::mutex> TransactionLock() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

  const std::string& Path() const {
    return path_;
  }

 private:
  void ApplyPragmas();

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace ledger::db::sqlite
