#include "sqlite_db.hpp"

#include <stdexcept>

namespace ledger::db::sqlite {

namespace {

[[noreturn]] void Fail(const std::string& path, const std::string& what, const char* detail) {
  throw std::runtime_error("sqlite " + what + " (" + path + "): " + (detail ? detail : "unknown error"));
}

} // namespace

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(options) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const std::string detail = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    Fail(path_, "open", detail.c_str());
  }

  try {
    ApplyPragmas();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    const std::string detail = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    Fail(path_, "exec", detail.c_str());
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    Fail(path_, "prepare", sqlite3_errmsg(db_));
  }
  return stmt;
}

void SqliteDB::ApplyPragmas() {
  // Several ledger-server processes may share one file; WAL lets their readers run beside the writer.
  Exec(options_.wal_mode ? "PRAGMA journal_mode=WAL;" : "PRAGMA journal_mode=DELETE;");
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA temp_store=MEMORY;");

  if (sqlite3_busy_timeout(db_, options_.busy_timeout_ms) != SQLITE_OK) {
    Fail(path_, "busy_timeout", sqlite3_errmsg(db_));
  }
}

} // namespace ledger::db::sqlite
