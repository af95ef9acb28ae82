#pragma once

#include <string>

namespace ledger::db {

/*
  Outcome of a repository write.

  SQLite and Postgres errors are folded into these codes before they
  leave the backend. ThrowIfDbError (unit_of_work.hpp) turns them into
  the ledger's service errors:

    NotFound                              -> util::NotFound
    AlreadyExists, Conflict,
    ConstraintViolation                   -> util::Conflict (a reused
                                             operation id, a second
                                             active wager limit)
    WriteConflict                         -> TransactionConflict, so
                                             RunInTransaction replays
                                             the whole balance update
    IOError, Corruption, InternalError    -> std::runtime_error
*/
enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  ConstraintViolation,

  // SQLITE_BUSY / SQLITE_LOCKED, or a Postgres serialization failure
  // or deadlock.
  WriteConflict,

  IOError,
  Corruption,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace ledger::db
