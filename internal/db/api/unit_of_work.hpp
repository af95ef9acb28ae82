#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace ledger::db {

constexpr int kDefaultCommitAttempts = 5;

/*
  Translate a repository Result into the service error types.

  ConstraintViolation and AlreadyExists both mean a unique key was
  taken, which callers treat as Conflict unless they handle it first.
  A WriteConflict is raised as TransactionConflict so the surrounding
  RunInTransaction retries it.
*/
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
    case ErrorCode::Conflict:
      throw util::Conflict(message);
    case ErrorCode::WriteConflict:
      throw TransactionConflict(message);
    default:
      throw std::runtime_error(message);
  }
}

/*
  Runs fn(tx) in a fresh transaction and commits it. When the commit
  loses to a concurrent writer the whole unit is re-run, up to
  attempts times. fn must not have side effects outside tx.
*/
template <typename Fn>
auto RunInTransaction(Repository& repo, Fn&& fn, int attempts = kDefaultCommitAttempts) {
  using R = std::invoke_result_t<Fn&, Transaction&>;

  for (int attempt = 1;; ++attempt) {
    auto tx = repo.Begin();
    try {
      if constexpr (std::is_void_v<R>) {
        fn(*tx);
        tx->Commit();
        return;
      } else {
        R out = fn(*tx);
        tx->Commit();
        return out;
      }
    } catch (const TransactionConflict&) {
      if (attempt >= attempts) {
        throw;
      }
    }
  }
}

} // namespace ledger::db
