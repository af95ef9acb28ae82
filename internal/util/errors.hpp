#pragma once

#include <stdexcept>
#include <string>

namespace ledger::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Request is well formed but collides with existing state.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InsufficientBalance : public std::runtime_error {
 public:
  explicit InsufficientBalance(const std::string& msg) : std::runtime_error(msg) {
  }
};

enum class LimitKind {
  kLoss,
  kDeposit,
  kWager,
  kDailyWithdraw,
};

class LimitExceeded : public std::runtime_error {
 public:
  LimitExceeded(LimitKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  LimitKind kind() const {
    return kind_;
  }

 private:
  LimitKind kind_;
};

enum class ExclusionKind {
  kCooldown,
  kPostCooldownWindow,
  kTemporary,
  kPermanent,
};

class SelfExclusionActive : public std::runtime_error {
 public:
  SelfExclusionActive(ExclusionKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ExclusionKind kind() const {
    return kind_;
  }

 private:
  ExclusionKind kind_;
};

// Contention on a lock outlasted all retries. Retryable.
class LockTimeout : public std::runtime_error {
 public:
  explicit LockTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LockExtensionFailed : public std::runtime_error {
 public:
  explicit LockExtensionFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RateLimited : public std::runtime_error {
 public:
  explicit RateLimited(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace ledger::util
