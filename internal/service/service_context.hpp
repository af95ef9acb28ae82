#pragma once

#include <memory>

namespace ledger::db {
class Repository;
}
namespace ledger::lock {
class LockCoordinator;
}
namespace ledger::balance {
class BalanceLedger;
}
namespace ledger::exclusion {
class ExclusionManager;
class AccessGuard;
}
namespace ledger::scheduler {
class ExpiryScheduler;
}
namespace ledger::policy {
class PolicyEnforcer;
}

namespace ledger::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<ledger::db::Repository>              repository;
  std::shared_ptr<ledger::lock::LockCoordinator>       locks;
  std::shared_ptr<ledger::balance::BalanceLedger>      ledger;
  std::shared_ptr<ledger::exclusion::ExclusionManager> exclusions;
  std::shared_ptr<ledger::exclusion::AccessGuard>      guard;
  std::shared_ptr<ledger::scheduler::ExpiryScheduler>  scheduler;
  std::shared_ptr<ledger::policy::PolicyEnforcer>      policy;

  bool testing_hooks_enabled = false;
};

} // namespace ledger::service
