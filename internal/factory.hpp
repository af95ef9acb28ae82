#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/lock/lock_store.hpp"
#include "internal/scheduler/expiry_worker.hpp"
#include "internal/service/service_context.hpp"

namespace ledger::factory {

/*
  Application

  Owns all long-lived objects used by the server. Everything here
  lives for the lifetime of the process.
*/
struct Application {
  service::ServiceContext                               context;
  std::vector<std::unique_ptr<::grpc::Service>>         grpc_services;
  std::vector<std::shared_ptr<scheduler::ExpiryWorker>> background_workers;
};

/*
  Composition root. The only place allowed to know concrete DB and
  lock store types.
*/

// Opens the configured backend and bootstraps its schema. No database
// section selects the in-memory repository.
std::shared_ptr<db::Repository> BuildRepository(const ledger::runtime::config::RuntimeConfig& config);

std::shared_ptr<lock::LockStore> BuildLockStore(const ledger::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository);

// Domain components wired over an existing repository.
service::ServiceContext BuildContext(const ledger::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository);

// Full graph: repository, services, gRPC adapters and the expiry
// worker (started when scheduler.enabled).
Application Build(const ledger::runtime::config::RuntimeConfig& config);

} // namespace ledger::factory
