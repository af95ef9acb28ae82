#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/balance/balance_ledger.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/exclusion/access_guard.hpp"
#include "internal/exclusion/exclusion_manager.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/balance_server.hpp"
#include "internal/grpc/exclusion_server.hpp"
#include "internal/limits/limit_evaluator.hpp"
#include "internal/lock/lock_coordinator.hpp"
#include "internal/lock/memory_lock_store.hpp"
#include "internal/lock/repository_lock_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/policy/policy_enforcer.hpp"
#include "internal/pricing/usd_rates.hpp"
#include "internal/scheduler/expiry_scheduler.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/balance_service.hpp"
#include "internal/service/exclusion_service.hpp"
#if LEDGER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if LEDGER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace ledger::factory {

namespace {

#if LEDGER_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }
  sqlite_db->Exec("SELECT version FROM ledger_schema_migrations LIMIT 1;");
}
#endif

#if LEDGER_DB_POSTGRES
// Runs on a dedicated connection: pooled connections prepare statements
// against tables that must already exist.
void BootstrapPostgresSchema(const std::string& connection_uri) {
  pqxx::connection conn(connection_uri);
  pqxx::work       tx(conn);
  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }
  tx.exec("SELECT version FROM ledger_schema_migrations LIMIT 1;");
  tx.commit();
}
#endif

lock::LockOptions LockDefaults(const ledger::runtime::config::LockConfig& locks) {
  lock::LockOptions options;
  options.ttl_ms          = static_cast<int64_t>(locks.default_ttl_ms());
  options.retry_count     = locks.retry_count();
  options.retry_delay_ms  = static_cast<int64_t>(locks.retry_delay_ms());
  options.retry_jitter_ms = static_cast<int64_t>(locks.retry_jitter_ms());
  return options;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const ledger::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if LEDGER_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.wal_mode = database.sqlite().wal_mode();
    auto sqlite_db   = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    BootstrapSqliteSchema(sqlite_db);
    LEDGER_LOG_INFO("Database ready", {observability::StringField("backend", "sqlite"),
                                       observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if LEDGER_DB_POSTGRES
    BootstrapPostgresSchema(database.postgres().connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    LEDGER_LOG_INFO("Database ready", {observability::StringField("backend", "postgres"),
                                       observability::IntField("max_connections", database.postgres().max_connections())});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  LEDGER_LOG_WARN("No database configured, using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<lock::LockStore> BuildLockStore(const ledger::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository) {
  // An in-memory repository is process local, so its lock entries would be too.
  const bool memory_repository = !config.database().has_sqlite() && !config.database().has_postgres();
  if (config.locks().backend() == ledger::runtime::config::LOCK_BACKEND_MEMORY || memory_repository) {
    return std::make_shared<lock::MemoryLockStore>();
  }
  return std::make_shared<lock::RepositoryLockStore>(std::move(repository));
}

service::ServiceContext BuildContext(const ledger::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository) {
  auto store = BuildLockStore(config, repository);
  auto locks = std::make_shared<lock::LockCoordinator>(store, LockDefaults(config.locks()));

  auto evaluator  = std::make_shared<limits::LimitEvaluator>(repository);
  auto exclusions = std::make_shared<exclusion::ExclusionManager>(repository, locks, evaluator);

  policy::RateLimitOptions rate_limit;
  rate_limit.enabled             = config.policy().rate_limit_enabled();
  rate_limit.requests_per_window = config.policy().requests_per_window();
  rate_limit.window_ms           = static_cast<int64_t>(config.policy().window_ms());

  service::ServiceContext ctx;
  ctx.repository            = repository;
  ctx.locks                 = locks;
  ctx.exclusions            = exclusions;
  ctx.guard                 = std::make_shared<exclusion::AccessGuard>(exclusions);
  ctx.ledger                = std::make_shared<balance::BalanceLedger>(repository, locks, exclusions, evaluator, pricing::RatesFromConfig(config));
  ctx.scheduler             = std::make_shared<scheduler::ExpiryScheduler>(repository, locks, config.scheduler().leader_lock());
  ctx.policy                = std::make_shared<policy::PolicyEnforcer>(store, rate_limit);
  ctx.testing_hooks_enabled = config.admin().testing_hooks_enabled();
  return ctx;
}

Application Build(const ledger::runtime::config::RuntimeConfig& config) {
  Application app;
  app.context = BuildContext(config, BuildRepository(config));

  // ------------------------------------------------------------------
  // Services and gRPC adapters
  // ------------------------------------------------------------------
  auto balance_service   = std::make_shared<service::BalanceService>(app.context);
  auto exclusion_service = std::make_shared<service::ExclusionService>(app.context);
  auto admin_service     = std::make_shared<service::AdminService>(app.context);

  app.grpc_services.push_back(std::make_unique<grpc::BalanceServer>(balance_service));
  app.grpc_services.push_back(std::make_unique<grpc::ExclusionServer>(exclusion_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  // ------------------------------------------------------------------
  // Expiry worker
  // ------------------------------------------------------------------
  if (config.scheduler().enabled()) {
    auto worker = std::make_shared<scheduler::ExpiryWorker>(app.context.scheduler, std::chrono::milliseconds(config.scheduler().interval_ms()));
    worker->Start();
    app.background_workers.push_back(std::move(worker));
  }

  return app;
}

} // namespace ledger::factory
