#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/core/swap_coordinator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/grpc/swap_server.hpp"
#include "internal/monitor/refund_monitor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/swap_service.hpp"
#include "internal/settlement/backend_factory.hpp"
#include "internal/util/duration.hpp"
#if ATOMICSWAP_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ATOMICSWAP_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace atomicswap::factory {

std::shared_ptr<db::Repository> BuildRepository(const atomicswap::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if ATOMICSWAP_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    ATOMICSWAP_LOG_INFO("swap store ready", {observability::StringField("backend", "sqlite"),
                                             observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ATOMICSWAP_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri());
    db::postgres::PgMigrationExecutor executor(pool);
    db::sql::RunMigrations(executor, db::sql::PostgresSchema());
    ATOMICSWAP_LOG_INFO("swap store ready", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  ATOMICSWAP_LOG_WARN("no database configured; swaps are kept in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const atomicswap::runtime::config::RuntimeConfig& config, std::shared_ptr<const util::Clock> clock) {
  Application app;

  // ------------------------------------------------------------------
  // Store and settlement backends
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config.database());
  auto backends  = settlement::BackendFactory::Build(config.backends(), clock);
  if (backends.size() < 2) {
    throw std::runtime_error("at least two settlement backends are required");
  }

  // ------------------------------------------------------------------
  // Coordinator
  // ------------------------------------------------------------------
  core::SwapPolicy policy;
  policy.initiator_timelock = util::ParseDurationOr(config.swap().initiator_timelock(), config::defaults::kInitiatorTimelock);
  policy.acceptor_timelock  = util::ParseDurationOr(config.swap().acceptor_timelock(), config::defaults::kAcceptorTimelock);

  app.coordinator = std::make_shared<core::SwapCoordinator>(std::move(backends), app.repository, clock, policy);

  // ------------------------------------------------------------------
  // Refund monitor
  // ------------------------------------------------------------------
  if (config.monitor().enabled()) {
    monitor::RefundMonitorOptions options;
    options.interval              = util::ParseDurationOr(config.monitor().interval(), config::defaults::kMonitorInterval);
    options.cancel_expired_offers = config.monitor().cancel_expired_offers();
    app.refund_monitor            = std::make_shared<monitor::RefundMonitor>(app.coordinator, clock, options);
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.coordinator = app.coordinator;
  ctx.repository  = app.repository;

  auto swap_service = std::make_shared<service::SwapService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::SwapServer>(swap_service));

  return app;
}

} // namespace atomicswap::factory
