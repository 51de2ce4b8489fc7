#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/conflict_resolver.hpp"
#include "internal/core/delta_manager.hpp"
#include "internal/core/mirror_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/external/simulated_external_system.hpp"
#include "internal/grpc/mirror_server.hpp"
#include "internal/grpc/sync_admin_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/retention/retention_manager.hpp"
#include "internal/service/mirror_service.hpp"
#include "internal/service/sync_admin_service.hpp"
#include "internal/sync/sync_worker.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/validation/forecast_rule_validator.hpp"
#if FORECAST_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#if FORECAST_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif
#if FORECAST_WITH_ARROW
#include "internal/archive/arrow_utils.hpp"
#include "internal/archive/filesystem_arrow_archive.hpp"
#endif

namespace forecast::factory {

using namespace forecast;
using forecast::runtime::config::RuntimeConfig;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if FORECAST_DB_SQLITE
    const auto& sqlite    = database.sqlite();
    auto        sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), util::FromProto(sqlite.busy_timeout(), std::chrono::milliseconds(5000)),
                                                                   sqlite.wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    FORECAST_LOG_INFO("Using sqlite repository", {observability::StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::ConfigurationError("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if FORECAST_DB_POSTGRES
    const auto& postgres        = database.postgres();
    const auto  max_connections = postgres.max_connections() == 0 ? 16u : postgres.max_connections();
    auto        pool            = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), max_connections);
    db::postgres::BootstrapSchema(*pool);
    FORECAST_LOG_INFO("Using postgres repository", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw util::ConfigurationError("postgres backend requested but not enabled at build time");
#endif
  }

  FORECAST_LOG_WARN("Using in-memory repository; state is lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<external::SimulatedExternalSystem> BuildExternalSystem(const RuntimeConfig& config) {
  external::SimulatedExternalSystem::Options options;
  if (config.external_system().has_simulated()) {
    const auto& simulated  = config.external_system().simulated();
    options.latency        = util::FromProto(simulated.latency(), std::chrono::milliseconds(0));
    options.reject_unknown = !simulated.accept_unknown_entities();
    options.echo_confirmed = simulated.echo_confirmed();
  }
  return std::make_shared<external::SimulatedExternalSystem>(options);
}

std::shared_ptr<archive::ArchivalBackend> BuildArchive(const RuntimeConfig& config, const std::shared_ptr<util::TimeSource>& clock) {
  const auto& archival = config.archival();
  if (!archival.enabled()) return nullptr;

#if FORECAST_WITH_ARROW
  const auto& filesystem  = archival.filesystem();
  auto        compression = archive::Unwrap(archive::ResolveCompression(filesystem.compression()));
  FORECAST_LOG_INFO("Archiving raw intake to filesystem", {observability::StringField("root_path", filesystem.root_path())});
  return std::make_shared<archive::FilesystemArrowArchive>(filesystem.root_path(), compression, clock);
#else
  (void)clock;
  throw util::ConfigurationError("archival requested but the Arrow backend is not enabled at build time");
#endif
}

sync::SyncWorkerOptions SyncOptionsFromConfig(const forecast::runtime::config::SyncConfig& sync) {
  sync::SyncWorkerOptions options;
  if (sync.batch_size() > 0) options.batch_size = sync.batch_size();
  if (sync.max_attempts() > 0) options.max_attempts = sync.max_attempts();
  if (sync.rate_limit_per_second() > 0) options.rate_limit_per_second = sync.rate_limit_per_second();
  options.backoff_base  = util::FromProto(sync.backoff_base(), options.backoff_base);
  options.call_timeout  = util::FromProto(sync.call_timeout(), options.call_timeout);
  options.cycle_timeout = util::FromProto(sync.cycle_timeout(), options.cycle_timeout);
  options.claim_timeout = util::FromProto(sync.claim_timeout(), options.claim_timeout);
  return options;
}

retention::RetentionOptions RetentionOptionsFromConfig(const RuntimeConfig& config) {
  const auto&                 retention = config.retention();
  retention::RetentionOptions options;
  if (retention.retention_days() > 0) options.retention_days = retention.retention_days();
  if (retention.batch_size() > 0) options.batch_size = retention.batch_size();
  options.archival_enabled = config.archival().enabled();
  options.dry_run          = retention.dry_run();
  options.run_timeout      = util::FromProto(retention.run_timeout(), options.run_timeout);
  return options;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  auto clock     = std::make_shared<util::SystemTimeSource>();
  auto validator = std::make_shared<validation::ForecastRuleValidator>();

  // ------------------------------------------------------------------
  // Storage and the system of record
  // ------------------------------------------------------------------
  app.repository      = BuildRepository(config);
  app.external_system = BuildExternalSystem(config);
  auto archive        = BuildArchive(config, clock);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto& ctx    = app.context;
  ctx.mirrors  = std::make_shared<core::MirrorStore>(app.repository, clock);
  ctx.deltas   = std::make_shared<core::DeltaManager>(app.repository, validator, clock);
  ctx.resolver = std::make_shared<core::ConflictResolver>(app.repository, validator, clock);

  // Promoted mirrors become the simulated system's current state.
  std::weak_ptr<external::SimulatedExternalSystem> simulated = app.external_system;
  ctx.mirrors->SetPromotionListener([simulated](const db::model::MirrorRecord& mirror) {
    if (auto sim = simulated.lock()) sim->Seed(mirror.organization_id, mirror.entity_id, mirror.document, mirror.version);
  });

  ctx.sync_worker = std::make_shared<sync::SyncWorker>(app.repository, app.external_system, clock, SyncOptionsFromConfig(config.sync()));
  ctx.retention   = std::make_shared<retention::RetentionManager>(app.repository, archive, clock, RetentionOptionsFromConfig(config));

  // ------------------------------------------------------------------
  // Background jobs
  // ------------------------------------------------------------------
  app.scheduler = std::make_shared<runtime::JobScheduler>();
  ctx.scheduler = app.scheduler;

  auto sync_worker = ctx.sync_worker;
  app.scheduler->Start(runtime::JobSpec{.name            = "sync",
                                        .interval        = util::FromProto(config.sync().interval(), std::chrono::seconds(30)),
                                        .enabled         = config.sync().enabled(),
                                        .run_immediately = false,
                                        .fn              = [sync_worker](std::stop_token stop) { sync_worker->RunCycle(stop); }});

  auto retention = ctx.retention;
  app.scheduler->Start(runtime::JobSpec{.name            = "retention",
                                        .interval        = util::FromProto(config.retention().interval(), std::chrono::hours(24)),
                                        .enabled         = config.retention().enabled(),
                                        .run_immediately = false,
                                        .fn              = [retention](std::stop_token stop) { retention->Run(stop); }});

  // ------------------------------------------------------------------
  // Services and gRPC servers
  // ------------------------------------------------------------------
  auto mirror_service     = std::make_shared<service::MirrorService>(ctx);
  auto sync_admin_service = std::make_shared<service::SyncAdminService>(ctx);

  app.grpc_services.push_back(std::make_unique<grpc::MirrorServer>(mirror_service));
  app.grpc_services.push_back(std::make_unique<grpc::SyncAdminServer>(sync_admin_service));

  return app;
}

} // namespace forecast::factory
