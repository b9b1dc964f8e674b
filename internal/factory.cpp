#include "factory.hpp"

#include <chrono>
#include <memory>
#include <shared_mutex>
#include <stdexcept>
#include <string>

#include "internal/broadcast/broadcast_hub.hpp"
#include "internal/core/job_store.hpp"
#include "internal/core/verification_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/line_server.hpp"
#include "internal/hardware/signal_device.hpp"
#include "internal/lock/line_lock_guard.hpp"
#include "internal/observability/logging.hpp"
#if LINECHECK_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#if LINECHECK_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace linecheck::factory {

using namespace linecheck;
using observability::StringField;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const linecheck::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if LINECHECK_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.wal_mode         = database.sqlite().has_wal_mode() ? database.sqlite().wal_mode() : true;
    options.synchronous_full = database.sqlite().synchronous() != "normal";

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    db::sqlite::BootstrapSchema(*sqlite_db);
    LINECHECK_LOG_INFO("repository ready", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if LINECHECK_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 4u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::postgres::BootstrapSchema(*pool);
    LINECHECK_LOG_INFO("repository ready", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  LINECHECK_LOG_WARN("repository ready", {StringField("backend", "memory"), StringField("note", "state is lost on restart")});
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

Application Build(const linecheck::runtime::config::RuntimeConfig& config, std::shared_ptr<util::TimeSource> clock) {
  Application app;
  if (!clock) {
    clock = std::make_shared<util::SystemTimeSource>();
  }

  // ------------------------------------------------------------------
  // Persistence and domain
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  const auto& line = config.line();
  auto        jobs = std::make_shared<core::JobStore>(app.repository, clock, line.recent_scan_window());
  jobs->Hydrate();

  auto device = hardware::MakeSignalDevice(config.hardware().mode());

  lock::LockSettings lock_settings;
  lock_settings.supervisor_pin = line.supervisor_pin();
  lock_settings.max_attempts   = line.max_pin_attempts();
  lock_settings.lockout        = std::chrono::seconds(line.pin_lockout_seconds());
  auto guard                   = std::make_shared<lock::LineLockGuard>(lock_settings, clock, device);

  auto engine = std::make_shared<core::VerificationEngine>(jobs, guard, device);
  auto hub    = std::make_shared<broadcast::BroadcastHub>(config.broadcast().subscriber_queue_capacity(), clock);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  auto& ctx      = app.context;
  ctx.jobs       = jobs;
  ctx.engine     = engine;
  ctx.guard      = guard;
  ctx.hub        = hub;
  ctx.device     = device;
  ctx.clock      = clock;
  ctx.line_mutex = std::make_shared<std::shared_mutex>();

  ctx.settings.line_name         = line.name();
  ctx.settings.report_first_hour = line.report_first_hour();
  ctx.settings.report_last_hour  = line.report_last_hour();

  app.line_service  = std::make_shared<service::LineService>(ctx);
  app.admin_service = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::LineServer>(app.line_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(app.admin_service, config.admin().token()));

  if (config.admin().token().empty()) {
    LINECHECK_LOG_WARN("admin token not configured; ImportState is disabled");
  }
  return app;
}

} // namespace linecheck::factory
