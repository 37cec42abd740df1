#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/state_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/dispatch/dispatch_worker.hpp"
#include "internal/dispatch/dispatcher.hpp"
#include "internal/ingest/status_ingestor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scheduler/scheduler.hpp"
#include "internal/service/job_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#include "internal/worker/liveness_sweeper.hpp"
#include "internal/worker/worker_registry.hpp"
#if JOBSRV_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if JOBSRV_DB_POSTGRES
#include <pqxx/pqxx>
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif
#ifdef JOBSRV_WITH_GRPC
#include "internal/grpc/grpc_worker_transport.hpp"
#include "internal/grpc/job_server.hpp"
#endif

namespace jobsrv::factory {

using namespace jobsrv;

namespace {

#if JOBSRV_DB_POSTGRES
// Runs on its own connection: pooled connections prepare statements against
// these tables as soon as they open.
void BootstrapPostgresSchema(const std::string& connection_uri) {
  pqxx::connection conn(connection_uri);
  pqxx::work       tx(conn);
  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const jobsrv::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if JOBSRV_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->ApplySchema(db::sql::SqliteSchema());
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if JOBSRV_DB_POSTGRES
    BootstrapPostgresSchema(database.postgres().connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const jobsrv::runtime::config::RuntimeConfig& config, std::shared_ptr<dispatch::WorkerTransport> transport) {
  if (!transport) {
    throw std::invalid_argument("Build: worker transport is required");
  }

  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.store      = std::make_shared<core::StateStore>(app.repository);

  // ------------------------------------------------------------------
  // Scheduling
  // ------------------------------------------------------------------
  scheduler::SchedulerOptions options;
  options.retry_budget            = config.scheduler().retry_budget();
  options.max_transition_attempts = config.scheduler().max_transition_attempts();

  app.scheduler = std::make_shared<scheduler::Scheduler>(app.store, options);
  app.registry  = std::make_shared<worker::WorkerRegistry>(app.store, config.workers().heartbeat_timeout_ms());
  app.registry->SetLostHandler([scheduler = app.scheduler](const std::string& worker_id, uint64_t stale_before_ms, uint64_t now_ms) {
    return scheduler->HandleWorkerLost(worker_id, stale_before_ms, now_ms).removed;
  });

  app.dispatcher = std::make_shared<dispatch::Dispatcher>(app.store, app.scheduler, app.registry, std::move(transport));
  app.dispatch_worker =
      std::make_shared<dispatch::DispatchWorker>(app.dispatcher, std::chrono::milliseconds(config.dispatch().interval_ms()));
  app.scheduler->SetReadyNotifier([worker = std::weak_ptr<dispatch::DispatchWorker>(app.dispatch_worker)] {
    if (auto w = worker.lock()) w->Notify();
  });

  app.sweeper = std::make_shared<worker::LivenessSweeper>(app.registry, std::chrono::milliseconds(config.workers().sweep_interval_ms()));
  app.ingestor = std::make_shared<ingest::StatusIngestor>(app.scheduler, app.registry, config.ingest().shards());

  // ------------------------------------------------------------------
  // Recovery
  // ------------------------------------------------------------------
  const auto now_ms = util::NowMillis();
  app.registry->Hydrate(now_ms);
  app.scheduler->Recover(now_ms);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store      = app.store;
  ctx.scheduler  = app.scheduler;
  ctx.registry   = app.registry;
  ctx.dispatcher = app.dispatcher;
  ctx.ingestor   = app.ingestor;

  app.job_service = std::make_shared<service::JobService>(ctx);

  JOBSRV_LOG_INFO("runtime built", {observability::IntField("retry_budget", options.retry_budget),
                                    observability::IntField("ingest_shards", config.ingest().shards())});
  return app;
}

#ifdef JOBSRV_WITH_GRPC
Application Build(const jobsrv::runtime::config::RuntimeConfig& config) {
  auto transport = std::make_shared<grpc::GrpcWorkerTransport>(std::chrono::milliseconds(config.dispatch().send_timeout_ms()));
  auto app       = Build(config, std::move(transport));

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::JobServer>(app.job_service));
  return app;
}
#endif

void Application::Start() {
  ingestor->Start();
  dispatch_worker->Start();
  sweeper->Start();
}

void Application::Stop() {
  sweeper->Stop();
  dispatch_worker->Stop();
  ingestor->Stop();
}

} // namespace jobsrv::factory
