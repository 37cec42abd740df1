#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/dispatch/worker_transport.hpp"

#ifdef JOBSRV_WITH_GRPC
#include <grpcpp/impl/service_type.h>
#endif

namespace jobsrv::core { class StateStore; }
namespace jobsrv::scheduler { class Scheduler; }
namespace jobsrv::worker { class WorkerRegistry; class LivenessSweeper; }
namespace jobsrv::dispatch { class Dispatcher; class DispatchWorker; }
namespace jobsrv::ingest { class StatusIngestor; }
namespace jobsrv::service { class JobService; }

namespace jobsrv::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<core::StateStore>       store;
  std::shared_ptr<scheduler::Scheduler>   scheduler;
  std::shared_ptr<worker::WorkerRegistry> registry;
  std::shared_ptr<dispatch::Dispatcher>   dispatcher;
  std::shared_ptr<ingest::StatusIngestor> ingestor;

  std::shared_ptr<dispatch::DispatchWorker> dispatch_worker;
  std::shared_ptr<worker::LivenessSweeper>  sweeper;

  std::shared_ptr<service::JobService> job_service;

#ifdef JOBSRV_WITH_GRPC
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
#endif

  // Background loops: ingest consumers, dispatch, liveness sweep.
  void Start();
  void Stop();
};

/*
  Build

  Constructs the entire backend from runtime config and recovers durable
  state (worker hydration, readiness of open groups). Background loops are
  not started.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const jobsrv::runtime::config::RuntimeConfig& config, std::shared_ptr<dispatch::WorkerTransport> transport);

#ifdef JOBSRV_WITH_GRPC
// Workers reached over gRPC; JobServer registered in grpc_services.
Application Build(const jobsrv::runtime::config::RuntimeConfig& config);
#endif

std::shared_ptr<db::Repository> BuildRepository(const jobsrv::runtime::config::RuntimeConfig& config);

} // namespace jobsrv::factory
