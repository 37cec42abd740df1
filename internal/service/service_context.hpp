#pragma once

#include <memory>

namespace jobsrv::core { class StateStore; }
namespace jobsrv::scheduler { class Scheduler; }
namespace jobsrv::worker { class WorkerRegistry; }
namespace jobsrv::dispatch { class Dispatcher; }
namespace jobsrv::ingest { class StatusIngestor; }

namespace jobsrv::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<jobsrv::core::StateStore> store;
  std::shared_ptr<jobsrv::scheduler::Scheduler> scheduler;
  std::shared_ptr<jobsrv::worker::WorkerRegistry> registry;
  std::shared_ptr<jobsrv::dispatch::Dispatcher> dispatcher;
  std::shared_ptr<jobsrv::ingest::StatusIngestor> ingestor;
};

}
