#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/core/state_store.hpp"
#include "internal/dispatch/worker_transport.hpp"
#include "internal/scheduler/scheduler.hpp"
#include "internal/worker/worker_registry.hpp"

namespace jobsrv::dispatch {

struct Assignment {
  std::string job_id;
  std::string worker_id;
};

struct PassStats {
  size_t ready       = 0;
  size_t sent        = 0;
  size_t send_failed = 0;
  size_t superseded  = 0; // job left Ready or worker filled before recording
  size_t unmatched   = 0;
  size_t released    = 0; // undelivered assignments handed back, this pass or carried over
};

/*
  Dispatcher

  One pass:
    1. read Ready jobs (oldest group first, then ordinal) and live workers
    2. match them with Assign()
    3. per match: record Ready -> Dispatched and the worker slot, then send
       the assignment with no lock held
    4. a failed send hands the job back through the scheduler (it returns to
       Ready, retry budget untouched) and flags the worker suspect; a hand-back
       that cannot commit is kept and retried at the start of the next pass

  Recording before sending means a worker report can never find its job
  still Ready.
*/
class Dispatcher {
 public:
  Dispatcher(std::shared_ptr<core::StateStore> store, std::shared_ptr<scheduler::Scheduler> scheduler,
             std::shared_ptr<worker::WorkerRegistry> registry, std::shared_ptr<WorkerTransport> transport);

  /*
    Pure matching. A worker qualifies when its tags contain every job tag and
    its load is below capacity. Among qualifying workers the pick is:
      most spare capacity, then earliest last dispatch, then lowest id.
    Loads are simulated across the pass so no worker is overfilled. Jobs
    with no match are left out (backpressure, not an error).
  */
  static std::vector<Assignment> Assign(const std::vector<db::model::JobRecord>&    ready_jobs,
                                        const std::vector<db::model::WorkerRecord>& workers);

  PassStats RunPass(uint64_t now_ms);

  // Best effort. Returns the number of aborts the transport accepted.
  size_t SendAborts(const std::vector<scheduler::AbortRequest>& aborts);

  // Undelivered assignments still waiting to be handed back.
  size_t PendingReleases();

 private:
  // false when the store refused; the assignment is kept for the next pass
  bool Release(const Assignment& assignment, uint64_t now_ms);
  void RetryReleases(uint64_t now_ms, PassStats& stats);

  std::shared_ptr<core::StateStore>       store_;
  std::shared_ptr<scheduler::Scheduler>   scheduler_;
  std::shared_ptr<worker::WorkerRegistry> registry_;
  std::shared_ptr<WorkerTransport>        transport_;

  std::mutex              releases_mutex_;
  std::vector<Assignment> pending_releases_;
};

} // namespace jobsrv::dispatch
