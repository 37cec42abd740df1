#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/core/state_store.hpp"
#include "internal/scheduler/group_plan.hpp"

namespace jobsrv::scheduler {

struct SchedulerOptions {
  // Worker-loss requeues allowed per job before it fails.
  uint32_t retry_budget = 3;
  // Conflicting attempts tolerated per event before TransitionConflict.
  uint32_t max_transition_attempts = 16;
};

enum class ReportOutcome {
  kApplied,
  // Duplicate or stale report: job unknown, terminal, already past the
  // reported state, or held by another worker. Nothing changed.
  kIgnored,
};

std::string_view ToString(ReportOutcome outcome);

// Best-effort abort owed to a worker still holding a canceled job.
struct AbortRequest {
  std::string job_id;
  std::string worker_id;
  std::string reason;
};

struct WorkerLossOutcome {
  // false when the worker heartbeat again before it could be removed
  bool                     removed = false;
  std::vector<std::string> jobs;
};

struct CancelOutcome {
  jobsrv::v1::GroupState    state = jobsrv::v1::GROUP_STATE_UNSPECIFIED;
  bool                      already_terminal = false;
  std::vector<std::string>  canceled_jobs;
  std::vector<AbortRequest> aborts;
};

/*
  Scheduler

  Turns events into conditional transition batches and hands them to the
  StateStore. Keeps one GroupPlan per open group as a cache of the
  dependency counters and the reverse index:

  - readiness is incremental: a completion only looks at its direct
    dependents
  - cascades walk the reverse index from the failed job and land in the same
    batch as the failure
  - a refused batch reloads the plan from durable state and is recomputed,
    up to max_transition_attempts

  Lock order: scheduler group lock, then the store's group lock. Callers
  never hold a scheduler lock while talking to a worker.
*/
class Scheduler {
 public:
  Scheduler(std::shared_ptr<core::StateStore> store, SchedulerOptions options = {});

  // Invoked, outside any lock, whenever a commit made some job Ready.
  void SetReadyNotifier(std::function<void()> notifier);
  // Runs the notifier for Ready jobs committed elsewhere (a new group's roots).
  void NotifyReady();

  const SchedulerOptions& Options() const {
    return options_;
  }

  // ---------------------------------------------------------------------
  // Group lifecycle
  // ---------------------------------------------------------------------

  // Promotes every Pending job whose dependencies are Complete.
  void Activate(const std::string& group_id, uint64_t now_ms);

  // Idempotent; a terminal group is returned unchanged.
  CancelOutcome CancelGroup(const std::string& group_id, uint64_t now_ms);

  // Rebuilds plans for all open groups and promotes what is promotable.
  size_t Recover(uint64_t now_ms);

  // ---------------------------------------------------------------------
  // Worker reports
  // ---------------------------------------------------------------------

  ReportOutcome OnStarted(const std::string& job_id, const std::string& worker_id, uint64_t now_ms);
  // Progress implies Started.
  ReportOutcome OnProgress(const std::string& job_id, const std::string& worker_id, uint64_t now_ms);
  ReportOutcome OnSucceeded(const std::string& job_id, const std::string& worker_id, const std::string& artifact_ref,
                            uint64_t now_ms);
  ReportOutcome OnFailed(const std::string& job_id, const std::string& worker_id, const std::string& reason, uint64_t now_ms);
  // The worker gave the job back: requeue within budget, else fail.
  ReportOutcome OnAborted(const std::string& job_id, const std::string& worker_id, const std::string& reason, uint64_t now_ms);

  // ---------------------------------------------------------------------
  // Dispatch feedback
  // ---------------------------------------------------------------------

  // The assignment message never reached the worker: Dispatched goes back
  // to Ready without spending retry budget.
  ReportOutcome ReleaseAssignment(const std::string& job_id, const std::string& worker_id, uint64_t now_ms);

  // Requeues or fails every job the worker holds and removes the worker,
  // atomically, unless it heartbeat at or after stale_before_ms.
  WorkerLossOutcome HandleWorkerLost(const std::string& worker_id, uint64_t stale_before_ms, uint64_t now_ms);

 private:
  struct GroupEntry {
    std::mutex               mutex;
    std::optional<GroupPlan> plan;
  };

  using Planner = std::function<std::optional<core::TransitionBatch>(const db::model::JobRecord&, GroupPlan&)>;

  ReportOutcome RunJobEvent(std::string_view event, const std::string& job_id, uint64_t now_ms, const Planner& planner);

  // Release / requeue / fail decision for a job taken away from its worker.
  void PlanRelinquish(const db::model::JobRecord& job, const GroupPlan& plan, bool spend_retry, const std::string& reason,
                      core::TransitionBatch& batch) const;
  void PlanCascade(const std::string& job_id, const GroupPlan& plan, jobsrv::v1::JobState next, const std::string& reason,
                   core::TransitionBatch& batch) const;

  GroupPlan& EnsurePlan(GroupEntry& entry, const std::string& group_id);
  void       Commit(GroupEntry& entry, const std::string& group_id, const core::TransitionResult& result, bool& became_ready);

  std::shared_ptr<GroupEntry> Entry(const std::string& group_id);
  void                        DropEntry(const std::string& group_id);

  std::shared_ptr<core::StateStore> store_;
  SchedulerOptions                  options_;

  std::mutex            notifier_mutex_;
  std::function<void()> notifier_;

  std::mutex                                                   entries_mutex_;
  std::unordered_map<std::string, std::shared_ptr<GroupEntry>> entries_;
};

} // namespace jobsrv::scheduler
