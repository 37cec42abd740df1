#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "jobsrv/v1.hpp"

namespace jobsrv::core {

enum class TransitionStatus {
  kApplied,
  // A job was not in an expected state (or held by another worker). Nothing
  // was written; recompute from fresh state and retry.
  kConflict,
  // The request can never succeed as written (illegal transition, unknown
  // job or worker, worker at capacity, dependencies not complete).
  kRejected,
};

std::string_view ToString(TransitionStatus status);

/*
  One conditional job update.

  Applied only if the job's current state is in expected (any state when
  empty) and, when expected_worker is set, the job is held by that worker.
  Side fields follow from next:
    Pending   worker cleared, retry_count+1 when count_retry
    Running   started_at stamped
    terminal  completed_at stamped, reason / artifact_ref recorded
  A job leaving Dispatched/Running releases its worker slot.
*/
struct JobTransition {
  std::string                       job_id;
  std::vector<jobsrv::v1::JobState> expected;
  std::string                       expected_worker;
  jobsrv::v1::JobState              next = jobsrv::v1::JOB_STATE_UNSPECIFIED;
  bool                              count_retry = false;
  std::string                       reason;
  std::string                       artifact_ref;
};

// All transitions of one group, applied in order as one unit.
struct TransitionBatch {
  std::string                group_id;
  std::vector<JobTransition> transitions;
  bool                       request_cancel = false;
};

struct TransitionResult {
  TransitionStatus status = TransitionStatus::kApplied;
  std::string      detail;

  // Rows as committed, in transition order. Empty unless applied.
  std::vector<db::model::JobRecord> jobs;
  // State each row had before its transition, parallel to jobs.
  std::vector<jobsrv::v1::JobState> prior_states;
  // Group rows re-derived by the commit.
  std::vector<db::model::GroupRecord> groups;
};

/*
  StateStore

  The only writer of durable scheduling state. Every mutation is a single
  all-or-nothing transaction:

  - transitions of one group are serialized by a per-group mutex; groups
    proceed in parallel
  - the group row is re-derived from member jobs inside the same commit
    whenever a job goes terminal or cancellation is requested
  - worker load changes commit together with the job rows that cause them
  - backend serialization failures (CommitConflict, busy, serialization
    errors) are retried here from a fresh transaction; only logical
    mismatches reach the caller as kConflict
  - backend unavailability propagates as an exception
*/
class StateStore {
 public:
  explicit StateStore(std::shared_ptr<db::Repository> repository, uint32_t max_commit_attempts = 8);

  // ---------------------------------------------------------------------
  // Submission
  // ---------------------------------------------------------------------

  // Jobs must be listed dependencies first. Each starts Pending, or Ready
  // when it has no dependencies, so a committed group needs no follow-up
  // write before it can be dispatched.
  void CreateGroup(const db::model::GroupRecord& group, const std::vector<db::model::JobRecord>& jobs);

  // ---------------------------------------------------------------------
  // Transitions
  // ---------------------------------------------------------------------

  TransitionResult ApplyTransitions(const TransitionBatch& batch, uint64_t now_ms);

  // Ready -> Dispatched on worker_id and worker load +1, atomically.
  // kConflict when the job left Ready, kRejected when the worker is unknown
  // or has no free slot.
  TransitionStatus RecordAssignment(const std::string& job_id, const std::string& worker_id, uint64_t now_ms);

  // Applies batches covering every job the worker holds and deletes the
  // worker row in one commit. kConflict if the worker holds a job the
  // batches do not move, kRejected if its last heartbeat is at or after
  // stale_before_ms.
  TransitionResult RemoveWorker(const std::string& worker_id, const std::vector<TransitionBatch>& batches, uint64_t stale_before_ms,
                                uint64_t now_ms);

  // ---------------------------------------------------------------------
  // Workers
  // ---------------------------------------------------------------------

  void UpsertWorker(const db::model::WorkerRecord& worker);
  // false for an unknown worker
  bool SetWorkerSuspect(const std::string& worker_id, bool suspect);

  std::optional<db::model::WorkerRecord> GetWorker(const std::string& worker_id);
  std::vector<db::model::WorkerRecord>   ListWorkers();

  // ---------------------------------------------------------------------
  // Reads
  // ---------------------------------------------------------------------

  std::optional<db::model::GroupRecord> GetGroup(const std::string& group_id);
  std::vector<db::model::GroupRecord>   ListOpenGroups();

  std::optional<db::model::JobRecord> GetJob(const std::string& job_id);
  // Unknown ids are skipped.
  std::vector<db::model::JobRecord> GetJobs(const std::vector<std::string>& job_ids);
  std::vector<db::model::JobRecord> ListGroupJobs(const std::string& group_id);
  std::vector<db::model::JobRecord> ListReadyJobs();
  std::vector<db::model::JobRecord> ListWorkerJobs(const std::string& worker_id);

 private:
  // Runs fn in a fresh transaction, re-running it while the backend reports
  // a serialization failure. fn commits when it wants its writes kept.
  template <typename Fn>
  auto WithTransaction(std::string_view what, Fn&& fn);

  TransitionResult               ApplyBatch(db::Transaction& tx, const TransitionBatch& batch, uint64_t now_ms);
  std::optional<db::model::GroupRecord> RederiveGroup(db::Transaction& tx, const std::string& group_id, bool request_cancel,
                                                      uint64_t now_ms);

  std::shared_ptr<std::mutex> GroupMutex(const std::string& group_id);
  void                        ForgetGroup(const std::string& group_id);

  std::shared_ptr<db::Repository> repository_;
  uint32_t                        max_commit_attempts_;

  mutable std::mutex                                           group_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> group_mutexes_;
};

} // namespace jobsrv::core
