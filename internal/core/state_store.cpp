#include "state_store.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace jobsrv::core {

using db::ErrorCode;
using db::model::GroupRecord;
using db::model::JobRecord;
using db::model::WorkerRecord;
using jobsrv::v1::JobState;

namespace {

// The backend asked for the whole transaction to be re-run.
class RetryTransaction : public std::runtime_error {
 public:
  explicit RetryTransaction(const std::string& msg) : std::runtime_error(msg) {
  }
};

void ThrowIfDbError(const db::Result& result, std::string_view context) {
  if (result) {
    return;
  }

  const std::string message = std::string(context) + ": " + result.message;
  if (result.IsRetryable()) {
    throw RetryTransaction(message);
  }

  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::Conflict:
      // row moved under a weaker isolation level; re-read and revalidate
      throw RetryTransaction(message);
    default:
      throw std::runtime_error(message);
  }
}

TransitionResult Refuse(TransitionStatus status, std::string detail) {
  TransitionResult out;
  out.status = status;
  out.detail = std::move(detail);
  return out;
}

} // namespace

std::string_view ToString(TransitionStatus status) {
  switch (status) {
    case TransitionStatus::kApplied:
      return "applied";
    case TransitionStatus::kConflict:
      return "conflict";
    case TransitionStatus::kRejected:
      return "rejected";
  }
  return "unknown";
}

StateStore::StateStore(std::shared_ptr<db::Repository> repository, uint32_t max_commit_attempts)
    : repository_(std::move(repository)), max_commit_attempts_(std::max<uint32_t>(1, max_commit_attempts)) {
  if (!repository_) {
    throw std::invalid_argument("StateStore: repository is required");
  }
}

template <typename Fn>
auto StateStore::WithTransaction(std::string_view what, Fn&& fn) {
  for (uint32_t attempt = 1;; ++attempt) {
    std::string reason;
    try {
      auto tx = repository_->Begin();
      return fn(*tx);
    } catch (const db::CommitConflict& e) {
      reason = e.what();
    } catch (const RetryTransaction& e) {
      reason = e.what();
    }

    if (attempt >= max_commit_attempts_) {
      throw util::TransitionConflict(std::string(what) + ": gave up after " + std::to_string(attempt) + " attempts: " + reason);
    }
    JOBSRV_LOG_DEBUG("retrying transaction", {observability::StringField("op", what), observability::IntField("attempt", attempt),
                                              observability::StringField("reason", reason)});
  }
}

// -----------------------------------------------------------------------------
// Submission
// -----------------------------------------------------------------------------

void StateStore::CreateGroup(const GroupRecord& group, const std::vector<JobRecord>& jobs) {
  observability::SpanScope span("StateStore::CreateGroup");
  span.SetAttribute("group.id", group.id);
  span.SetAttribute("group.jobs", static_cast<std::int64_t>(jobs.size()));

  for (const auto& job : jobs) {
    const bool ready_root = job.state == jobsrv::v1::JOB_STATE_READY && job.dependencies.empty();
    if (job.state != jobsrv::v1::JOB_STATE_PENDING && !ready_root) {
      throw std::invalid_argument("CreateGroup: job " + job.id + " cannot start " + std::string(model::ShortName(job.state)));
    }
  }

  WithTransaction("create group", [&](db::Transaction& tx) {
    ThrowIfDbError(repository_->InsertGroup(tx, group), "insert group");
    for (const auto& job : jobs) {
      ThrowIfDbError(repository_->InsertJob(tx, job), "insert job");
    }
    tx.Commit();
    return true;
  });

  for (const auto& job : jobs) {
    observability::Metrics::Instance().RecordJobTransition(model::ShortName(job.state));
  }
}

// -----------------------------------------------------------------------------
// Transitions
// -----------------------------------------------------------------------------

TransitionResult StateStore::ApplyBatch(db::Transaction& tx, const TransitionBatch& batch, uint64_t now_ms) {
  TransitionResult out;
  bool             rederive = batch.request_cancel;

  for (const auto& t : batch.transitions) {
    auto job = repository_->GetJob(tx, t.job_id);
    if (!job || job->group_id != batch.group_id) {
      return Refuse(TransitionStatus::kRejected, "job " + t.job_id + " not in group " + batch.group_id);
    }

    if (!t.expected.empty() && std::find(t.expected.begin(), t.expected.end(), job->state) == t.expected.end()) {
      return Refuse(TransitionStatus::kConflict, "job " + job->id + " is " + std::string(model::ShortName(job->state)));
    }
    if (!t.expected_worker.empty() && job->worker_id != t.expected_worker) {
      return Refuse(TransitionStatus::kConflict, "job " + job->id + " is not held by " + t.expected_worker);
    }

    // Dispatched carries a slot acquisition and only comes from RecordAssignment.
    if (t.next == jobsrv::v1::JOB_STATE_DISPATCHED || !model::CanTransition(job->state, t.next)) {
      return Refuse(TransitionStatus::kRejected, "job " + job->id + ": illegal transition " + std::string(model::ShortName(job->state)) +
                                                     " -> " + std::string(model::ShortName(t.next)));
    }

    if (t.next == jobsrv::v1::JOB_STATE_READY) {
      for (const auto& dep_id : job->dependencies) {
        auto dep = repository_->GetJob(tx, dep_id);
        if (!dep || dep->state != jobsrv::v1::JOB_STATE_COMPLETE) {
          return Refuse(TransitionStatus::kRejected, "job " + job->id + ": dependency " + dep_id + " not complete");
        }
      }
    }

    const JobState    prev             = job->state;
    const uint64_t    expected_version = job->version;
    const std::string holder           = job->worker_id;

    job->state = t.next;
    ++job->version;

    if (t.next == jobsrv::v1::JOB_STATE_PENDING) {
      job->worker_id.clear();
      job->dispatched_at_ms = 0;
      job->started_at_ms    = 0;
      if (t.count_retry) {
        ++job->retry_count;
      }
    } else if (t.next == jobsrv::v1::JOB_STATE_RUNNING) {
      if (job->started_at_ms == 0) {
        job->started_at_ms = now_ms;
      }
    } else if (model::IsTerminal(t.next)) {
      job->completed_at_ms = now_ms;
      if (!t.reason.empty()) {
        job->failure_reason = t.reason;
      }
      if (!t.artifact_ref.empty()) {
        job->artifact_ref = t.artifact_ref;
      }
      rederive = true;
    }

    ThrowIfDbError(repository_->UpdateJob(tx, *job, expected_version), "update job " + job->id);

    if (model::IsAssigned(prev) && !model::IsAssigned(t.next) && !holder.empty()) {
      ThrowIfDbError(repository_->ReleaseWorkerSlot(tx, holder), "release slot on " + holder);
    }

    out.jobs.push_back(std::move(*job));
    out.prior_states.push_back(prev);
  }

  if (rederive) {
    if (auto group = RederiveGroup(tx, batch.group_id, batch.request_cancel, now_ms)) {
      out.groups.push_back(std::move(*group));
    }
  }
  return out;
}

std::optional<GroupRecord> StateStore::RederiveGroup(db::Transaction& tx, const std::string& group_id, bool request_cancel,
                                                     uint64_t now_ms) {
  auto group = repository_->GetGroup(tx, group_id);
  if (!group) {
    throw util::NotFound("group not found: " + group_id);
  }
  // a finished group keeps its outcome
  if (model::IsTerminal(group->state)) {
    return group;
  }

  model::GroupStateAccumulator acc;
  for (const auto& job : repository_->ListGroupJobs(tx, group_id)) {
    acc.Add(job.state);
  }

  const bool cancel = group->cancel_requested || request_cancel;
  const auto next   = acc.Derive(cancel);
  if (next == group->state && cancel == group->cancel_requested) {
    return group;
  }

  const uint64_t expected_version = group->version;
  group->state                    = next;
  group->cancel_requested         = cancel;
  if (model::IsTerminal(next)) {
    group->completed_at_ms = now_ms;
  }
  ++group->version;

  ThrowIfDbError(repository_->UpdateGroup(tx, *group, expected_version), "update group " + group_id);
  return group;
}

TransitionResult StateStore::ApplyTransitions(const TransitionBatch& batch, uint64_t now_ms) {
  auto                        mutex = GroupMutex(batch.group_id);
  std::lock_guard<std::mutex> lock(*mutex);

  auto result = WithTransaction("apply transitions", [&](db::Transaction& tx) {
    auto out = ApplyBatch(tx, batch, now_ms);
    if (out.status == TransitionStatus::kApplied) {
      tx.Commit();
    }
    return out;
  });

  if (result.status != TransitionStatus::kApplied) {
    JOBSRV_LOG_DEBUG("transition batch not applied", {observability::StringField("group_id", batch.group_id),
                                                      observability::StringField("status", ToString(result.status)),
                                                      observability::StringField("detail", result.detail)});
    return result;
  }

  for (const auto& job : result.jobs) {
    observability::Metrics::Instance().RecordJobTransition(model::ShortName(job.state));
  }
  for (const auto& group : result.groups) {
    if (model::IsTerminal(group.state)) {
      ForgetGroup(group.id);
    }
  }
  return result;
}

TransitionStatus StateStore::RecordAssignment(const std::string& job_id, const std::string& worker_id, uint64_t now_ms) {
  auto job = GetJob(job_id);
  if (!job) {
    return TransitionStatus::kRejected;
  }

  auto                        mutex = GroupMutex(job->group_id);
  std::lock_guard<std::mutex> lock(*mutex);

  const auto status = WithTransaction("record assignment", [&](db::Transaction& tx) {
    auto current = repository_->GetJob(tx, job_id);
    if (!current) {
      return TransitionStatus::kRejected;
    }
    if (current->state != jobsrv::v1::JOB_STATE_READY) {
      return TransitionStatus::kConflict;
    }

    const auto acquired = repository_->AcquireWorkerSlot(tx, worker_id, now_ms);
    if (acquired.code == ErrorCode::NotFound || acquired.code == ErrorCode::Exhausted) {
      return TransitionStatus::kRejected;
    }
    ThrowIfDbError(acquired, "acquire slot on " + worker_id);

    const uint64_t expected_version = current->version;
    current->state                  = jobsrv::v1::JOB_STATE_DISPATCHED;
    current->worker_id              = worker_id;
    current->dispatched_at_ms       = now_ms;
    ++current->version;
    ThrowIfDbError(repository_->UpdateJob(tx, *current, expected_version), "update job " + job_id);

    tx.Commit();
    return TransitionStatus::kApplied;
  });

  if (status == TransitionStatus::kApplied) {
    observability::Metrics::Instance().RecordJobTransition(model::ShortName(jobsrv::v1::JOB_STATE_DISPATCHED));
  }
  return status;
}

TransitionResult StateStore::RemoveWorker(const std::string& worker_id, const std::vector<TransitionBatch>& batches,
                                          uint64_t stale_before_ms, uint64_t now_ms) {
  std::vector<std::string> group_ids;
  for (const auto& batch : batches) {
    group_ids.push_back(batch.group_id);
  }
  std::sort(group_ids.begin(), group_ids.end());
  group_ids.erase(std::unique(group_ids.begin(), group_ids.end()), group_ids.end());

  // sorted acquisition; no two callers can wait on each other
  std::vector<std::shared_ptr<std::mutex>>  mutexes;
  std::vector<std::unique_lock<std::mutex>> locks;
  for (const auto& id : group_ids) {
    mutexes.push_back(GroupMutex(id));
    locks.emplace_back(*mutexes.back());
  }

  std::set<std::string> moved;
  for (const auto& batch : batches) {
    for (const auto& t : batch.transitions) {
      moved.insert(t.job_id);
    }
  }

  auto result = WithTransaction("remove worker", [&](db::Transaction& tx) {
    const auto row = repository_->GetWorker(tx, worker_id);
    if (row && row->last_heartbeat_ms >= stale_before_ms) {
      return Refuse(TransitionStatus::kRejected, "worker " + worker_id + " heartbeat at " + std::to_string(row->last_heartbeat_ms));
    }

    for (const auto& held : repository_->ListWorkerJobs(tx, worker_id)) {
      if (moved.count(held.id) == 0) {
        return Refuse(TransitionStatus::kConflict, "worker " + worker_id + " holds job " + held.id);
      }
    }

    TransitionResult out;
    for (const auto& batch : batches) {
      auto part = ApplyBatch(tx, batch, now_ms);
      if (part.status != TransitionStatus::kApplied) {
        return part;
      }
      std::move(part.jobs.begin(), part.jobs.end(), std::back_inserter(out.jobs));
      std::move(part.groups.begin(), part.groups.end(), std::back_inserter(out.groups));
      out.prior_states.insert(out.prior_states.end(), part.prior_states.begin(), part.prior_states.end());
    }

    const auto deleted = repository_->DeleteWorker(tx, worker_id);
    if (!deleted && deleted.code != ErrorCode::NotFound) {
      ThrowIfDbError(deleted, "delete worker " + worker_id);
    }

    tx.Commit();
    return out;
  });

  if (result.status == TransitionStatus::kApplied) {
    for (const auto& job : result.jobs) {
      observability::Metrics::Instance().RecordJobTransition(model::ShortName(job.state));
    }
    for (const auto& group : result.groups) {
      if (model::IsTerminal(group.state)) {
        ForgetGroup(group.id);
      }
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// Workers
// -----------------------------------------------------------------------------

void StateStore::UpsertWorker(const WorkerRecord& worker) {
  WithTransaction("upsert worker", [&](db::Transaction& tx) {
    ThrowIfDbError(repository_->UpsertWorker(tx, worker), "upsert worker " + worker.id);
    tx.Commit();
    return true;
  });
}

bool StateStore::SetWorkerSuspect(const std::string& worker_id, bool suspect) {
  return WithTransaction("set worker suspect", [&](db::Transaction& tx) {
    const auto r = repository_->SetWorkerSuspect(tx, worker_id, suspect);
    if (r.code == ErrorCode::NotFound) {
      return false;
    }
    ThrowIfDbError(r, "set suspect on " + worker_id);
    tx.Commit();
    return true;
  });
}

std::optional<WorkerRecord> StateStore::GetWorker(const std::string& worker_id) {
  return WithTransaction("get worker", [&](db::Transaction& tx) {
    auto worker = repository_->GetWorker(tx, worker_id);
    tx.Commit();
    return worker;
  });
}

std::vector<WorkerRecord> StateStore::ListWorkers() {
  return WithTransaction("list workers", [&](db::Transaction& tx) {
    auto workers = repository_->ListWorkers(tx);
    tx.Commit();
    return workers;
  });
}

// -----------------------------------------------------------------------------
// Reads
// -----------------------------------------------------------------------------

std::optional<GroupRecord> StateStore::GetGroup(const std::string& group_id) {
  return WithTransaction("get group", [&](db::Transaction& tx) {
    auto group = repository_->GetGroup(tx, group_id);
    tx.Commit();
    return group;
  });
}

std::vector<GroupRecord> StateStore::ListOpenGroups() {
  return WithTransaction("list open groups", [&](db::Transaction& tx) {
    auto groups = repository_->ListOpenGroups(tx);
    tx.Commit();
    return groups;
  });
}

std::optional<JobRecord> StateStore::GetJob(const std::string& job_id) {
  return WithTransaction("get job", [&](db::Transaction& tx) {
    auto job = repository_->GetJob(tx, job_id);
    tx.Commit();
    return job;
  });
}

std::vector<JobRecord> StateStore::GetJobs(const std::vector<std::string>& job_ids) {
  return WithTransaction("get jobs", [&](db::Transaction& tx) {
    std::vector<JobRecord> jobs;
    jobs.reserve(job_ids.size());
    for (const auto& id : job_ids) {
      if (auto job = repository_->GetJob(tx, id)) {
        jobs.push_back(std::move(*job));
      }
    }
    tx.Commit();
    return jobs;
  });
}

std::vector<JobRecord> StateStore::ListGroupJobs(const std::string& group_id) {
  return WithTransaction("list group jobs", [&](db::Transaction& tx) {
    auto jobs = repository_->ListGroupJobs(tx, group_id);
    tx.Commit();
    return jobs;
  });
}

std::vector<JobRecord> StateStore::ListReadyJobs() {
  return WithTransaction("list ready jobs", [&](db::Transaction& tx) {
    auto jobs = repository_->ListJobsByState(tx, jobsrv::v1::JOB_STATE_READY);
    tx.Commit();
    return jobs;
  });
}

std::vector<JobRecord> StateStore::ListWorkerJobs(const std::string& worker_id) {
  return WithTransaction("list worker jobs", [&](db::Transaction& tx) {
    auto jobs = repository_->ListWorkerJobs(tx, worker_id);
    tx.Commit();
    return jobs;
  });
}

// -----------------------------------------------------------------------------
// Group locks
// -----------------------------------------------------------------------------

std::shared_ptr<std::mutex> StateStore::GroupMutex(const std::string& group_id) {
  std::lock_guard<std::mutex> lock(group_mutexes_guard_);
  auto&                       mutex = group_mutexes_[group_id];
  if (!mutex) {
    mutex = std::make_shared<std::mutex>();
  }
  return mutex;
}

void StateStore::ForgetGroup(const std::string& group_id) {
  std::lock_guard<std::mutex> lock(group_mutexes_guard_);
  group_mutexes_.erase(group_id);
}

} // namespace jobsrv::core
