#include "scheduler.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace jobsrv::scheduler {

using db::model::JobRecord;
using jobsrv::v1::JobState;
using observability::IntField;
using observability::StringField;

namespace {

const std::vector<JobState> kOpenStates = {jobsrv::v1::JOB_STATE_PENDING, jobsrv::v1::JOB_STATE_READY, jobsrv::v1::JOB_STATE_DISPATCHED,
                                           jobsrv::v1::JOB_STATE_RUNNING};

core::JobTransition Move(const std::string& job_id, std::vector<JobState> expected, JobState next, std::string expected_worker = {}) {
  core::JobTransition t;
  t.job_id          = job_id;
  t.expected        = std::move(expected);
  t.expected_worker = std::move(expected_worker);
  t.next            = next;
  return t;
}

// Empty worker_id accepts the report from whoever holds the job.
bool HeldBy(const JobRecord& job, const std::string& worker_id) {
  return model::IsAssigned(job.state) && (worker_id.empty() || job.worker_id == worker_id);
}

core::TransitionBatch NewBatch(const std::string& group_id) {
  core::TransitionBatch batch;
  batch.group_id = group_id;
  return batch;
}

} // namespace

std::string_view ToString(ReportOutcome outcome) {
  return outcome == ReportOutcome::kApplied ? "applied" : "ignored";
}

Scheduler::Scheduler(std::shared_ptr<core::StateStore> store, SchedulerOptions options) : store_(std::move(store)), options_(options) {
  if (!store_) {
    throw std::invalid_argument("Scheduler: state store is required");
  }
  if (options_.max_transition_attempts == 0) {
    options_.max_transition_attempts = 1;
  }
}

void Scheduler::SetReadyNotifier(std::function<void()> notifier) {
  std::lock_guard<std::mutex> lock(notifier_mutex_);
  notifier_ = std::move(notifier);
}

void Scheduler::NotifyReady() {
  std::function<void()> notifier;
  {
    std::lock_guard<std::mutex> lock(notifier_mutex_);
    notifier = notifier_;
  }
  if (notifier) {
    notifier();
  }
}

// -----------------------------------------------------------------------------
// Group entries
// -----------------------------------------------------------------------------

std::shared_ptr<Scheduler::GroupEntry> Scheduler::Entry(const std::string& group_id) {
  std::lock_guard<std::mutex> lock(entries_mutex_);
  auto&                       entry = entries_[group_id];
  if (!entry) {
    entry = std::make_shared<GroupEntry>();
  }
  return entry;
}

void Scheduler::DropEntry(const std::string& group_id) {
  std::lock_guard<std::mutex> lock(entries_mutex_);
  entries_.erase(group_id);
}

GroupPlan& Scheduler::EnsurePlan(GroupEntry& entry, const std::string& group_id) {
  if (!entry.plan) {
    entry.plan = GroupPlan::FromJobs(group_id, store_->ListGroupJobs(group_id));
  }
  return *entry.plan;
}

void Scheduler::Commit(GroupEntry& entry, const std::string& group_id, const core::TransitionResult& result, bool& became_ready) {
  for (const auto& job : result.jobs) {
    if (job.group_id != group_id) {
      continue;
    }
    if (entry.plan) {
      entry.plan->Observe(job);
    }
    if (job.state == jobsrv::v1::JOB_STATE_READY) {
      became_ready = true;
    }
  }

  for (const auto& group : result.groups) {
    if (group.id != group_id || !model::IsTerminal(group.state)) {
      continue;
    }
    JOBSRV_LOG_INFO("group finished", {StringField("group_id", group.id), StringField("state", model::ShortName(group.state))});
    DropEntry(group.id);
  }
}

// -----------------------------------------------------------------------------
// Planning helpers
// -----------------------------------------------------------------------------

void Scheduler::PlanCascade(const std::string& job_id, const GroupPlan& plan, JobState next, const std::string& reason,
                            core::TransitionBatch& batch) const {
  std::unordered_set<std::string> planned;
  for (const auto& t : batch.transitions) {
    planned.insert(t.job_id);
  }

  for (const auto& dependent : plan.TransitiveDependents(job_id)) {
    if (plan.IsSettled(dependent) || !planned.insert(dependent).second) {
      continue;
    }
    auto t   = Move(dependent, {jobsrv::v1::JOB_STATE_PENDING, jobsrv::v1::JOB_STATE_READY}, next);
    t.reason = reason;
    batch.transitions.push_back(std::move(t));
  }
}

void Scheduler::PlanRelinquish(const JobRecord& job, const GroupPlan& plan, bool spend_retry, const std::string& reason,
                               core::TransitionBatch& batch) const {
  if (!spend_retry || job.retry_count < options_.retry_budget) {
    auto requeue        = Move(job.id, {job.state}, jobsrv::v1::JOB_STATE_PENDING, job.worker_id);
    requeue.count_retry = spend_retry;
    batch.transitions.push_back(std::move(requeue));
    // it was dispatched, so its dependencies are Complete
    batch.transitions.push_back(Move(job.id, {jobsrv::v1::JOB_STATE_PENDING}, jobsrv::v1::JOB_STATE_READY));
    return;
  }

  auto fail   = Move(job.id, {job.state}, jobsrv::v1::JOB_STATE_FAILED, job.worker_id);
  fail.reason = "retry budget exhausted: " + reason;
  batch.transitions.push_back(std::move(fail));
  PlanCascade(job.id, plan, jobsrv::v1::JOB_STATE_DEPENDENCY_FAILED, "dependency " + job.project + " failed", batch);
}

// -----------------------------------------------------------------------------
// Event loop for one job
// -----------------------------------------------------------------------------

ReportOutcome Scheduler::RunJobEvent(std::string_view event, const std::string& job_id, uint64_t now_ms, const Planner& planner) {
  auto job = store_->GetJob(job_id);
  if (!job) {
    JOBSRV_LOG_WARN("report for unknown job", {StringField("event", event), StringField("job_id", job_id)});
    return ReportOutcome::kIgnored;
  }

  const std::string group_id     = job->group_id;
  auto              entry        = Entry(group_id);
  bool              became_ready = false;

  {
    std::lock_guard<std::mutex> lock(entry->mutex);

    for (uint32_t attempt = 1;; ++attempt) {
      // fresh row under the group lock; the first read only located the group
      job = store_->GetJob(job_id);
      if (!job) {
        return ReportOutcome::kIgnored;
      }

      auto batch = planner(*job, EnsurePlan(*entry, group_id));
      if (!batch) {
        JOBSRV_LOG_DEBUG("report ignored",
                         {StringField("event", event), StringField("job_id", job_id), StringField("state", model::ShortName(job->state))});
        return ReportOutcome::kIgnored;
      }

      const auto result = store_->ApplyTransitions(*batch, now_ms);
      if (result.status == core::TransitionStatus::kApplied) {
        Commit(*entry, group_id, result, became_ready);
        if (result.jobs.size() > 2) {
          JOBSRV_LOG_INFO("cascade applied", {StringField("event", event), StringField("job_id", job_id),
                                              IntField("transitions", static_cast<std::int64_t>(result.jobs.size()))});
        }
        break;
      }

      if (attempt >= options_.max_transition_attempts) {
        throw util::TransitionConflict(std::string(event) + " on job " + job_id + ": " + result.detail);
      }
      JOBSRV_LOG_DEBUG("transition refused, replanning", {StringField("event", event), StringField("job_id", job_id),
                                                          StringField("status", core::ToString(result.status)),
                                                          StringField("detail", result.detail)});
      entry->plan.reset();
    }
  }

  if (became_ready) {
    NotifyReady();
  }
  return ReportOutcome::kApplied;
}

// -----------------------------------------------------------------------------
// Group lifecycle
// -----------------------------------------------------------------------------

void Scheduler::Activate(const std::string& group_id, uint64_t now_ms) {
  observability::SpanScope span("Scheduler::Activate");
  span.SetAttribute("group.id", group_id);

  auto entry        = Entry(group_id);
  bool became_ready = false;

  {
    std::lock_guard<std::mutex> lock(entry->mutex);

    for (uint32_t attempt = 1;; ++attempt) {
      auto&      plan  = EnsurePlan(*entry, group_id);
      const auto ready = plan.Promotable();
      if (ready.empty()) {
        break;
      }

      auto batch = NewBatch(group_id);
      for (const auto& id : ready) {
        batch.transitions.push_back(Move(id, {jobsrv::v1::JOB_STATE_PENDING}, jobsrv::v1::JOB_STATE_READY));
      }

      const auto result = store_->ApplyTransitions(batch, now_ms);
      if (result.status == core::TransitionStatus::kApplied) {
        Commit(*entry, group_id, result, became_ready);
        JOBSRV_LOG_DEBUG("group activated", {StringField("group_id", group_id), IntField("ready", static_cast<std::int64_t>(ready.size()))});
        break;
      }

      if (attempt >= options_.max_transition_attempts) {
        throw util::TransitionConflict("activate group " + group_id + ": " + result.detail);
      }
      entry->plan.reset();
    }
  }

  if (became_ready) {
    NotifyReady();
  }
}

CancelOutcome Scheduler::CancelGroup(const std::string& group_id, uint64_t now_ms) {
  observability::SpanScope span("Scheduler::CancelGroup");
  span.SetAttribute("group.id", group_id);

  auto                        entry = Entry(group_id);
  std::lock_guard<std::mutex> lock(entry->mutex);

  for (uint32_t attempt = 1;; ++attempt) {
    auto group = store_->GetGroup(group_id);
    if (!group) {
      DropEntry(group_id);
      throw util::NotFound("group not found: " + group_id);
    }

    CancelOutcome out;
    if (model::IsTerminal(group->state)) {
      out.state            = group->state;
      out.already_terminal = true;
      DropEntry(group_id);
      return out;
    }

    auto& plan           = EnsurePlan(*entry, group_id);
    auto  batch          = NewBatch(group_id);
    batch.request_cancel = true;
    for (const auto& id : plan.OpenJobs()) {
      auto t   = Move(id, kOpenStates, jobsrv::v1::JOB_STATE_CANCELED);
      t.reason = "group canceled";
      batch.transitions.push_back(std::move(t));
    }

    const auto result = store_->ApplyTransitions(batch, now_ms);
    if (result.status == core::TransitionStatus::kApplied) {
      for (size_t i = 0; i < result.jobs.size(); ++i) {
        const auto& job = result.jobs[i];
        out.canceled_jobs.push_back(job.id);
        if (model::IsAssigned(result.prior_states[i]) && !job.worker_id.empty()) {
          out.aborts.push_back(AbortRequest{job.id, job.worker_id, "group canceled"});
        }
      }
      out.state = result.groups.empty() ? group->state : result.groups.front().state;

      bool became_ready = false;
      Commit(*entry, group_id, result, became_ready);

      JOBSRV_LOG_INFO("group canceled", {StringField("group_id", group_id), IntField("jobs", static_cast<std::int64_t>(out.canceled_jobs.size())),
                                         IntField("aborts", static_cast<std::int64_t>(out.aborts.size()))});
      return out;
    }

    if (attempt >= options_.max_transition_attempts) {
      throw util::TransitionConflict("cancel group " + group_id + ": " + result.detail);
    }
    entry->plan.reset();
  }
}

size_t Scheduler::Recover(uint64_t now_ms) {
  const auto groups = store_->ListOpenGroups();
  for (const auto& group : groups) {
    Activate(group.id, now_ms);
  }
  JOBSRV_LOG_INFO("scheduler recovered", {IntField("open_groups", static_cast<std::int64_t>(groups.size()))});
  return groups.size();
}

// -----------------------------------------------------------------------------
// Worker reports
// -----------------------------------------------------------------------------

ReportOutcome Scheduler::OnStarted(const std::string& job_id, const std::string& worker_id, uint64_t now_ms) {
  return RunJobEvent("started", job_id, now_ms, [&](const JobRecord& job, GroupPlan&) -> std::optional<core::TransitionBatch> {
    if (job.state != jobsrv::v1::JOB_STATE_DISPATCHED || !HeldBy(job, worker_id)) {
      return std::nullopt;
    }
    auto batch = NewBatch(job.group_id);
    batch.transitions.push_back(Move(job.id, {jobsrv::v1::JOB_STATE_DISPATCHED}, jobsrv::v1::JOB_STATE_RUNNING, job.worker_id));
    return batch;
  });
}

ReportOutcome Scheduler::OnProgress(const std::string& job_id, const std::string& worker_id, uint64_t now_ms) {
  return OnStarted(job_id, worker_id, now_ms);
}

ReportOutcome Scheduler::OnSucceeded(const std::string& job_id, const std::string& worker_id, const std::string& artifact_ref,
                                     uint64_t now_ms) {
  return RunJobEvent("succeeded", job_id, now_ms, [&](const JobRecord& job, GroupPlan& plan) -> std::optional<core::TransitionBatch> {
    if (!HeldBy(job, worker_id)) {
      return std::nullopt;
    }

    auto batch         = NewBatch(job.group_id);
    auto done          = Move(job.id, {jobsrv::v1::JOB_STATE_DISPATCHED, jobsrv::v1::JOB_STATE_RUNNING}, jobsrv::v1::JOB_STATE_COMPLETE,
                              job.worker_id);
    done.artifact_ref  = artifact_ref;
    batch.transitions.push_back(std::move(done));

    // only direct dependents; this completion was the last one they waited on
    for (const auto& dependent : plan.Dependents(job.id)) {
      if (!plan.IsSettled(dependent) && plan.Remaining(dependent) == 1) {
        batch.transitions.push_back(Move(dependent, {jobsrv::v1::JOB_STATE_PENDING}, jobsrv::v1::JOB_STATE_READY));
      }
    }
    return batch;
  });
}

ReportOutcome Scheduler::OnFailed(const std::string& job_id, const std::string& worker_id, const std::string& reason,
                                  uint64_t now_ms) {
  return RunJobEvent("failed", job_id, now_ms, [&](const JobRecord& job, GroupPlan& plan) -> std::optional<core::TransitionBatch> {
    if (!HeldBy(job, worker_id)) {
      return std::nullopt;
    }

    auto batch  = NewBatch(job.group_id);
    auto failed = Move(job.id, {jobsrv::v1::JOB_STATE_DISPATCHED, jobsrv::v1::JOB_STATE_RUNNING}, jobsrv::v1::JOB_STATE_FAILED,
                       job.worker_id);
    failed.reason = reason.empty() ? "build failed" : reason;
    batch.transitions.push_back(std::move(failed));

    PlanCascade(job.id, plan, jobsrv::v1::JOB_STATE_DEPENDENCY_FAILED, "dependency " + job.project + " failed", batch);
    return batch;
  });
}

ReportOutcome Scheduler::OnAborted(const std::string& job_id, const std::string& worker_id, const std::string& reason,
                                   uint64_t now_ms) {
  return RunJobEvent("aborted", job_id, now_ms, [&](const JobRecord& job, GroupPlan& plan) -> std::optional<core::TransitionBatch> {
    if (!HeldBy(job, worker_id)) {
      return std::nullopt;
    }
    auto batch = NewBatch(job.group_id);
    PlanRelinquish(job, plan, true, reason.empty() ? "aborted by worker" : "aborted by worker: " + reason, batch);
    return batch;
  });
}

// -----------------------------------------------------------------------------
// Dispatch feedback
// -----------------------------------------------------------------------------

ReportOutcome Scheduler::ReleaseAssignment(const std::string& job_id, const std::string& worker_id, uint64_t now_ms) {
  return RunJobEvent("release", job_id, now_ms, [&](const JobRecord& job, GroupPlan& plan) -> std::optional<core::TransitionBatch> {
    // a report already moved it past Dispatched: the worker has it after all
    if (job.state != jobsrv::v1::JOB_STATE_DISPATCHED || job.worker_id != worker_id) {
      return std::nullopt;
    }
    auto batch = NewBatch(job.group_id);
    PlanRelinquish(job, plan, false, "assignment not delivered", batch);
    return batch;
  });
}

WorkerLossOutcome Scheduler::HandleWorkerLost(const std::string& worker_id, uint64_t stale_before_ms, uint64_t now_ms) {
  observability::SpanScope span("Scheduler::HandleWorkerLost");
  span.SetAttribute("worker.id", worker_id);

  const std::string reason = "worker " + worker_id + " lost";

  for (uint32_t attempt = 1;; ++attempt) {
    const auto held = store_->ListWorkerJobs(worker_id);

    std::vector<std::string> group_ids;
    for (const auto& job : held) {
      group_ids.push_back(job.group_id);
    }
    std::sort(group_ids.begin(), group_ids.end());
    group_ids.erase(std::unique(group_ids.begin(), group_ids.end()), group_ids.end());

    // sorted, same order as the store takes its own locks
    std::vector<std::shared_ptr<GroupEntry>>  entries;
    std::vector<std::unique_lock<std::mutex>> locks;
    std::vector<core::TransitionBatch>        batches;
    for (const auto& group_id : group_ids) {
      entries.push_back(Entry(group_id));
      locks.emplace_back(entries.back()->mutex);

      auto& plan  = EnsurePlan(*entries.back(), group_id);
      auto  batch = NewBatch(group_id);
      for (const auto& job : held) {
        if (job.group_id == group_id) {
          PlanRelinquish(job, plan, true, reason, batch);
        }
      }
      batches.push_back(std::move(batch));
    }

    const auto result = store_->RemoveWorker(worker_id, batches, stale_before_ms, now_ms);
    if (result.status == core::TransitionStatus::kApplied) {
      bool became_ready = false;
      for (size_t i = 0; i < group_ids.size(); ++i) {
        Commit(*entries[i], group_ids[i], result, became_ready);
      }
      locks.clear();

      WorkerLossOutcome out;
      out.removed = true;
      for (const auto& job : held) {
        out.jobs.push_back(job.id);
      }
      JOBSRV_LOG_WARN("worker removed", {StringField("worker_id", worker_id), IntField("jobs", static_cast<std::int64_t>(out.jobs.size()))});

      if (became_ready) {
        NotifyReady();
      }
      return out;
    }

    if (result.status == core::TransitionStatus::kRejected) {
      auto worker = store_->GetWorker(worker_id);
      if (worker && worker->last_heartbeat_ms >= stale_before_ms) {
        JOBSRV_LOG_INFO("worker kept, heartbeat arrived", {StringField("worker_id", worker_id)});
        return WorkerLossOutcome{};
      }
    }

    if (attempt >= options_.max_transition_attempts) {
      throw util::TransitionConflict("remove worker " + worker_id + ": " + result.detail);
    }
    for (auto& entry : entries) {
      entry->plan.reset();
    }
  }
}

} // namespace jobsrv::scheduler
