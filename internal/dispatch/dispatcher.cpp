#include "dispatcher.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/tags.hpp"

namespace jobsrv::dispatch {

using db::model::JobRecord;
using db::model::WorkerRecord;
using observability::IntField;
using observability::StringField;

namespace {

struct Slot {
  const WorkerRecord* worker;
  uint32_t            load;
  uint64_t            last_dispatch_ms;

  uint32_t Spare() const {
    return worker->capacity > load ? worker->capacity - load : 0;
  }
};

bool Prefer(const Slot& a, const Slot& b) {
  if (a.Spare() != b.Spare()) return a.Spare() > b.Spare();
  if (a.last_dispatch_ms != b.last_dispatch_ms) return a.last_dispatch_ms < b.last_dispatch_ms;
  return a.worker->id < b.worker->id;
}

jobsrv::v1::JobAssignment ToAssignment(const JobRecord& job) {
  jobsrv::v1::JobAssignment msg;
  msg.set_job_id(job.id);
  msg.set_group_id(job.group_id);
  msg.set_project(job.project);
  msg.set_target(job.target);
  msg.set_inputs_ref(job.inputs_ref);
  msg.set_attempt(job.retry_count + 1);
  return msg;
}

} // namespace

Dispatcher::Dispatcher(std::shared_ptr<core::StateStore> store, std::shared_ptr<scheduler::Scheduler> scheduler,
                       std::shared_ptr<worker::WorkerRegistry> registry, std::shared_ptr<WorkerTransport> transport)
    : store_(std::move(store)), scheduler_(std::move(scheduler)), registry_(std::move(registry)), transport_(std::move(transport)) {
  if (!store_ || !scheduler_ || !registry_ || !transport_) {
    throw std::invalid_argument("Dispatcher: missing dependency");
  }
}

std::vector<Assignment> Dispatcher::Assign(const std::vector<JobRecord>& ready_jobs, const std::vector<WorkerRecord>& workers) {
  std::vector<Slot> slots;
  slots.reserve(workers.size());

  uint64_t stamp = 0;
  for (const auto& worker : workers) {
    slots.push_back(Slot{&worker, worker.load, worker.last_dispatch_ms});
    stamp = std::max(stamp, worker.last_dispatch_ms);
  }

  std::vector<Assignment> out;
  for (const auto& job : ready_jobs) {
    Slot* best = nullptr;
    for (auto& slot : slots) {
      if (slot.Spare() == 0 || !util::ContainsAll(slot.worker->tags, job.tags)) continue;
      if (!best || Prefer(slot, *best)) best = &slot;
    }
    if (!best) continue;

    out.push_back(Assignment{job.id, best->worker->id});
    ++best->load;
    // most recently used from here on
    best->last_dispatch_ms = ++stamp;
  }
  return out;
}

bool Dispatcher::Release(const Assignment& assignment, uint64_t now_ms) {
  try {
    scheduler_->ReleaseAssignment(assignment.job_id, assignment.worker_id, now_ms);
    return true;
  } catch (const std::exception& e) {
    JOBSRV_LOG_ERROR("assignment release failed", {StringField("job_id", assignment.job_id),
                                                   StringField("worker_id", assignment.worker_id), StringField("error", e.what())});
    return false;
  }
}

void Dispatcher::RetryReleases(uint64_t now_ms, PassStats& stats) {
  std::lock_guard lock(releases_mutex_);

  std::vector<Assignment> still_pending;
  for (const auto& a : pending_releases_) {
    if (Release(a, now_ms)) {
      ++stats.released;
    } else {
      still_pending.push_back(a);
    }
  }
  pending_releases_.swap(still_pending);
}

size_t Dispatcher::PendingReleases() {
  std::lock_guard lock(releases_mutex_);
  return pending_releases_.size();
}

PassStats Dispatcher::RunPass(uint64_t now_ms) {
  PassStats stats;

  RetryReleases(now_ms, stats);

  const auto ready = store_->ListReadyJobs();
  stats.ready      = ready.size();
  if (ready.empty()) return stats;

  observability::SpanScope span("Dispatcher::RunPass");
  span.SetAttribute("jobs.ready", static_cast<std::int64_t>(ready.size()));

  const auto workers     = registry_->LiveWorkers(now_ms);
  const auto assignments = Assign(ready, workers);
  stats.unmatched        = ready.size() - assignments.size();

  std::unordered_map<std::string, const JobRecord*> jobs_by_id;
  for (const auto& job : ready) jobs_by_id.emplace(job.id, &job);
  std::unordered_map<std::string, const WorkerRecord*> workers_by_id;
  for (const auto& worker : workers) workers_by_id.emplace(worker.id, &worker);

  std::unordered_set<std::string> unreachable;

  for (const auto& a : assignments) {
    // one failed send is enough to stop using the worker this pass
    if (unreachable.count(a.worker_id)) continue;

    const auto status = store_->RecordAssignment(a.job_id, a.worker_id, now_ms);
    if (status != core::TransitionStatus::kApplied) {
      ++stats.superseded;
      observability::Metrics::Instance().RecordDispatch("superseded");
      JOBSRV_LOG_DEBUG("assignment superseded", {StringField("job_id", a.job_id), StringField("worker_id", a.worker_id),
                                                 StringField("status", core::ToString(status))});
      continue;
    }

    const auto& job    = *jobs_by_id.at(a.job_id);
    const auto& worker = *workers_by_id.at(a.worker_id);

    if (transport_->Send(worker, ToAssignment(job))) {
      ++stats.sent;
      observability::Metrics::Instance().RecordDispatch("sent");
      JOBSRV_LOG_INFO("job dispatched", {StringField("job_id", job.id), StringField("project", job.project),
                                         StringField("worker_id", worker.id), IntField("attempt", job.retry_count + 1)});
      continue;
    }

    ++stats.send_failed;
    observability::Metrics::Instance().RecordDispatch("send_failed");
    JOBSRV_LOG_WARN("assignment send failed", {StringField("job_id", job.id), StringField("worker_id", worker.id),
                                               StringField("endpoint", worker.endpoint)});

    span.AddEvent("send failed");
    unreachable.insert(worker.id);

    try {
      registry_->FlagSuspect(worker.id);
    } catch (const std::exception& e) {
      // excluded for the rest of this pass either way
      JOBSRV_LOG_WARN("could not flag worker suspect", {StringField("worker_id", worker.id), StringField("error", e.what())});
    }

    const Assignment undelivered{job.id, worker.id};
    if (Release(undelivered, now_ms)) {
      ++stats.released;
    } else {
      std::lock_guard lock(releases_mutex_);
      pending_releases_.push_back(undelivered);
    }
  }

  span.SetAttribute("jobs.sent", static_cast<std::int64_t>(stats.sent));
  return stats;
}

size_t Dispatcher::SendAborts(const std::vector<scheduler::AbortRequest>& aborts) {
  size_t delivered = 0;

  for (const auto& abort : aborts) {
    auto worker = registry_->Find(abort.worker_id);
    if (!worker) {
      JOBSRV_LOG_DEBUG("abort for unknown worker", {StringField("job_id", abort.job_id), StringField("worker_id", abort.worker_id)});
      continue;
    }

    jobsrv::v1::JobAbort msg;
    msg.set_job_id(abort.job_id);
    msg.set_reason(abort.reason);

    if (transport_->Abort(*worker, msg)) {
      ++delivered;
    } else {
      JOBSRV_LOG_WARN("abort not delivered", {StringField("job_id", abort.job_id), StringField("worker_id", abort.worker_id)});
    }
  }
  return delivered;
}

} // namespace jobsrv::dispatch
