#include "worker_registry.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/tags.hpp"

namespace jobsrv::worker {

using db::model::WorkerRecord;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

WorkerRegistry::WorkerRegistry(std::shared_ptr<core::StateStore> store, uint64_t heartbeat_timeout_ms)
    : store_(std::move(store)), heartbeat_timeout_ms_(heartbeat_timeout_ms) {
  if (!store_) {
    throw std::invalid_argument("WorkerRegistry: state store is required");
  }
  if (heartbeat_timeout_ms_ == 0) {
    throw std::invalid_argument("WorkerRegistry: heartbeat timeout must be positive");
  }
}

void WorkerRegistry::SetLostHandler(LostHandler handler) {
  std::lock_guard lock(mutex_);
  lost_handler_ = std::move(handler);
}

bool WorkerRegistry::IsStale(const WorkerRecord& worker, uint64_t now_ms) const {
  return worker.last_heartbeat_ms < StaleBefore(now_ms);
}

uint64_t WorkerRegistry::StaleBefore(uint64_t now_ms) const {
  return now_ms > heartbeat_timeout_ms_ ? now_ms - heartbeat_timeout_ms_ : 0;
}

void WorkerRegistry::Validate(const jobsrv::v1::Heartbeat& heartbeat) {
  if (heartbeat.worker_id().empty()) {
    throw util::ValidationError("heartbeat without worker id");
  }
  if (heartbeat.capacity() == 0) {
    throw util::ValidationError("worker " + heartbeat.worker_id() + ": capacity must be positive");
  }
  for (const auto& tag : heartbeat.tags()) {
    if (!util::IsValidTag(tag)) {
      throw util::ValidationError("worker " + heartbeat.worker_id() + ": invalid tag '" + tag + "'");
    }
  }
}

void WorkerRegistry::Track(const std::string& worker_id, bool known) {
  std::lock_guard lock(mutex_);
  if (known) {
    known_.insert(worker_id);
  } else {
    known_.erase(worker_id);
  }
  observability::Metrics::Instance().SetLiveWorkers(static_cast<std::int64_t>(known_.size()));
}

bool WorkerRegistry::Heartbeat(const jobsrv::v1::Heartbeat& heartbeat, uint64_t now_ms) {
  Validate(heartbeat);

  WorkerRecord worker;
  worker.id       = heartbeat.worker_id();
  worker.endpoint = heartbeat.endpoint();
  worker.capacity = heartbeat.capacity();
  worker.tags.assign(heartbeat.tags().begin(), heartbeat.tags().end());
  worker.last_heartbeat_ms = now_ms;
  worker.suspect           = false;

  store_->UpsertWorker(worker);

  bool first_contact = false;
  {
    std::lock_guard lock(mutex_);
    first_contact = known_.insert(worker.id).second;
    observability::Metrics::Instance().SetLiveWorkers(static_cast<std::int64_t>(known_.size()));
  }

  if (first_contact) {
    JOBSRV_LOG_INFO("worker registered", {StringField("worker_id", worker.id), StringField("endpoint", worker.endpoint),
                                          IntField("capacity", worker.capacity), StringField("tags", util::JoinTags(worker.tags))});
  }
  return first_contact;
}

bool WorkerRegistry::FlagSuspect(const std::string& worker_id) {
  const bool known = store_->SetWorkerSuspect(worker_id, true);
  if (known) {
    JOBSRV_LOG_WARN("worker flagged suspect", {StringField("worker_id", worker_id)});
  }
  return known;
}

std::vector<WorkerRecord> WorkerRegistry::LiveWorkers(uint64_t now_ms) {
  std::vector<WorkerRecord> live;
  for (auto& worker : store_->ListWorkers()) {
    if (!worker.suspect && !IsStale(worker, now_ms)) {
      live.push_back(std::move(worker));
    }
  }
  return live;
}

std::optional<WorkerRecord> WorkerRegistry::Find(const std::string& worker_id) {
  return store_->GetWorker(worker_id);
}

std::vector<std::string> WorkerRegistry::Sweep(uint64_t now_ms) {
  observability::SpanScope span("WorkerRegistry::Sweep");

  LostHandler handler;
  {
    std::lock_guard lock(mutex_);
    handler = lost_handler_;
  }

  const uint64_t           stale_before = StaleBefore(now_ms);
  std::vector<std::string> dead;
  for (const auto& worker : store_->ListWorkers()) {
    if (!IsStale(worker, now_ms)) {
      continue;
    }

    // a heartbeat may have landed since the listing
    auto current = store_->GetWorker(worker.id);
    if (current && !IsStale(*current, now_ms)) {
      continue;
    }

    JOBSRV_LOG_WARN("worker heartbeat expired", {StringField("worker_id", worker.id),
                                                 IntField("silent_ms", static_cast<std::int64_t>(now_ms - worker.last_heartbeat_ms)),
                                                 IntField("load", worker.load), BoolField("suspect", worker.suspect)});

    if (!handler) {
      JOBSRV_LOG_ERROR("no handler for lost worker", {StringField("worker_id", worker.id)});
      continue;
    }

    try {
      if (!handler(worker.id, stale_before, now_ms)) {
        JOBSRV_LOG_INFO("worker heartbeat resumed", {StringField("worker_id", worker.id)});
        continue;
      }
    } catch (const std::exception& e) {
      // left in place; the next sweep tries again
      JOBSRV_LOG_ERROR("lost worker handling failed", {StringField("worker_id", worker.id), StringField("error", e.what())});
      continue;
    }

    Track(worker.id, false);
    dead.push_back(worker.id);
  }

  span.SetAttribute("workers.dead", static_cast<std::int64_t>(dead.size()));
  return dead;
}

size_t WorkerRegistry::Hydrate(uint64_t now_ms) {
  const auto workers = store_->ListWorkers();
  for (auto worker : workers) {
    worker.last_heartbeat_ms = now_ms;
    store_->UpsertWorker(worker);
    Track(worker.id, true);
  }

  JOBSRV_LOG_INFO("workers hydrated", {IntField("count", static_cast<std::int64_t>(workers.size()))});
  return workers.size();
}

} // namespace jobsrv::worker
