#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/state_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatch/worker_transport.hpp"
#include "jobsrv/v1.hpp"

namespace jobsrv::testing {

inline constexpr const char* kTarget = "x86_64-linux";

inline db::model::GroupRecord MakeGroup(const std::string& id, uint64_t created_at_ms = 1000) {
  db::model::GroupRecord group;
  group.id            = id;
  group.state         = jobsrv::v1::GROUP_STATE_QUEUED;
  group.target        = kTarget;
  group.created_at_ms = created_at_ms;
  return group;
}

// Job ids are "<group>/<project>" so tests can name them directly.
inline db::model::JobRecord MakeJob(const std::string& group_id, uint32_t ordinal, const std::string& project,
                                    const std::vector<std::string>& dependencies = {}, std::vector<std::string> extra_tags = {},
                                    uint64_t created_at_ms = 1000) {
  db::model::JobRecord job;
  job.id       = group_id + "/" + project;
  job.group_id = group_id;
  job.ordinal  = ordinal;
  job.project  = project;
  job.target   = kTarget;
  job.tags     = {kTarget};
  for (auto& tag : extra_tags) {
    job.tags.push_back(std::move(tag));
  }
  job.inputs_ref = "inputs/" + project;
  for (const auto& dep : dependencies) {
    job.dependencies.push_back(group_id + "/" + dep);
  }
  job.state         = jobsrv::v1::JOB_STATE_PENDING;
  job.created_at_ms = created_at_ms;
  return job;
}

inline jobsrv::v1::Heartbeat MakeHeartbeat(const std::string& worker_id, uint32_t capacity, std::vector<std::string> extra_tags = {}) {
  jobsrv::v1::Heartbeat heartbeat;
  heartbeat.set_worker_id(worker_id);
  heartbeat.set_capacity(capacity);
  heartbeat.set_endpoint(worker_id + ".local:7000");
  heartbeat.add_tags(kTarget);
  for (const auto& tag : extra_tags) {
    heartbeat.add_tags(tag);
  }
  return heartbeat;
}

inline jobsrv::v1::JobReport MakeReport(const std::string& job_id, const std::string& worker_id, jobsrv::v1::ReportKind kind,
                                        const std::string& detail = {}) {
  jobsrv::v1::JobReport report;
  report.set_job_id(job_id);
  report.set_worker_id(worker_id);
  report.set_kind(kind);
  if (kind == jobsrv::v1::REPORT_KIND_SUCCEEDED) {
    report.set_artifact_ref(detail);
  } else {
    report.set_reason(detail);
  }
  return report;
}

/*
  Records every message; workers in the unreachable set refuse them.
*/
class FakeTransport final : public dispatch::WorkerTransport {
 public:
  struct Sent {
    std::string worker_id;
    std::string job_id;
    uint32_t    attempt = 0;
  };

  bool Send(const db::model::WorkerRecord& worker, const jobsrv::v1::JobAssignment& assignment) override {
    std::lock_guard lock(mutex_);
    if (unreachable_.count(worker.id)) {
      ++refused_;
      return false;
    }
    sent_.push_back(Sent{worker.id, assignment.job_id(), assignment.attempt()});
    return true;
  }

  bool Abort(const db::model::WorkerRecord& worker, const jobsrv::v1::JobAbort& abort) override {
    std::lock_guard lock(mutex_);
    if (unreachable_.count(worker.id)) {
      return false;
    }
    aborts_.push_back(Sent{worker.id, abort.job_id(), 0});
    return true;
  }

  void SetUnreachable(const std::string& worker_id, bool unreachable) {
    std::lock_guard lock(mutex_);
    if (unreachable) {
      unreachable_.insert(worker_id);
    } else {
      unreachable_.erase(worker_id);
    }
  }

  std::vector<Sent> Sends() {
    std::lock_guard lock(mutex_);
    return sent_;
  }

  std::vector<Sent> Aborts() {
    std::lock_guard lock(mutex_);
    return aborts_;
  }

  size_t Refused() {
    std::lock_guard lock(mutex_);
    return refused_;
  }

  void Clear() {
    std::lock_guard lock(mutex_);
    sent_.clear();
    aborts_.clear();
    refused_ = 0;
  }

 private:
  std::mutex            mutex_;
  std::set<std::string> unreachable_;
  std::vector<Sent>     sent_;
  std::vector<Sent>     aborts_;
  size_t                refused_ = 0;
};

/*
  In-memory repository whose Begin() throws while the database is down.
*/
class FlakyRepository final : public db::Repository {
 public:
  void SetDown(bool down) {
    down_ = down;
  }

  std::unique_ptr<db::Transaction> Begin() override {
    if (down_) {
      throw std::runtime_error("database unreachable");
    }
    return inner_.Begin();
  }

  db::Result InsertGroup(db::Transaction& tx, const db::model::GroupRecord& r) override {
    return inner_.InsertGroup(tx, r);
  }
  std::optional<db::model::GroupRecord> GetGroup(db::Transaction& tx, const std::string& id) override {
    return inner_.GetGroup(tx, id);
  }
  db::Result UpdateGroup(db::Transaction& tx, const db::model::GroupRecord& r, uint64_t expected_version) override {
    return inner_.UpdateGroup(tx, r, expected_version);
  }
  std::vector<db::model::GroupRecord> ListOpenGroups(db::Transaction& tx) override {
    return inner_.ListOpenGroups(tx);
  }

  db::Result InsertJob(db::Transaction& tx, const db::model::JobRecord& r) override {
    return inner_.InsertJob(tx, r);
  }
  std::optional<db::model::JobRecord> GetJob(db::Transaction& tx, const std::string& id) override {
    return inner_.GetJob(tx, id);
  }
  std::vector<db::model::JobRecord> ListGroupJobs(db::Transaction& tx, const std::string& group_id) override {
    return inner_.ListGroupJobs(tx, group_id);
  }
  std::vector<db::model::JobRecord> ListJobsByState(db::Transaction& tx, jobsrv::v1::JobState state) override {
    return inner_.ListJobsByState(tx, state);
  }
  std::vector<db::model::JobRecord> ListWorkerJobs(db::Transaction& tx, const std::string& worker_id) override {
    return inner_.ListWorkerJobs(tx, worker_id);
  }
  db::Result UpdateJob(db::Transaction& tx, const db::model::JobRecord& r, uint64_t expected_version) override {
    return inner_.UpdateJob(tx, r, expected_version);
  }

  db::Result UpsertWorker(db::Transaction& tx, const db::model::WorkerRecord& r) override {
    return inner_.UpsertWorker(tx, r);
  }
  std::optional<db::model::WorkerRecord> GetWorker(db::Transaction& tx, const std::string& id) override {
    return inner_.GetWorker(tx, id);
  }
  std::vector<db::model::WorkerRecord> ListWorkers(db::Transaction& tx) override {
    return inner_.ListWorkers(tx);
  }
  db::Result AcquireWorkerSlot(db::Transaction& tx, const std::string& id, uint64_t now_ms) override {
    return inner_.AcquireWorkerSlot(tx, id, now_ms);
  }
  db::Result ReleaseWorkerSlot(db::Transaction& tx, const std::string& id) override {
    return inner_.ReleaseWorkerSlot(tx, id);
  }
  db::Result SetWorkerSuspect(db::Transaction& tx, const std::string& id, bool suspect) override {
    return inner_.SetWorkerSuspect(tx, id, suspect);
  }
  db::Result DeleteWorker(db::Transaction& tx, const std::string& id) override {
    return inner_.DeleteWorker(tx, id);
  }

 private:
  std::atomic<bool>            down_{false};
  db::memory::MemoryRepository inner_;
};

// The worker a job is assigned to in the most recent send, or empty.
inline std::string SentTo(const std::vector<FakeTransport::Sent>& sends, const std::string& job_id) {
  std::string worker;
  for (const auto& s : sends) {
    if (s.job_id == job_id) worker = s.worker_id;
  }
  return worker;
}

inline jobsrv::v1::JobState StateOf(core::StateStore& store, const std::string& job_id) {
  auto job = store.GetJob(job_id);
  return job ? job->state : jobsrv::v1::JOB_STATE_UNSPECIFIED;
}

} // namespace jobsrv::testing
