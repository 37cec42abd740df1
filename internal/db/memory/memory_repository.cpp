#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "internal/model/state_machine.hpp"
#include "memory_tx.hpp"

namespace jobsrv::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Groups
// ------------------------------------------------------------------

Result MemoryRepository::InsertGroup(Transaction& t, const model::GroupRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.groups.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "group " + r.id);
  s.groups[r.id] = r;
  return Result::Ok();
}

std::optional<model::GroupRecord> MemoryRepository::GetGroup(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.groups.find(id);
  if (it == s.groups.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateGroup(Transaction& t, const model::GroupRecord& r, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.groups.find(r.id);
  if (it == s.groups.end()) return Result::Err(ErrorCode::NotFound, "group " + r.id);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, "group " + r.id);
  it->second = r;
  return Result::Ok();
}

std::vector<model::GroupRecord> MemoryRepository::ListOpenGroups(Transaction& t) {
  std::vector<model::GroupRecord> out;
  for (const auto& [_, group] : TX(t).View().groups) {
    if (!jobsrv::model::IsTerminal(group.state)) out.push_back(group);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return std::tie(a.created_at_ms, a.id) < std::tie(b.created_at_ms, b.id);
  });
  return out;
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.groups.contains(r.group_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown group " + r.group_id);
  if (s.jobs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "job " + r.id);
  s.jobs[r.id] = r;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::JobRecord> MemoryRepository::ListGroupJobs(Transaction& t, const std::string& group_id) {
  std::vector<model::JobRecord> out;
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (job.group_id == group_id) out.push_back(job);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.ordinal < b.ordinal; });
  return out;
}

std::vector<model::JobRecord> MemoryRepository::ListJobsByState(Transaction& t, jobsrv::v1::JobState state) {
  std::vector<model::JobRecord> out;
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (job.state == state) out.push_back(job);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return std::tie(a.created_at_ms, a.group_id, a.ordinal) < std::tie(b.created_at_ms, b.group_id, b.ordinal);
  });
  return out;
}

std::vector<model::JobRecord> MemoryRepository::ListWorkerJobs(Transaction& t, const std::string& worker_id) {
  std::vector<model::JobRecord> out;
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (job.worker_id == worker_id && jobsrv::model::IsAssigned(job.state)) out.push_back(job);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

Result MemoryRepository::UpdateJob(Transaction& t, const model::JobRecord& r, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(r.id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound, "job " + r.id);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, "job " + r.id);

  auto dependencies = std::move(it->second.dependencies);
  it->second        = r;
  it->second.dependencies = std::move(dependencies);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

Result MemoryRepository::UpsertWorker(Transaction& t, const model::WorkerRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.workers.find(r.id);
  if (it == s.workers.end()) {
    auto fresh = r;
    fresh.load = 0;
    s.workers.emplace(r.id, std::move(fresh));
    return Result::Ok();
  }

  auto& w             = it->second;
  w.endpoint          = r.endpoint;
  w.tags              = r.tags;
  w.capacity          = std::max(r.capacity, w.load);
  w.last_heartbeat_ms = r.last_heartbeat_ms;
  w.suspect           = r.suspect;
  return Result::Ok();
}

std::optional<model::WorkerRecord> MemoryRepository::GetWorker(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.workers.find(id);
  if (it == s.workers.end()) return std::nullopt;
  return it->second;
}

std::vector<model::WorkerRecord> MemoryRepository::ListWorkers(Transaction& t) {
  std::vector<model::WorkerRecord> out;
  for (const auto& [_, worker] : TX(t).View().workers)
    out.push_back(worker);
  return out;
}

Result MemoryRepository::AcquireWorkerSlot(Transaction& t, const std::string& id, uint64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.workers.find(id);
  if (it == s.workers.end()) return Result::Err(ErrorCode::NotFound, "worker " + id);
  if (it->second.load >= it->second.capacity) return Result::Err(ErrorCode::Exhausted, "worker " + id);
  ++it->second.load;
  it->second.last_dispatch_ms = now_ms;
  return Result::Ok();
}

Result MemoryRepository::ReleaseWorkerSlot(Transaction& t, const std::string& id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.workers.find(id);
  if (it != s.workers.end() && it->second.load > 0) --it->second.load;
  return Result::Ok();
}

Result MemoryRepository::SetWorkerSuspect(Transaction& t, const std::string& id, bool suspect) {
  auto& s  = TX(t).Mutable();
  auto  it = s.workers.find(id);
  if (it == s.workers.end()) return Result::Err(ErrorCode::NotFound, "worker " + id);
  it->second.suspect = suspect;
  return Result::Ok();
}

Result MemoryRepository::DeleteWorker(Transaction& t, const std::string& id) {
  TX(t).Mutable().workers.erase(id);
  return Result::Ok();
}

} // namespace jobsrv::db::memory
