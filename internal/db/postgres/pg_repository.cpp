#include "pg_repository.hpp"

#include <optional>

#include "internal/util/tags.hpp"

namespace jobsrv::db::postgres {

namespace {

std::optional<uint64_t> NullIfZero(uint64_t v) {
  if (v == 0) return std::nullopt;
  return v;
}

std::optional<std::string> NullIfEmpty(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

uint64_t U64OrZero(const pqxx::field& f) {
  return f.is_null() ? 0 : f.as<uint64_t>();
}

std::string TextOrEmpty(const pqxx::field& f) {
  return f.is_null() ? std::string{} : std::string(f.c_str());
}

model::GroupRecord ReadGroup(const pqxx::row& row) {
  model::GroupRecord r;
  r.id               = row[0].c_str();
  r.state            = static_cast<jobsrv::v1::GroupState>(row[1].as<int>());
  r.target           = row[2].c_str();
  r.cancel_requested = row[3].as<bool>();
  r.created_at_ms    = row[4].as<uint64_t>();
  r.completed_at_ms  = U64OrZero(row[5]);
  r.version          = row[6].as<uint64_t>();
  return r;
}

model::JobRecord ReadJob(const pqxx::row& row) {
  model::JobRecord r;
  r.id               = row[0].c_str();
  r.group_id         = row[1].c_str();
  r.ordinal          = row[2].as<uint32_t>();
  r.project          = row[3].c_str();
  r.target           = row[4].c_str();
  r.tags             = util::SplitTags(row[5].c_str());
  r.inputs_ref       = row[6].c_str();
  r.state            = static_cast<jobsrv::v1::JobState>(row[7].as<int>());
  r.worker_id        = TextOrEmpty(row[8]);
  r.retry_count      = row[9].as<uint32_t>();
  r.failure_reason   = row[10].c_str();
  r.artifact_ref     = row[11].c_str();
  r.created_at_ms    = row[12].as<uint64_t>();
  r.dispatched_at_ms = U64OrZero(row[13]);
  r.started_at_ms    = U64OrZero(row[14]);
  r.completed_at_ms  = U64OrZero(row[15]);
  r.version          = row[16].as<uint64_t>();
  return r;
}

model::WorkerRecord ReadWorker(const pqxx::row& row) {
  model::WorkerRecord r;
  r.id                = row[0].c_str();
  r.endpoint          = row[1].c_str();
  r.tags              = util::SplitTags(row[2].c_str());
  r.capacity          = row[3].as<uint32_t>();
  r.load              = row[4].as<uint32_t>();
  r.last_heartbeat_ms = row[5].as<uint64_t>();
  r.last_dispatch_ms  = row[6].as<uint64_t>();
  r.suspect           = row[7].as<bool>();
  return r;
}

std::vector<model::JobRecord> CollectJobs(pqxx::work& work, const pqxx::result& res) {
  std::vector<model::JobRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    auto job = ReadJob(row);
    for (const auto& dep : work.exec_prepared("job_dependencies", job.id)) {
      job.dependencies.emplace_back(dep[0].c_str());
    }
    out.push_back(std::move(job));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Groups
// ------------------------------------------------------------------

Result PgRepository::InsertGroup(Transaction& t, const model::GroupRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_group", r.id, static_cast<int>(r.state), r.target, r.cancel_requested, r.created_at_ms,
                               NullIfZero(r.completed_at_ms), r.version);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::GroupRecord> PgRepository::GetGroup(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_group", id);
  if (res.empty()) return std::nullopt;
  return ReadGroup(res[0]);
}

Result PgRepository::UpdateGroup(Transaction& t, const model::GroupRecord& r, uint64_t expected_version) {
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_prepared("update_group", r.id, static_cast<int>(r.state), r.cancel_requested, NullIfZero(r.completed_at_ms),
                                    r.version, expected_version);
    if (res.affected_rows() == 0) {
      return work.exec_prepared("get_group", r.id).empty() ? Result::Err(ErrorCode::NotFound, "group " + r.id)
                                                           : Result::Err(ErrorCode::Conflict, "group " + r.id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::GroupRecord> PgRepository::ListOpenGroups(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("open_groups", static_cast<int>(jobsrv::v1::GROUP_STATE_QUEUED),
                                        static_cast<int>(jobsrv::v1::GROUP_STATE_CANCEL_REQUESTED));
  std::vector<model::GroupRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadGroup(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result PgRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  try {
    auto& work = TX(t).Work();
    work.exec_prepared("insert_job", r.id, r.group_id, r.ordinal, r.project, r.target, util::JoinTags(r.tags), r.inputs_ref,
                       static_cast<int>(r.state), NullIfEmpty(r.worker_id), r.retry_count, r.failure_reason, r.artifact_ref,
                       r.created_at_ms, NullIfZero(r.dispatched_at_ms), NullIfZero(r.started_at_ms), NullIfZero(r.completed_at_ms),
                       r.version);
    for (size_t i = 0; i < r.dependencies.size(); ++i) {
      work.exec_prepared("insert_dependency", r.id, r.dependencies[i], static_cast<int>(i));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::GetJob(Transaction& t, const std::string& id) {
  auto& work = TX(t).Work();
  auto  res  = work.exec_prepared("get_job", id);
  if (res.empty()) return std::nullopt;
  return CollectJobs(work, res).front();
}

std::vector<model::JobRecord> PgRepository::ListGroupJobs(Transaction& t, const std::string& group_id) {
  auto& work = TX(t).Work();
  return CollectJobs(work, work.exec_prepared("group_jobs", group_id));
}

std::vector<model::JobRecord> PgRepository::ListJobsByState(Transaction& t, jobsrv::v1::JobState state) {
  auto& work = TX(t).Work();
  return CollectJobs(work, work.exec_prepared("jobs_by_state", static_cast<int>(state)));
}

std::vector<model::JobRecord> PgRepository::ListWorkerJobs(Transaction& t, const std::string& worker_id) {
  auto& work = TX(t).Work();
  return CollectJobs(work, work.exec_prepared("worker_jobs", worker_id, static_cast<int>(jobsrv::v1::JOB_STATE_DISPATCHED),
                                              static_cast<int>(jobsrv::v1::JOB_STATE_RUNNING)));
}

Result PgRepository::UpdateJob(Transaction& t, const model::JobRecord& r, uint64_t expected_version) {
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_prepared("update_job", r.id, static_cast<int>(r.state), NullIfEmpty(r.worker_id), r.retry_count,
                                    r.failure_reason, r.artifact_ref, NullIfZero(r.dispatched_at_ms), NullIfZero(r.started_at_ms),
                                    NullIfZero(r.completed_at_ms), r.version, expected_version);
    if (res.affected_rows() == 0) {
      return work.exec_prepared("get_job", r.id).empty() ? Result::Err(ErrorCode::NotFound, "job " + r.id)
                                                         : Result::Err(ErrorCode::Conflict, "job " + r.id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

Result PgRepository::UpsertWorker(Transaction& t, const model::WorkerRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_worker", r.id, r.endpoint, util::JoinTags(r.tags), r.capacity, r.last_heartbeat_ms,
                               r.last_dispatch_ms, r.suspect);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::WorkerRecord> PgRepository::GetWorker(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_worker", id);
  if (res.empty()) return std::nullopt;
  return ReadWorker(res[0]);
}

std::vector<model::WorkerRecord> PgRepository::ListWorkers(Transaction& t) {
  auto                             res = TX(t).Work().exec_prepared("list_workers");
  std::vector<model::WorkerRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadWorker(row));
  }
  return out;
}

Result PgRepository::AcquireWorkerSlot(Transaction& t, const std::string& id, uint64_t now_ms) {
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_prepared("acquire_slot", id, now_ms);
    if (res.affected_rows() == 0) {
      return work.exec_prepared("get_worker", id).empty() ? Result::Err(ErrorCode::NotFound, "worker " + id)
                                                          : Result::Err(ErrorCode::Exhausted, "worker " + id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ReleaseWorkerSlot(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_prepared("release_slot", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SetWorkerSuspect(Transaction& t, const std::string& id, bool suspect) {
  try {
    auto res = TX(t).Work().exec_prepared("set_suspect", id, suspect);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "worker " + id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteWorker(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_prepared("delete_worker", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace jobsrv::db::postgres
