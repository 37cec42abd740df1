#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/tags.hpp"

namespace jobsrv::db::sqlite {

using jobsrv::db::ErrorCode;
using jobsrv::db::Result;

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Prepared() const {
    return rc_ == SQLITE_OK && st_ != nullptr;
  }

  sqlite3_stmt* get() const {
    return st_;
  }

  int Step() {
    return sqlite3_step(st_);
  }

 private:
  sqlite3*      db_ = nullptr;
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_ERROR;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptionalU64(sqlite3_stmt* st, int idx, uint64_t v) {
  if (v == 0) {
    sqlite3_bind_null(st, idx);
  } else {
    BindU64(st, idx, v);
  }
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

[[noreturn]] void ThrowRead(sqlite3* db, const char* what) {
  throw std::runtime_error(std::string("sqlite read ") + what + ": " + sqlite3_errmsg(db));
}

model::GroupRecord ReadGroup(sqlite3_stmt* st) {
  model::GroupRecord r;
  r.id               = ColText(st, 0);
  r.state            = static_cast<jobsrv::v1::GroupState>(ColI32(st, 1));
  r.target           = ColText(st, 2);
  r.cancel_requested = ColI32(st, 3) != 0;
  r.created_at_ms    = ColU64(st, 4);
  r.completed_at_ms  = ColU64(st, 5);
  r.version          = ColU64(st, 6);
  return r;
}

model::JobRecord ReadJob(sqlite3_stmt* st) {
  model::JobRecord r;
  r.id               = ColText(st, 0);
  r.group_id         = ColText(st, 1);
  r.ordinal          = static_cast<uint32_t>(ColI32(st, 2));
  r.project          = ColText(st, 3);
  r.target           = ColText(st, 4);
  r.tags             = util::SplitTags(ColText(st, 5));
  r.inputs_ref       = ColText(st, 6);
  r.state            = static_cast<jobsrv::v1::JobState>(ColI32(st, 7));
  r.worker_id        = ColText(st, 8);
  r.retry_count      = static_cast<uint32_t>(ColI32(st, 9));
  r.failure_reason   = ColText(st, 10);
  r.artifact_ref     = ColText(st, 11);
  r.created_at_ms    = ColU64(st, 12);
  r.dispatched_at_ms = ColU64(st, 13);
  r.started_at_ms    = ColU64(st, 14);
  r.completed_at_ms  = ColU64(st, 15);
  r.version          = ColU64(st, 16);
  return r;
}

model::WorkerRecord ReadWorker(sqlite3_stmt* st) {
  model::WorkerRecord r;
  r.id                = ColText(st, 0);
  r.endpoint          = ColText(st, 1);
  r.tags              = util::SplitTags(ColText(st, 2));
  r.capacity          = static_cast<uint32_t>(ColI32(st, 3));
  r.load              = static_cast<uint32_t>(ColI32(st, 4));
  r.last_heartbeat_ms = ColU64(st, 5);
  r.last_dispatch_ms  = ColU64(st, 6);
  r.suspect           = ColI32(st, 7) != 0;
  return r;
}

std::vector<std::string> LoadDependencies(sqlite3* db, const std::string& job_id) {
  Statement stmt(db, sql::SELECT_DEPENDENCIES);
  if (!stmt.Prepared()) ThrowRead(db, "dependencies");
  BindText(stmt.get(), 1, job_id);

  std::vector<std::string> out;
  int                      rc;
  while ((rc = stmt.Step()) == SQLITE_ROW) {
    out.push_back(ColText(stmt.get(), 0));
  }
  if (rc != SQLITE_DONE) ThrowRead(db, "dependencies");
  return out;
}

std::vector<model::JobRecord> CollectJobs(sqlite3* db, Statement& stmt) {
  std::vector<model::JobRecord> out;
  int                           rc;
  while ((rc = stmt.Step()) == SQLITE_ROW) {
    out.push_back(ReadJob(stmt.get()));
  }
  if (rc != SQLITE_DONE) ThrowRead(db, "jobs");

  for (auto& job : out) {
    job.dependencies = LoadDependencies(db, job.id);
  }
  return out;
}

bool Exists(sqlite3* db, const char* sql, const std::string& id) {
  Statement stmt(db, sql);
  if (!stmt.Prepared()) ThrowRead(db, "exists");
  BindText(stmt.get(), 1, id);
  return stmt.Step() == SQLITE_ROW;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (int ext = sqlite3_extended_errcode(db); ext == SQLITE_CONSTRAINT_PRIMARYKEY || ext == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Groups
// ------------------------------------------------------------------

Result SqliteRepository::InsertGroup(Transaction& t, const model::GroupRecord& r) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::INSERT_GROUP);
  if (!stmt.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  auto* st = stmt.get();
  BindText(st, 1, r.id);
  BindI32(st, 2, static_cast<int>(r.state));
  BindText(st, 3, r.target);
  BindI32(st, 4, r.cancel_requested ? 1 : 0);
  BindU64(st, 5, r.created_at_ms);
  BindOptionalU64(st, 6, r.completed_at_ms);
  BindU64(st, 7, r.version);

  return Translate(db, stmt.Step());
}

std::optional<model::GroupRecord> SqliteRepository::GetGroup(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::SELECT_GROUP);
  if (!stmt.Prepared()) ThrowRead(db, "group");
  BindText(stmt.get(), 1, id);

  int rc = stmt.Step();
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowRead(db, "group");
  return ReadGroup(stmt.get());
}

Result SqliteRepository::UpdateGroup(Transaction& t, const model::GroupRecord& r, uint64_t expected_version) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::UPDATE_GROUP);
  if (!stmt.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  auto* st = stmt.get();
  BindI32(st, 1, static_cast<int>(r.state));
  BindI32(st, 2, r.cancel_requested ? 1 : 0);
  BindOptionalU64(st, 3, r.completed_at_ms);
  BindU64(st, 4, r.version);
  BindText(st, 5, r.id);
  BindU64(st, 6, expected_version);

  auto result = Translate(db, stmt.Step());
  if (!result) return result;
  if (sqlite3_changes(db) == 0) {
    return Exists(db, sql::GROUP_EXISTS, r.id) ? Result::Err(ErrorCode::Conflict, "group " + r.id)
                                               : Result::Err(ErrorCode::NotFound, "group " + r.id);
  }
  return Result::Ok();
}

std::vector<model::GroupRecord> SqliteRepository::ListOpenGroups(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::SELECT_OPEN_GROUPS);
  if (!stmt.Prepared()) ThrowRead(db, "open groups");
  BindI32(stmt.get(), 1, jobsrv::v1::GROUP_STATE_QUEUED);
  BindI32(stmt.get(), 2, jobsrv::v1::GROUP_STATE_CANCEL_REQUESTED);

  std::vector<model::GroupRecord> out;
  int                             rc;
  while ((rc = stmt.Step()) == SQLITE_ROW) {
    out.push_back(ReadGroup(stmt.get()));
  }
  if (rc != SQLITE_DONE) ThrowRead(db, "open groups");
  return out;
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  auto* db = TX(t).Handle();
  {
    Statement stmt(db, sql::INSERT_JOB);
    if (!stmt.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    auto* st = stmt.get();
    BindText(st, 1, r.id);
    BindText(st, 2, r.group_id);
    BindI32(st, 3, static_cast<int>(r.ordinal));
    BindText(st, 4, r.project);
    BindText(st, 5, r.target);
    BindText(st, 6, util::JoinTags(r.tags));
    BindText(st, 7, r.inputs_ref);
    BindI32(st, 8, static_cast<int>(r.state));
    BindOptionalText(st, 9, r.worker_id);
    BindI32(st, 10, static_cast<int>(r.retry_count));
    BindText(st, 11, r.failure_reason);
    BindText(st, 12, r.artifact_ref);
    BindU64(st, 13, r.created_at_ms);
    BindOptionalU64(st, 14, r.dispatched_at_ms);
    BindOptionalU64(st, 15, r.started_at_ms);
    BindOptionalU64(st, 16, r.completed_at_ms);
    BindU64(st, 17, r.version);

    auto result = Translate(db, stmt.Step());
    if (!result) return result;
  }

  for (size_t i = 0; i < r.dependencies.size(); ++i) {
    Statement stmt(db, sql::INSERT_DEPENDENCY);
    if (!stmt.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(stmt.get(), 1, r.id);
    BindText(stmt.get(), 2, r.dependencies[i]);
    BindI32(stmt.get(), 3, static_cast<int>(i));

    auto result = Translate(db, stmt.Step());
    if (!result) return result;
  }
  return Result::Ok();
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::SELECT_JOB);
  if (!stmt.Prepared()) ThrowRead(db, "job");
  BindText(stmt.get(), 1, id);

  int rc = stmt.Step();
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowRead(db, "job");

  auto job         = ReadJob(stmt.get());
  job.dependencies = LoadDependencies(db, job.id);
  return job;
}

std::vector<model::JobRecord> SqliteRepository::ListGroupJobs(Transaction& t, const std::string& group_id) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::SELECT_GROUP_JOBS);
  if (!stmt.Prepared()) ThrowRead(db, "group jobs");
  BindText(stmt.get(), 1, group_id);
  return CollectJobs(db, stmt);
}

std::vector<model::JobRecord> SqliteRepository::ListJobsByState(Transaction& t, jobsrv::v1::JobState state) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::SELECT_JOBS_BY_STATE);
  if (!stmt.Prepared()) ThrowRead(db, "jobs by state");
  BindI32(stmt.get(), 1, static_cast<int>(state));
  return CollectJobs(db, stmt);
}

std::vector<model::JobRecord> SqliteRepository::ListWorkerJobs(Transaction& t, const std::string& worker_id) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::SELECT_WORKER_JOBS);
  if (!stmt.Prepared()) ThrowRead(db, "worker jobs");
  BindText(stmt.get(), 1, worker_id);
  BindI32(stmt.get(), 2, jobsrv::v1::JOB_STATE_DISPATCHED);
  BindI32(stmt.get(), 3, jobsrv::v1::JOB_STATE_RUNNING);
  return CollectJobs(db, stmt);
}

Result SqliteRepository::UpdateJob(Transaction& t, const model::JobRecord& r, uint64_t expected_version) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::UPDATE_JOB);
  if (!stmt.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  auto* st = stmt.get();
  BindI32(st, 1, static_cast<int>(r.state));
  BindOptionalText(st, 2, r.worker_id);
  BindI32(st, 3, static_cast<int>(r.retry_count));
  BindText(st, 4, r.failure_reason);
  BindText(st, 5, r.artifact_ref);
  BindOptionalU64(st, 6, r.dispatched_at_ms);
  BindOptionalU64(st, 7, r.started_at_ms);
  BindOptionalU64(st, 8, r.completed_at_ms);
  BindU64(st, 9, r.version);
  BindText(st, 10, r.id);
  BindU64(st, 11, expected_version);

  auto result = Translate(db, stmt.Step());
  if (!result) return result;
  if (sqlite3_changes(db) == 0) {
    return Exists(db, sql::JOB_EXISTS, r.id) ? Result::Err(ErrorCode::Conflict, "job " + r.id)
                                             : Result::Err(ErrorCode::NotFound, "job " + r.id);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

Result SqliteRepository::UpsertWorker(Transaction& t, const model::WorkerRecord& r) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::UPSERT_WORKER);
  if (!stmt.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  auto* st = stmt.get();
  BindText(st, 1, r.id);
  BindText(st, 2, r.endpoint);
  BindText(st, 3, util::JoinTags(r.tags));
  BindI32(st, 4, static_cast<int>(r.capacity));
  BindU64(st, 5, r.last_heartbeat_ms);
  BindU64(st, 6, r.last_dispatch_ms);
  BindI32(st, 7, r.suspect ? 1 : 0);

  return Translate(db, stmt.Step());
}

std::optional<model::WorkerRecord> SqliteRepository::GetWorker(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::SELECT_WORKER);
  if (!stmt.Prepared()) ThrowRead(db, "worker");
  BindText(stmt.get(), 1, id);

  int rc = stmt.Step();
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowRead(db, "worker");
  return ReadWorker(stmt.get());
}

std::vector<model::WorkerRecord> SqliteRepository::ListWorkers(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::SELECT_WORKERS);
  if (!stmt.Prepared()) ThrowRead(db, "workers");

  std::vector<model::WorkerRecord> out;
  int                              rc;
  while ((rc = stmt.Step()) == SQLITE_ROW) {
    out.push_back(ReadWorker(stmt.get()));
  }
  if (rc != SQLITE_DONE) ThrowRead(db, "workers");
  return out;
}

Result SqliteRepository::AcquireWorkerSlot(Transaction& t, const std::string& id, uint64_t now_ms) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::ACQUIRE_WORKER_SLOT);
  if (!stmt.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(stmt.get(), 1, now_ms);
  BindText(stmt.get(), 2, id);

  auto result = Translate(db, stmt.Step());
  if (!result) return result;
  if (sqlite3_changes(db) == 0) {
    return Exists(db, sql::WORKER_EXISTS, id) ? Result::Err(ErrorCode::Exhausted, "worker " + id)
                                              : Result::Err(ErrorCode::NotFound, "worker " + id);
  }
  return Result::Ok();
}

Result SqliteRepository::ReleaseWorkerSlot(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::RELEASE_WORKER_SLOT);
  if (!stmt.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(stmt.get(), 1, id);
  return Translate(db, stmt.Step());
}

Result SqliteRepository::SetWorkerSuspect(Transaction& t, const std::string& id, bool suspect) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::SET_WORKER_SUSPECT);
  if (!stmt.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindI32(stmt.get(), 1, suspect ? 1 : 0);
  BindText(stmt.get(), 2, id);

  auto result = Translate(db, stmt.Step());
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "worker " + id);
  return Result::Ok();
}

Result SqliteRepository::DeleteWorker(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement stmt(db, sql::DELETE_WORKER);
  if (!stmt.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(stmt.get(), 1, id);
  return Translate(db, stmt.Step());
}

} // namespace jobsrv::db::sqlite
