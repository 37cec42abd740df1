#pragma once

namespace jobsrv::db::sql {

/*
  Canonical SQL for the SQLite backend (positional '?').

  Column lists are kept in one place so row readers and statements agree.
*/

#define JOBSRV_GROUP_COLUMNS "id,state,target,cancel_requested,created_at_ms,completed_at_ms,version"

#define JOBSRV_JOB_COLUMNS                                                                                       \
  "id,group_id,ordinal,project,target,tags,inputs_ref,state,worker_id,retry_count,failure_reason,artifact_ref," \
  "created_at_ms,dispatched_at_ms,started_at_ms,completed_at_ms,version"

#define JOBSRV_WORKER_COLUMNS "id,endpoint,tags,capacity,load,last_heartbeat_ms,last_dispatch_ms,suspect"

// groups

static constexpr const char* INSERT_GROUP = "INSERT INTO job_groups(" JOBSRV_GROUP_COLUMNS ") VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_GROUP = "SELECT " JOBSRV_GROUP_COLUMNS " FROM job_groups WHERE id=?;";

static constexpr const char* UPDATE_GROUP =
    "UPDATE job_groups SET state=?,cancel_requested=?,completed_at_ms=?,version=?"
    " WHERE id=? AND version=?;";

static constexpr const char* SELECT_OPEN_GROUPS =
    "SELECT " JOBSRV_GROUP_COLUMNS " FROM job_groups WHERE state IN (?,?) ORDER BY created_at_ms, id;";

static constexpr const char* GROUP_EXISTS = "SELECT 1 FROM job_groups WHERE id=?;";

// jobs

static constexpr const char* INSERT_JOB = "INSERT INTO jobs(" JOBSRV_JOB_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* INSERT_DEPENDENCY = "INSERT INTO job_dependencies(job_id,depends_on_job_id,position) VALUES(?,?,?);";

static constexpr const char* SELECT_JOB = "SELECT " JOBSRV_JOB_COLUMNS " FROM jobs WHERE id=?;";

static constexpr const char* SELECT_GROUP_JOBS = "SELECT " JOBSRV_JOB_COLUMNS " FROM jobs WHERE group_id=? ORDER BY ordinal;";

static constexpr const char* SELECT_JOBS_BY_STATE =
    "SELECT " JOBSRV_JOB_COLUMNS " FROM jobs WHERE state=? ORDER BY created_at_ms, group_id, ordinal;";

static constexpr const char* SELECT_WORKER_JOBS =
    "SELECT " JOBSRV_JOB_COLUMNS " FROM jobs WHERE worker_id=? AND state IN (?,?) ORDER BY id;";

static constexpr const char* SELECT_DEPENDENCIES =
    "SELECT depends_on_job_id FROM job_dependencies WHERE job_id=? ORDER BY position;";

static constexpr const char* UPDATE_JOB =
    "UPDATE jobs SET state=?,worker_id=?,retry_count=?,failure_reason=?,artifact_ref=?,"
    "dispatched_at_ms=?,started_at_ms=?,completed_at_ms=?,version=?"
    " WHERE id=? AND version=?;";

static constexpr const char* JOB_EXISTS = "SELECT 1 FROM jobs WHERE id=?;";

// workers

static constexpr const char* UPSERT_WORKER =
    "INSERT INTO workers(id,endpoint,tags,capacity,load,last_heartbeat_ms,last_dispatch_ms,suspect)"
    " VALUES(?,?,?,?,0,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " endpoint=excluded.endpoint,"
    " tags=excluded.tags,"
    " capacity=MAX(excluded.capacity,workers.load),"
    " last_heartbeat_ms=excluded.last_heartbeat_ms,"
    " suspect=excluded.suspect;";

static constexpr const char* SELECT_WORKER = "SELECT " JOBSRV_WORKER_COLUMNS " FROM workers WHERE id=?;";

static constexpr const char* SELECT_WORKERS = "SELECT " JOBSRV_WORKER_COLUMNS " FROM workers ORDER BY id;";

static constexpr const char* ACQUIRE_WORKER_SLOT =
    "UPDATE workers SET load=load+1,last_dispatch_ms=? WHERE id=? AND load<capacity;";

static constexpr const char* RELEASE_WORKER_SLOT = "UPDATE workers SET load=load-1 WHERE id=? AND load>0;";

static constexpr const char* SET_WORKER_SUSPECT = "UPDATE workers SET suspect=? WHERE id=?;";

static constexpr const char* DELETE_WORKER = "DELETE FROM workers WHERE id=?;";

static constexpr const char* WORKER_EXISTS = "SELECT 1 FROM workers WHERE id=?;";

} // namespace jobsrv::db::sql
