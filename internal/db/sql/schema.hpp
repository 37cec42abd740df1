#pragma once

#include <string>
#include <vector>

namespace jobsrv::db::sql {

/*
  Logical schema, one statement per entry, applied at start-up.

  job_groups is the groups table; "groups" is a keyword in recent SQL
  dialects. Nullable timestamps are NULL until set.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS job_groups ("
      " id TEXT PRIMARY KEY, state INTEGER NOT NULL, target TEXT NOT NULL,"
      " cancel_requested INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL,"
      " completed_at_ms INTEGER, version INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS jobs ("
      " id TEXT PRIMARY KEY, group_id TEXT NOT NULL REFERENCES job_groups(id), ordinal INTEGER NOT NULL,"
      " project TEXT NOT NULL, target TEXT NOT NULL, tags TEXT NOT NULL, inputs_ref TEXT NOT NULL,"
      " state INTEGER NOT NULL, worker_id TEXT, retry_count INTEGER NOT NULL,"
      " failure_reason TEXT NOT NULL, artifact_ref TEXT NOT NULL, created_at_ms INTEGER NOT NULL,"
      " dispatched_at_ms INTEGER, started_at_ms INTEGER, completed_at_ms INTEGER, version INTEGER NOT NULL,"
      " UNIQUE(group_id, ordinal));",

      "CREATE TABLE IF NOT EXISTS job_dependencies ("
      " job_id TEXT NOT NULL REFERENCES jobs(id), depends_on_job_id TEXT NOT NULL REFERENCES jobs(id),"
      " position INTEGER NOT NULL, PRIMARY KEY(job_id, position));",

      "CREATE TABLE IF NOT EXISTS workers ("
      " id TEXT PRIMARY KEY, endpoint TEXT NOT NULL, tags TEXT NOT NULL, capacity INTEGER NOT NULL,"
      " load INTEGER NOT NULL DEFAULT 0, last_heartbeat_ms INTEGER NOT NULL,"
      " last_dispatch_ms INTEGER NOT NULL DEFAULT 0, suspect INTEGER NOT NULL DEFAULT 0);",

      "CREATE INDEX IF NOT EXISTS jobs_by_state ON jobs(state, created_at_ms, group_id, ordinal);",
      "CREATE INDEX IF NOT EXISTS jobs_by_worker ON jobs(worker_id);",
  };
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS job_groups ("
      " id TEXT PRIMARY KEY, state SMALLINT NOT NULL, target TEXT NOT NULL,"
      " cancel_requested BOOLEAN NOT NULL DEFAULT FALSE, created_at_ms BIGINT NOT NULL,"
      " completed_at_ms BIGINT, version BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS jobs ("
      " id TEXT PRIMARY KEY, group_id TEXT NOT NULL REFERENCES job_groups(id), ordinal INTEGER NOT NULL,"
      " project TEXT NOT NULL, target TEXT NOT NULL, tags TEXT NOT NULL, inputs_ref TEXT NOT NULL,"
      " state SMALLINT NOT NULL, worker_id TEXT, retry_count INTEGER NOT NULL,"
      " failure_reason TEXT NOT NULL, artifact_ref TEXT NOT NULL, created_at_ms BIGINT NOT NULL,"
      " dispatched_at_ms BIGINT, started_at_ms BIGINT, completed_at_ms BIGINT, version BIGINT NOT NULL,"
      " UNIQUE(group_id, ordinal));",

      "CREATE TABLE IF NOT EXISTS job_dependencies ("
      " job_id TEXT NOT NULL REFERENCES jobs(id), depends_on_job_id TEXT NOT NULL REFERENCES jobs(id),"
      " position INTEGER NOT NULL, PRIMARY KEY(job_id, position));",

      "CREATE TABLE IF NOT EXISTS workers ("
      " id TEXT PRIMARY KEY, endpoint TEXT NOT NULL, tags TEXT NOT NULL, capacity INTEGER NOT NULL,"
      " load INTEGER NOT NULL DEFAULT 0, last_heartbeat_ms BIGINT NOT NULL,"
      " last_dispatch_ms BIGINT NOT NULL DEFAULT 0, suspect BOOLEAN NOT NULL DEFAULT FALSE);",

      "CREATE INDEX IF NOT EXISTS jobs_by_state ON jobs(state, created_at_ms, group_id, ordinal);",
      "CREATE INDEX IF NOT EXISTS jobs_by_worker ON jobs(worker_id);",
  };
  return kSchema;
}

} // namespace jobsrv::db::sql
