#include "pg_pool.hpp"

namespace jobsrv::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    lock.unlock();

    // Server may have dropped it while idle.
    if (conn->is_open()) {
      return Wrap(conn.release());
    }
    conn.reset();
    lock.lock();
    --live_connections_;
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (...) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  static constexpr const char* kJobColumns =
      "id,group_id,ordinal,project,target,tags,inputs_ref,state,worker_id,retry_count,failure_reason,artifact_ref,"
      "created_at_ms,dispatched_at_ms,started_at_ms,completed_at_ms,version";
  static constexpr const char* kGroupColumns = "id,state,target,cancel_requested,created_at_ms,completed_at_ms,version";
  static constexpr const char* kWorkerColumns = "id,endpoint,tags,capacity,load,last_heartbeat_ms,last_dispatch_ms,suspect";

  const std::string job_columns(kJobColumns);
  const std::string group_columns(kGroupColumns);
  const std::string worker_columns(kWorkerColumns);

  conn.prepare("insert_group", "INSERT INTO job_groups(" + group_columns + ") VALUES($1,$2,$3,$4,$5,$6,$7)");
  conn.prepare("get_group", "SELECT " + group_columns + " FROM job_groups WHERE id=$1");
  conn.prepare("update_group",
               "UPDATE job_groups SET state=$2,cancel_requested=$3,completed_at_ms=$4,version=$5 WHERE id=$1 AND version=$6");
  conn.prepare("open_groups", "SELECT " + group_columns + " FROM job_groups WHERE state IN ($1,$2) ORDER BY created_at_ms, id");

  conn.prepare("insert_job", "INSERT INTO jobs(" + job_columns +
                                 ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17)");
  conn.prepare("insert_dependency", "INSERT INTO job_dependencies(job_id,depends_on_job_id,position) VALUES($1,$2,$3)");
  conn.prepare("get_job", "SELECT " + job_columns + " FROM jobs WHERE id=$1");
  conn.prepare("group_jobs", "SELECT " + job_columns + " FROM jobs WHERE group_id=$1 ORDER BY ordinal");
  conn.prepare("jobs_by_state", "SELECT " + job_columns + " FROM jobs WHERE state=$1 ORDER BY created_at_ms, group_id, ordinal");
  conn.prepare("worker_jobs", "SELECT " + job_columns + " FROM jobs WHERE worker_id=$1 AND state IN ($2,$3) ORDER BY id");
  conn.prepare("job_dependencies", "SELECT depends_on_job_id FROM job_dependencies WHERE job_id=$1 ORDER BY position");
  conn.prepare("update_job",
               "UPDATE jobs SET state=$2,worker_id=$3,retry_count=$4,failure_reason=$5,artifact_ref=$6,"
               "dispatched_at_ms=$7,started_at_ms=$8,completed_at_ms=$9,version=$10 WHERE id=$1 AND version=$11");

  conn.prepare("upsert_worker",
               "INSERT INTO workers(id,endpoint,tags,capacity,load,last_heartbeat_ms,last_dispatch_ms,suspect)"
               " VALUES($1,$2,$3,$4,0,$5,$6,$7)"
               " ON CONFLICT(id) DO UPDATE SET endpoint=EXCLUDED.endpoint,tags=EXCLUDED.tags,"
               "capacity=GREATEST(EXCLUDED.capacity,workers.load),"
               "last_heartbeat_ms=EXCLUDED.last_heartbeat_ms,suspect=EXCLUDED.suspect");
  conn.prepare("get_worker", "SELECT " + worker_columns + " FROM workers WHERE id=$1");
  conn.prepare("list_workers", "SELECT " + worker_columns + " FROM workers ORDER BY id");
  conn.prepare("acquire_slot", "UPDATE workers SET load=load+1,last_dispatch_ms=$2 WHERE id=$1 AND load<capacity");
  conn.prepare("release_slot", "UPDATE workers SET load=load-1 WHERE id=$1 AND load>0");
  conn.prepare("set_suspect", "UPDATE workers SET suspect=$2 WHERE id=$1");
  conn.prepare("delete_worker", "DELETE FROM workers WHERE id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace jobsrv::db::postgres
