#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/group_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/worker_record.hpp"

namespace jobsrv::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - Update* is compare-and-set on the row version: a row whose stored
    version differs from expected_version is left untouched and the call
    returns ErrorCode::Conflict
  - Worker slot accounting never lets load exceed capacity

  The DB is the source of truth for:
    groups and their derived state
    jobs, their dependencies and assignments
    workers and their load
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Groups
  // ---------------------------------------------------------------------

  virtual Result InsertGroup(Transaction&, const model::GroupRecord&) = 0;

  virtual std::optional<model::GroupRecord> GetGroup(Transaction&, const std::string& id) = 0;

  virtual Result UpdateGroup(Transaction&, const model::GroupRecord&, uint64_t expected_version) = 0;

  // Groups not yet terminal, oldest first.
  virtual std::vector<model::GroupRecord> ListOpenGroups(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------

  // Inserts the job row and its dependency rows.
  virtual Result InsertJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& id) = 0;

  // Ordered by ordinal.
  virtual std::vector<model::JobRecord> ListGroupJobs(Transaction&, const std::string& group_id) = 0;

  // Ordered by group creation time, then group id, then ordinal.
  virtual std::vector<model::JobRecord> ListJobsByState(Transaction&, jobsrv::v1::JobState state) = 0;

  // Jobs currently held by the worker (Dispatched or Running).
  virtual std::vector<model::JobRecord> ListWorkerJobs(Transaction&, const std::string& worker_id) = 0;

  // Dependencies are immutable and are not rewritten.
  virtual Result UpdateJob(Transaction&, const model::JobRecord&, uint64_t expected_version) = 0;

  // ---------------------------------------------------------------------
  // Workers
  // ---------------------------------------------------------------------

  // Creates the worker with load 0, or refreshes endpoint/tags/capacity/
  // heartbeat/suspect of an existing one. load and last_dispatch_ms are kept;
  // a capacity below the current load is stored as the load.
  virtual Result UpsertWorker(Transaction&, const model::WorkerRecord&) = 0;

  virtual std::optional<model::WorkerRecord> GetWorker(Transaction&, const std::string& id) = 0;

  // Ordered by id.
  virtual std::vector<model::WorkerRecord> ListWorkers(Transaction&) = 0;

  // load += 1 and last_dispatch_ms = now_ms if load < capacity.
  // NotFound for an unknown worker, Exhausted when full.
  virtual Result AcquireWorkerSlot(Transaction&, const std::string& id, uint64_t now_ms) = 0;

  // load -= 1, floored at zero. Unknown workers are ignored.
  virtual Result ReleaseWorkerSlot(Transaction&, const std::string& id) = 0;

  virtual Result SetWorkerSuspect(Transaction&, const std::string& id, bool suspect) = 0;

  virtual Result DeleteWorker(Transaction&, const std::string& id) = 0;
};

} // namespace jobsrv::db
