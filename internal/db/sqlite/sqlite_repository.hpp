#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace jobsrv::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertGroup(Transaction&, const model::GroupRecord&) override;
  std::optional<model::GroupRecord> GetGroup(Transaction&, const std::string&) override;
  Result UpdateGroup(Transaction&, const model::GroupRecord&, uint64_t expected_version) override;
  std::vector<model::GroupRecord> ListOpenGroups(Transaction&) override;

  Result InsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string&) override;
  std::vector<model::JobRecord> ListGroupJobs(Transaction&, const std::string& group_id) override;
  std::vector<model::JobRecord> ListJobsByState(Transaction&, jobsrv::v1::JobState state) override;
  std::vector<model::JobRecord> ListWorkerJobs(Transaction&, const std::string& worker_id) override;
  Result UpdateJob(Transaction&, const model::JobRecord&, uint64_t expected_version) override;

  Result UpsertWorker(Transaction&, const model::WorkerRecord&) override;
  std::optional<model::WorkerRecord> GetWorker(Transaction&, const std::string&) override;
  std::vector<model::WorkerRecord> ListWorkers(Transaction&) override;
  Result AcquireWorkerSlot(Transaction&, const std::string& id, uint64_t now_ms) override;
  Result ReleaseWorkerSlot(Transaction&, const std::string& id) override;
  Result SetWorkerSuspect(Transaction&, const std::string& id, bool suspect) override;
  Result DeleteWorker(Transaction&, const std::string& id) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
