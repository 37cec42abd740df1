#pragma once

#include <exception>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace jobsrv::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
