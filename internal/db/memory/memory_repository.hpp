#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace jobsrv::db::memory {

class MemoryTransaction;

/*
  In-process backend used by tests and by deployments that accept losing
  state on restart. Same contract as the SQL backends.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::GroupRecord> groups;
    std::unordered_map<std::string, model::JobRecord>   jobs;
    std::map<std::string, model::WorkerRecord>          workers;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
