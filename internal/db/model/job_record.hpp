#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "jobsrv/v1.hpp"

namespace jobsrv::db::model {

/*
  Persistent job row plus its dependency rows.

  - dependencies is fixed at creation (job_dependencies, ordered by position)
  - worker_id is empty when no worker holds or held the job
  - timestamps are unix ms, 0 = unset
*/
struct JobRecord {
  std::string id;
  std::string group_id;
  uint32_t    ordinal = 0;

  std::string              project;
  std::string              target;
  std::vector<std::string> tags;
  std::string              inputs_ref;

  std::vector<std::string> dependencies;

  jobsrv::v1::JobState state = jobsrv::v1::JOB_STATE_PENDING;

  std::string worker_id;
  uint32_t    retry_count = 0;
  std::string failure_reason;
  std::string artifact_ref;

  uint64_t created_at_ms    = 0;
  uint64_t dispatched_at_ms = 0;
  uint64_t started_at_ms    = 0;
  uint64_t completed_at_ms  = 0;

  uint64_t version = 0;
};

} // namespace jobsrv::db::model
