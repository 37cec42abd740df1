#pragma once

#include <cstdint>
#include <string>

#include "jobsrv/v1.hpp"

namespace jobsrv::db::model {

/*
  Persistent group row.

  state is derived from member jobs and rewritten in the same commit as the
  job transitions that change it. version is bumped on every update.
*/
struct GroupRecord {
  std::string id;

  jobsrv::v1::GroupState state = jobsrv::v1::GROUP_STATE_QUEUED;

  std::string target;
  bool        cancel_requested = false;

  uint64_t created_at_ms   = 0;
  uint64_t completed_at_ms = 0; // 0 = still open

  uint64_t version = 0;
};

} // namespace jobsrv::db::model
