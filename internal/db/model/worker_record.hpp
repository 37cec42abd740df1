#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace jobsrv::db::model {

/*
  Persistent worker row.

  load counts jobs the worker currently holds (Dispatched or Running) and
  never exceeds capacity; it only changes in the same commit as the job rows.
*/
struct WorkerRecord {
  std::string              id;
  std::string              endpoint;
  std::vector<std::string> tags;

  uint32_t capacity = 0;
  uint32_t load     = 0;

  uint64_t last_heartbeat_ms = 0;
  uint64_t last_dispatch_ms  = 0;

  // Last send failed; excluded from matching until the next heartbeat.
  bool suspect = false;
};

} // namespace jobsrv::db::model
