#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>

#include "jobsrv/v1.hpp"

namespace jobsrv::ingest {

// One queued worker message.
struct Envelope {
  enum class Kind { kReport, kHeartbeat };

  Kind                  kind = Kind::kReport;
  jobsrv::v1::JobReport report;
  jobsrv::v1::Heartbeat heartbeat;
};

/*
  Thread-safe blocking FIFO feeding one ingest shard.
*/
class ReportQueue {
 public:
  void Enqueue(Envelope envelope);

  // blocking wait; nullopt once shut down and drained
  std::optional<Envelope> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<Envelope>    queue_;
  bool                    shutdown_ = false;
};

} // namespace jobsrv::ingest
