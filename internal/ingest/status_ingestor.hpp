#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/ingest/report_queue.hpp"
#include "internal/scheduler/scheduler.hpp"
#include "internal/worker/worker_registry.hpp"

namespace jobsrv::ingest {

/*
  StatusIngestor

  Consumes worker reports and heartbeats. Messages are sharded by key (job id
  for reports, worker id for heartbeats) onto FIFO queues with one consumer
  thread each, so everything about one job is handled in arrival order while
  unrelated jobs proceed in parallel.

  Submit() validates synchronously and enqueues. A message that fails in its
  consumer stays at the head of its shard and is retried with backoff, so an
  acknowledged report survives a store outage and later messages for the same
  job wait behind it. Only messages that can never apply (validation, unknown
  or terminal records) are logged and dropped. Before Start() and after
  Stop() Submit() handles the message inline and errors reach the caller.
*/
class StatusIngestor {
 public:
  StatusIngestor(std::shared_ptr<scheduler::Scheduler> scheduler, std::shared_ptr<worker::WorkerRegistry> registry, size_t shards);
  ~StatusIngestor();

  void Start();
  // Handles everything already queued, then joins the consumers. Final. A
  // message still failing after one more attempt is dropped with an error.
  void Stop();

  void Submit(const jobsrv::v1::JobReport& report);
  void Submit(const jobsrv::v1::Heartbeat& heartbeat);

  // Synchronous handling, bypassing the queues.
  scheduler::ReportOutcome Process(const jobsrv::v1::JobReport& report, uint64_t now_ms);
  bool                     Process(const jobsrv::v1::Heartbeat& heartbeat, uint64_t now_ms);

  // Blocks until every message submitted so far has been handled, or sits in
  // a stalled shard whose retry failed again after Drain() was called.
  // Stalled shards retry immediately.
  void Drain();

  // Shards currently holding a message whose last attempt failed.
  size_t StalledShards();

  size_t Shards() const {
    return queues_.size();
  }

 private:
  struct ShardState {
    size_t   pending      = 0;
    bool     stalled      = false;
    uint64_t failed_epoch = 0; // drain epoch of the last failed attempt
  };

  static constexpr std::chrono::milliseconds kRetryBackoffMin{50};
  static constexpr std::chrono::milliseconds kRetryBackoffMax{5000};

  size_t ShardFor(const std::string& key) const;
  void   Dispatch(const std::string& key, Envelope envelope);
  void   Handle(const Envelope& envelope);
  // true when the message is done with, applied or rejected for good
  bool Attempt(const Envelope& envelope, uint32_t attempt);
  // false once stopping; the message is then dropped
  bool WaitForRetry(size_t shard, uint32_t attempt);
  void Run(size_t shard);

  std::shared_ptr<scheduler::Scheduler>   scheduler_;
  std::shared_ptr<worker::WorkerRegistry> registry_;

  std::vector<std::unique_ptr<ReportQueue>> queues_;
  std::vector<std::thread>                  threads_;

  std::shared_mutex lifecycle_mutex_;
  bool              running_ = false;
  bool              stopped_ = false;

  std::mutex              state_mutex_;
  std::condition_variable drained_cv_;
  std::condition_variable retry_cv_;
  std::vector<ShardState> shard_state_;
  uint64_t                drain_epoch_ = 0;
  bool                    stopping_    = false;
};

} // namespace jobsrv::ingest
