#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/core/state_store.hpp"
#include "jobsrv/v1.hpp"

namespace jobsrv::worker {

/*
  Capability-tagged registry of build workers.

  The workers table is authoritative; this class owns the liveness rules on
  top of it:

    live     heartbeat within the timeout and not suspect
    suspect  last send failed; cleared by the next heartbeat
    dead     heartbeat older than the timeout; handed to the lost handler,
             which requeues its jobs and removes the row atomically
*/
class WorkerRegistry {
 public:
  // Removes the worker unless it heartbeat at or after stale_before_ms.
  // Returns false when the worker turned out to be alive.
  using LostHandler = std::function<bool(const std::string& worker_id, uint64_t stale_before_ms, uint64_t now_ms)>;

  // Throws ValidationError for a heartbeat that can never be registered.
  static void Validate(const jobsrv::v1::Heartbeat& heartbeat);

  WorkerRegistry(std::shared_ptr<core::StateStore> store, uint64_t heartbeat_timeout_ms);

  void SetLostHandler(LostHandler handler);

  // Creates the worker on first contact. Returns true for a new worker.
  bool Heartbeat(const jobsrv::v1::Heartbeat& heartbeat, uint64_t now_ms);

  // false for an unknown worker
  bool FlagSuspect(const std::string& worker_id);

  std::vector<db::model::WorkerRecord>   LiveWorkers(uint64_t now_ms);
  std::optional<db::model::WorkerRecord> Find(const std::string& worker_id);

  // Declares stale workers dead. Returns the ids handed to the lost handler.
  std::vector<std::string> Sweep(uint64_t now_ms);

  // Start-up: every persisted worker gets now_ms as its last heartbeat, a
  // grace period to reconnect before the sweep reclaims its jobs.
  size_t Hydrate(uint64_t now_ms);

  uint64_t HeartbeatTimeoutMs() const {
    return heartbeat_timeout_ms_;
  }

 private:
  bool     IsStale(const db::model::WorkerRecord& worker, uint64_t now_ms) const;
  uint64_t StaleBefore(uint64_t now_ms) const;
  void Track(const std::string& worker_id, bool known);

  std::shared_ptr<core::StateStore> store_;
  uint64_t                          heartbeat_timeout_ms_;

  std::mutex                      mutex_;
  LostHandler                     lost_handler_;
  std::unordered_set<std::string> known_;
};

} // namespace jobsrv::worker
