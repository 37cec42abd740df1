#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "worker_registry.hpp"

namespace jobsrv::worker {

/*
  Background thread that runs WorkerRegistry::Sweep on a fixed interval.
*/
class LivenessSweeper {
 public:
  LivenessSweeper(std::shared_ptr<WorkerRegistry> registry, std::chrono::milliseconds interval);
  ~LivenessSweeper();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<WorkerRegistry> registry_;
  std::chrono::milliseconds       interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace jobsrv::worker
