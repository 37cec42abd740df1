#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "dispatcher.hpp"

namespace jobsrv::dispatch {

/*
  Background dispatch loop.

  Runs a pass every interval, or sooner when Notify() reports new Ready
  jobs. Notifications arriving during a pass collapse into one more pass.
*/
class DispatchWorker {
 public:
  DispatchWorker(std::shared_ptr<Dispatcher> dispatcher, std::chrono::milliseconds interval);
  ~DispatchWorker();

  void Start();
  void Stop();

  void Notify();

 private:
  void Run();

  std::shared_ptr<Dispatcher> dispatcher_;
  std::chrono::milliseconds   interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    wake_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace jobsrv::dispatch
