#include "liveness_sweeper.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace jobsrv::worker {

LivenessSweeper::LivenessSweeper(std::shared_ptr<WorkerRegistry> registry, std::chrono::milliseconds interval)
    : registry_(std::move(registry)), interval_(interval) {
}

LivenessSweeper::~LivenessSweeper() {
  Stop();
}

void LivenessSweeper::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&LivenessSweeper::Run, this);
}

void LivenessSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void LivenessSweeper::Run() {
  while (running_) {
    {
      std::unique_lock lock(mutex_);
      cv_.wait_for(lock, interval_, [&] { return !running_; });
      if (!running_) break;
    }

    try {
      registry_->Sweep(util::NowMillis());
    } catch (const std::exception& e) {
      JOBSRV_LOG_ERROR("liveness sweep failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace jobsrv::worker
