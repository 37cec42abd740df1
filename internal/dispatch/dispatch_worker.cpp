#include "dispatch_worker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace jobsrv::dispatch {

DispatchWorker::DispatchWorker(std::shared_ptr<Dispatcher> dispatcher, std::chrono::milliseconds interval)
    : dispatcher_(std::move(dispatcher)), interval_(interval) {
}

DispatchWorker::~DispatchWorker() {
  Stop();
}

void DispatchWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&DispatchWorker::Run, this);
}

void DispatchWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void DispatchWorker::Notify() {
  {
    std::lock_guard lock(mutex_);
    wake_ = true;
  }
  cv_.notify_one();
}

void DispatchWorker::Run() {
  while (running_) {
    {
      std::unique_lock lock(mutex_);
      cv_.wait_for(lock, interval_, [&] { return wake_ || !running_; });
      if (!running_) break;
      wake_ = false;
    }

    try {
      dispatcher_->RunPass(util::NowMillis());
    } catch (const std::exception& e) {
      JOBSRV_LOG_ERROR("dispatch pass failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace jobsrv::dispatch
