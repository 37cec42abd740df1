#include "report_queue.hpp"

namespace jobsrv::ingest {

void ReportQueue::Enqueue(Envelope envelope) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(envelope));
  }
  cv_.notify_one();
}

std::optional<Envelope> ReportQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  Envelope envelope = std::move(queue_.front());
  queue_.pop();
  return envelope;
}

void ReportQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace jobsrv::ingest
