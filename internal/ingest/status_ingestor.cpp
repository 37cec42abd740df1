#include "status_ingestor.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace jobsrv::ingest {

using observability::IntField;
using observability::StringField;

namespace {

void Validate(const jobsrv::v1::JobReport& report) {
  if (report.job_id().empty()) {
    throw util::ValidationError("report without job id");
  }
  if (report.kind() == jobsrv::v1::REPORT_KIND_UNSPECIFIED) {
    throw util::ValidationError("report for job " + report.job_id() + " has no kind");
  }
  if (!jobsrv::v1::ReportKind_IsValid(report.kind())) {
    throw util::ValidationError("report for job " + report.job_id() + " has unknown kind " + std::to_string(report.kind()));
  }
}

// Retrying cannot change the answer.
bool IsPermanent(const std::exception& e) {
  return dynamic_cast<const util::ValidationError*>(&e) != nullptr || dynamic_cast<const util::NotFound*>(&e) != nullptr ||
         dynamic_cast<const util::InvalidState*>(&e) != nullptr;
}

const std::string& KeyOf(const Envelope& envelope) {
  return envelope.kind == Envelope::Kind::kHeartbeat ? envelope.heartbeat.worker_id() : envelope.report.job_id();
}

std::string_view KindName(jobsrv::v1::ReportKind kind) {
  switch (kind) {
    case jobsrv::v1::REPORT_KIND_STARTED:
      return "started";
    case jobsrv::v1::REPORT_KIND_PROGRESS:
      return "progress";
    case jobsrv::v1::REPORT_KIND_SUCCEEDED:
      return "succeeded";
    case jobsrv::v1::REPORT_KIND_FAILED:
      return "failed";
    case jobsrv::v1::REPORT_KIND_ABORTED:
      return "aborted";
    default:
      return "unspecified";
  }
}

} // namespace

StatusIngestor::StatusIngestor(std::shared_ptr<scheduler::Scheduler> scheduler, std::shared_ptr<worker::WorkerRegistry> registry,
                               size_t shards)
    : scheduler_(std::move(scheduler)), registry_(std::move(registry)) {
  if (!scheduler_ || !registry_) {
    throw std::invalid_argument("StatusIngestor: scheduler and registry are required");
  }
  if (shards == 0) shards = 1;
  for (size_t i = 0; i < shards; ++i) {
    queues_.push_back(std::make_unique<ReportQueue>());
  }
  shard_state_.resize(shards);
}

StatusIngestor::~StatusIngestor() {
  Stop();
}

void StatusIngestor::Start() {
  std::unique_lock lock(lifecycle_mutex_);
  if (running_ || stopped_) return;
  running_ = true;
  for (size_t i = 0; i < queues_.size(); ++i) {
    threads_.emplace_back(&StatusIngestor::Run, this, i);
  }
}

void StatusIngestor::Stop() {
  {
    std::unique_lock lock(lifecycle_mutex_);
    if (!running_) return;
    running_ = false;
    stopped_ = true;
    for (auto& queue : queues_) {
      queue->Shutdown();
    }
  }
  {
    std::lock_guard lock(state_mutex_);
    stopping_ = true;
  }
  retry_cv_.notify_all();

  // consumers drain their queues before exiting
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

size_t StatusIngestor::ShardFor(const std::string& key) const {
  return std::hash<std::string>{}(key) % queues_.size();
}

void StatusIngestor::Dispatch(const std::string& key, Envelope envelope) {
  {
    std::shared_lock lock(lifecycle_mutex_);
    if (running_) {
      const size_t shard = ShardFor(key);
      {
        std::lock_guard state_lock(state_mutex_);
        ++shard_state_[shard].pending;
      }
      queues_[shard]->Enqueue(std::move(envelope));
      return;
    }
  }
  Handle(envelope);
}

void StatusIngestor::Submit(const jobsrv::v1::JobReport& report) {
  Validate(report);
  Envelope envelope;
  envelope.kind   = Envelope::Kind::kReport;
  envelope.report = report;
  Dispatch(report.job_id(), std::move(envelope));
}

void StatusIngestor::Submit(const jobsrv::v1::Heartbeat& heartbeat) {
  worker::WorkerRegistry::Validate(heartbeat);
  Envelope envelope;
  envelope.kind      = Envelope::Kind::kHeartbeat;
  envelope.heartbeat = heartbeat;
  Dispatch(heartbeat.worker_id(), std::move(envelope));
}

scheduler::ReportOutcome StatusIngestor::Process(const jobsrv::v1::JobReport& report, uint64_t now_ms) {
  Validate(report);

  const auto& job    = report.job_id();
  const auto& worker = report.worker_id();

  switch (report.kind()) {
    case jobsrv::v1::REPORT_KIND_STARTED:
      return scheduler_->OnStarted(job, worker, now_ms);
    case jobsrv::v1::REPORT_KIND_PROGRESS:
      return scheduler_->OnProgress(job, worker, now_ms);
    case jobsrv::v1::REPORT_KIND_SUCCEEDED:
      return scheduler_->OnSucceeded(job, worker, report.artifact_ref(), now_ms);
    case jobsrv::v1::REPORT_KIND_FAILED:
      return scheduler_->OnFailed(job, worker, report.reason(), now_ms);
    case jobsrv::v1::REPORT_KIND_ABORTED:
      return scheduler_->OnAborted(job, worker, report.reason(), now_ms);
    default:
      throw util::ValidationError("unsupported report kind for job " + job);
  }
}

bool StatusIngestor::Process(const jobsrv::v1::Heartbeat& heartbeat, uint64_t now_ms) {
  return registry_->Heartbeat(heartbeat, now_ms);
}

void StatusIngestor::Handle(const Envelope& envelope) {
  const uint64_t now_ms = util::NowMillis();

  if (envelope.kind == Envelope::Kind::kHeartbeat) {
    Process(envelope.heartbeat, now_ms);
    return;
  }

  const auto outcome = Process(envelope.report, now_ms);
  JOBSRV_LOG_DEBUG("report handled", {StringField("job_id", envelope.report.job_id()),
                                      StringField("kind", KindName(envelope.report.kind())),
                                      StringField("outcome", scheduler::ToString(outcome))});
}

bool StatusIngestor::Attempt(const Envelope& envelope, uint32_t attempt) {
  try {
    Handle(envelope);
    if (attempt > 1) {
      JOBSRV_LOG_INFO("message handled after retry", {StringField("key", KeyOf(envelope)), IntField("attempt", attempt)});
    }
    return true;
  } catch (const std::exception& e) {
    if (IsPermanent(e)) {
      JOBSRV_LOG_ERROR("message rejected", {StringField("key", KeyOf(envelope)), StringField("error", e.what())});
      return true;
    }
    JOBSRV_LOG_WARN("message handling failed, will retry",
                    {StringField("key", KeyOf(envelope)), IntField("attempt", attempt), StringField("error", e.what())});
    return false;
  }
}

bool StatusIngestor::WaitForRetry(size_t shard, uint32_t attempt) {
  std::unique_lock lock(state_mutex_);
  auto&            state = shard_state_[shard];
  if (stopping_) {
    return false;
  }

  state.stalled      = true;
  state.failed_epoch = drain_epoch_;
  drained_cv_.notify_all();

  const uint32_t exponent = std::min<uint32_t>(attempt - 1, 10);
  const auto     backoff  = std::min(kRetryBackoffMax, kRetryBackoffMin * (1u << exponent));
  retry_cv_.wait_for(lock, backoff, [&] { return stopping_ || drain_epoch_ != state.failed_epoch; });

  state.stalled = false;
  return true;
}

void StatusIngestor::Run(size_t shard) {
  auto& queue = *queues_[shard];

  while (auto envelope = queue.Dequeue()) {
    for (uint32_t attempt = 1; !Attempt(*envelope, attempt); ++attempt) {
      if (!WaitForRetry(shard, attempt)) {
        JOBSRV_LOG_ERROR("message dropped at shutdown", {StringField("key", KeyOf(*envelope)), IntField("attempts", attempt)});
        break;
      }
    }

    {
      std::lock_guard lock(state_mutex_);
      --shard_state_[shard].pending;
    }
    drained_cv_.notify_all();
  }
}

void StatusIngestor::Drain() {
  std::unique_lock lock(state_mutex_);
  const uint64_t   epoch = ++drain_epoch_;
  retry_cv_.notify_all();

  drained_cv_.wait(lock, [&] {
    return std::all_of(shard_state_.begin(), shard_state_.end(), [&](const ShardState& state) {
      return state.pending == 0 || (state.stalled && state.failed_epoch >= epoch);
    });
  });
}

size_t StatusIngestor::StalledShards() {
  std::lock_guard lock(state_mutex_);
  return static_cast<size_t>(
      std::count_if(shard_state_.begin(), shard_state_.end(), [](const ShardState& state) { return state.stalled; }));
}

} // namespace jobsrv::ingest
