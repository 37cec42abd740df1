#include "internal/ingest/status_ingestor.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "support/fixtures.hpp"

namespace {

using jobsrv::ingest::StatusIngestor;
using jobsrv::scheduler::ReportOutcome;
using jobsrv::testing::FlakyRepository;
using jobsrv::testing::MakeGroup;
using jobsrv::testing::MakeHeartbeat;
using jobsrv::testing::MakeJob;
using jobsrv::testing::MakeReport;
using jobsrv::testing::StateOf;
using namespace jobsrv::v1;

struct Harness {
  std::shared_ptr<jobsrv::core::StateStore>       store;
  std::shared_ptr<jobsrv::scheduler::Scheduler>   scheduler;
  std::shared_ptr<jobsrv::worker::WorkerRegistry> registry;
  std::shared_ptr<StatusIngestor>                 ingestor;

  explicit Harness(size_t shards = 4,
                   std::shared_ptr<jobsrv::db::Repository> repository = std::make_shared<jobsrv::db::memory::MemoryRepository>()) {
    store     = std::make_shared<jobsrv::core::StateStore>(std::move(repository), 1000);
    scheduler = std::make_shared<jobsrv::scheduler::Scheduler>(store);
    registry  = std::make_shared<jobsrv::worker::WorkerRegistry>(store, 60000);
    ingestor  = std::make_shared<StatusIngestor>(scheduler, registry, shards);
  }

  // n independent jobs, all dispatched to w1
  std::vector<std::string> DispatchedGroup(const std::string& group_id, int n) {
    std::vector<jobsrv::db::model::JobRecord> jobs;
    std::vector<std::string>                  ids;
    for (int i = 0; i < n; ++i) {
      jobs.push_back(MakeJob(group_id, static_cast<uint32_t>(i), "p" + std::to_string(i)));
      ids.push_back(jobs.back().id);
    }
    ingestor->Submit(MakeHeartbeat("w1", static_cast<uint32_t>(n)));
    store->CreateGroup(MakeGroup(group_id), jobs);
    scheduler->Activate(group_id, jobsrv::util::NowMillis());
    for (const auto& id : ids) {
      assert(store->RecordAssignment(id, "w1", jobsrv::util::NowMillis()) == jobsrv::core::TransitionStatus::kApplied);
    }
    return ids;
  }
};

template <typename Message>
bool Rejects(StatusIngestor& ingestor, const Message& message) {
  try {
    ingestor.Submit(message);
  } catch (const jobsrv::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestProcessRoutesEachKind() {
  Harness    h;
  const auto ids = h.DispatchedGroup("g", 3);

  assert(h.ingestor->Process(MakeReport(ids[0], "w1", REPORT_KIND_STARTED), 5000) == ReportOutcome::kApplied);
  assert(StateOf(*h.store, ids[0]) == JOB_STATE_RUNNING);
  assert(h.ingestor->Process(MakeReport(ids[0], "w1", REPORT_KIND_PROGRESS), 5000) == ReportOutcome::kIgnored);
  assert(h.ingestor->Process(MakeReport(ids[0], "w1", REPORT_KIND_SUCCEEDED, "artifacts/p0"), 5100) == ReportOutcome::kApplied);
  assert(h.store->GetJob(ids[0])->artifact_ref == "artifacts/p0");

  assert(h.ingestor->Process(MakeReport(ids[1], "w1", REPORT_KIND_FAILED, "tests failed"), 5200) == ReportOutcome::kApplied);
  assert(h.store->GetJob(ids[1])->failure_reason == "tests failed");

  assert(h.ingestor->Process(MakeReport(ids[2], "w1", REPORT_KIND_ABORTED, "shutting down"), 5300) == ReportOutcome::kApplied);
  assert(StateOf(*h.store, ids[2]) == JOB_STATE_READY);
  assert(h.store->GetJob(ids[2])->retry_count == 1);

  assert(!h.ingestor->Process(MakeHeartbeat("w1", 3), 5400));
  assert(h.ingestor->Process(MakeHeartbeat("w2", 1), 5400));
}

void TestMalformedMessagesRejectedUpFront() {
  Harness h;
  assert(Rejects(*h.ingestor, MakeReport("", "w1", REPORT_KIND_STARTED)));
  assert(Rejects(*h.ingestor, MakeReport("g/p0", "w1", REPORT_KIND_UNSPECIFIED)));
  assert(Rejects(*h.ingestor, MakeReport("g/p0", "w1", static_cast<ReportKind>(42))));
  assert(Rejects(*h.ingestor, MakeHeartbeat("", 1)));

  h.ingestor->Start();
  assert(Rejects(*h.ingestor, MakeReport("", "w1", REPORT_KIND_SUCCEEDED)));
  // heartbeats the registry would refuse are refused before queueing
  assert(Rejects(*h.ingestor, MakeHeartbeat("w9", 1, {"bad tag"})));
  assert(Rejects(*h.ingestor, MakeHeartbeat("w9", 0)));
  h.ingestor->Drain();
  assert(!h.registry->Find("w9").has_value());
  h.ingestor->Stop();
}

void TestInlineHandlingBeforeStart() {
  Harness    h;
  const auto ids = h.DispatchedGroup("g", 1);

  h.ingestor->Submit(MakeReport(ids[0], "w1", REPORT_KIND_SUCCEEDED, "artifacts/p0"));
  assert(StateOf(*h.store, ids[0]) == JOB_STATE_COMPLETE);
  assert(h.registry->Find("w1").has_value());
}

void TestShardedConsumersPreservePerJobOrder() {
  constexpr int kJobs = 32;

  Harness    h(4);
  const auto ids = h.DispatchedGroup("g", kJobs);
  assert(h.ingestor->Shards() == 4);

  h.ingestor->Start();
  for (const auto& id : ids) {
    h.ingestor->Submit(MakeReport(id, "w1", REPORT_KIND_STARTED));
    h.ingestor->Submit(MakeReport(id, "w1", REPORT_KIND_PROGRESS));
    h.ingestor->Submit(MakeReport(id, "w1", REPORT_KIND_SUCCEEDED, "artifacts/" + id));
  }
  h.ingestor->Drain();

  for (const auto& id : ids) {
    auto job = h.store->GetJob(id);
    assert(job->state == JOB_STATE_COMPLETE);
    // Started was handled before Succeeded
    assert(job->started_at_ms != 0);
    assert(job->artifact_ref == "artifacts/" + id);
  }
  assert(h.store->GetGroup("g")->state == GROUP_STATE_COMPLETE);
  assert(h.store->GetWorker("w1")->load == 0);

  h.ingestor->Stop();
}

void TestAcknowledgedReportSurvivesStoreOutage() {
  auto       repository = std::make_shared<FlakyRepository>();
  Harness    h(2, repository);
  const auto ids = h.DispatchedGroup("g", 2);

  h.ingestor->Start();
  h.ingestor->Submit(MakeReport(ids[0], "w1", REPORT_KIND_STARTED));
  h.ingestor->Drain();
  assert(StateOf(*h.store, ids[0]) == JOB_STATE_RUNNING);

  repository->SetDown(true);
  h.ingestor->Submit(MakeReport(ids[0], "w1", REPORT_KIND_SUCCEEDED, "artifacts/p0"));
  h.ingestor->Submit(MakeReport(ids[1], "w1", REPORT_KIND_STARTED));
  h.ingestor->Submit(MakeReport(ids[1], "w1", REPORT_KIND_SUCCEEDED, "artifacts/p1"));
  h.ingestor->Drain();
  assert(h.ingestor->StalledShards() >= 1);

  repository->SetDown(false);
  h.ingestor->Drain();
  assert(h.ingestor->StalledShards() == 0);

  for (const auto& id : ids) {
    auto job = h.store->GetJob(id);
    assert(job->state == JOB_STATE_COMPLETE);
    assert(job->started_at_ms != 0);
  }
  assert(h.store->GetGroup("g")->state == GROUP_STATE_COMPLETE);
  assert(h.store->GetWorker("w1")->load == 0);

  h.ingestor->Stop();
}

void TestStopGivesUpOnMessagesThatStillFail() {
  auto       repository = std::make_shared<FlakyRepository>();
  Harness    h(1, repository);
  const auto ids = h.DispatchedGroup("g", 1);

  h.ingestor->Start();
  repository->SetDown(true);
  h.ingestor->Submit(MakeReport(ids[0], "w1", REPORT_KIND_SUCCEEDED));
  h.ingestor->Drain();
  h.ingestor->Stop();

  // inline from here on: the caller sees the failure and can resend
  bool threw = false;
  try {
    h.ingestor->Submit(MakeReport(ids[0], "w1", REPORT_KIND_SUCCEEDED));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  repository->SetDown(false);
  assert(StateOf(*h.store, ids[0]) == JOB_STATE_DISPATCHED);
  h.ingestor->Submit(MakeReport(ids[0], "w1", REPORT_KIND_SUCCEEDED));
  assert(StateOf(*h.store, ids[0]) == JOB_STATE_COMPLETE);
}

void TestStopDrainsThenHandlesInline() {
  Harness    h(2);
  const auto ids = h.DispatchedGroup("g", 2);

  h.ingestor->Start();
  h.ingestor->Submit(MakeReport(ids[0], "w1", REPORT_KIND_SUCCEEDED));
  h.ingestor->Stop();
  assert(StateOf(*h.store, ids[0]) == JOB_STATE_COMPLETE);

  // stopped for good: restart is a no-op and messages go inline
  h.ingestor->Start();
  h.ingestor->Submit(MakeReport(ids[1], "w1", REPORT_KIND_SUCCEEDED));
  assert(StateOf(*h.store, ids[1]) == JOB_STATE_COMPLETE);
}

} // namespace

int main() {
  TestProcessRoutesEachKind();
  TestMalformedMessagesRejectedUpFront();
  TestInlineHandlingBeforeStart();
  TestShardedConsumersPreservePerJobOrder();
  TestAcknowledgedReportSurvivesStoreOutage();
  TestStopGivesUpOnMessagesThatStillFail();
  TestStopDrainsThenHandlesInline();

  std::cout << "jobsrv_unit_status_ingestor: pass\n";
  return 0;
}
