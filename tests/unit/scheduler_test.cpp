#include "internal/scheduler/scheduler.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"
#include "support/fixtures.hpp"

namespace {

using jobsrv::core::StateStore;
using jobsrv::core::TransitionStatus;
using jobsrv::db::memory::MemoryRepository;
using jobsrv::scheduler::ReportOutcome;
using jobsrv::scheduler::Scheduler;
using jobsrv::scheduler::SchedulerOptions;
using jobsrv::testing::MakeGroup;
using jobsrv::testing::MakeJob;
using jobsrv::testing::StateOf;
using namespace jobsrv::v1;

struct Fixture {
  std::shared_ptr<StateStore> store;
  std::shared_ptr<Scheduler>  scheduler;
  std::atomic<int>            ready_signals{0};

  explicit Fixture(SchedulerOptions options = {}, uint32_t max_commit_attempts = 8) {
    store     = std::make_shared<StateStore>(std::make_shared<MemoryRepository>(), max_commit_attempts);
    scheduler = std::make_shared<Scheduler>(store, options);
    scheduler->SetReadyNotifier([this] { ++ready_signals; });
  }

  void AddWorker(const std::string& id, uint32_t capacity) {
    jobsrv::db::model::WorkerRecord worker;
    worker.id                = id;
    worker.tags              = {jobsrv::testing::kTarget};
    worker.capacity          = capacity;
    worker.last_heartbeat_ms = 1000;
    store->UpsertWorker(worker);
  }

  void Assign(const std::string& job_id, const std::string& worker_id) {
    const auto status = store->RecordAssignment(job_id, worker_id, 3000);
    assert(status == TransitionStatus::kApplied);
    (void)status;
  }

  GroupState GroupStateOf(const std::string& group_id) {
    return store->GetGroup(group_id)->state;
  }
};

void TestScenarioDependencyCompletesThenDependentRuns() {
  Fixture f;
  f.AddWorker("w1", 1);
  f.store->CreateGroup(MakeGroup("g"), {MakeJob("g", 0, "b"), MakeJob("g", 1, "a", {"b"})});
  f.scheduler->Activate("g", 2000);

  assert(StateOf(*f.store, "g/b") == JOB_STATE_READY);
  assert(StateOf(*f.store, "g/a") == JOB_STATE_PENDING);
  assert(f.ready_signals == 1);

  f.Assign("g/b", "w1");
  assert(f.scheduler->OnStarted("g/b", "w1", 3100) == ReportOutcome::kApplied);
  assert(f.scheduler->OnSucceeded("g/b", "w1", "artifacts/b", 3200) == ReportOutcome::kApplied);
  assert(StateOf(*f.store, "g/b") == JOB_STATE_COMPLETE);
  assert(StateOf(*f.store, "g/a") == JOB_STATE_READY);
  assert(f.ready_signals == 2);

  f.Assign("g/a", "w1");
  // success straight from Dispatched is accepted
  assert(f.scheduler->OnSucceeded("g/a", "w1", "artifacts/a", 3300) == ReportOutcome::kApplied);
  assert(f.GroupStateOf("g") == GROUP_STATE_COMPLETE);
  assert(f.store->GetGroup("g")->completed_at_ms == 3300);
  assert(f.store->GetWorker("w1")->load == 0);
}

void TestScenarioFailureCascadesWithoutReady() {
  Fixture f;
  f.AddWorker("w1", 1);
  f.store->CreateGroup(MakeGroup("g"), {MakeJob("g", 0, "b"), MakeJob("g", 1, "a", {"b"})});
  f.scheduler->Activate("g", 2000);
  f.Assign("g/b", "w1");

  assert(f.scheduler->OnFailed("g/b", "w1", "linker error", 3100) == ReportOutcome::kApplied);

  auto a = f.store->GetJob("g/a");
  assert(a->state == JOB_STATE_DEPENDENCY_FAILED);
  assert(a->failure_reason == "dependency b failed");
  assert(a->dispatched_at_ms == 0);
  assert(f.store->GetJob("g/b")->failure_reason == "linker error");
  assert(f.GroupStateOf("g") == GROUP_STATE_FAILED);
}

void TestDuplicateAndStaleReportsAreIgnored() {
  Fixture f;
  f.AddWorker("w1", 1);
  f.store->CreateGroup(MakeGroup("g"), {MakeJob("g", 0, "a"), MakeJob("g", 1, "b", {"a"})});
  f.scheduler->Activate("g", 2000);

  // not dispatched yet
  assert(f.scheduler->OnStarted("g/a", "w1", 2100) == ReportOutcome::kIgnored);
  assert(f.scheduler->OnSucceeded("nope", "w1", "", 2100) == ReportOutcome::kIgnored);

  f.Assign("g/a", "w1");
  assert(f.scheduler->OnStarted("g/a", "w2", 3100) == ReportOutcome::kIgnored);
  assert(f.scheduler->OnProgress("g/a", "w1", 3100) == ReportOutcome::kApplied);
  assert(StateOf(*f.store, "g/a") == JOB_STATE_RUNNING);
  assert(f.scheduler->OnProgress("g/a", "w1", 3150) == ReportOutcome::kIgnored);
  assert(f.scheduler->OnStarted("g/a", "w1", 3150) == ReportOutcome::kIgnored);

  // empty worker id: whoever holds the job
  assert(f.scheduler->OnSucceeded("g/a", "", "artifacts/a", 3200) == ReportOutcome::kApplied);
  assert(f.scheduler->OnSucceeded("g/a", "w1", "artifacts/a", 3300) == ReportOutcome::kIgnored);
  assert(f.scheduler->OnFailed("g/a", "w1", "late", 3300) == ReportOutcome::kIgnored);

  auto a = f.store->GetJob("g/a");
  assert(a->state == JOB_STATE_COMPLETE);
  assert(a->artifact_ref == "artifacts/a");
  assert(a->completed_at_ms == 3200);
  assert(StateOf(*f.store, "g/b") == JOB_STATE_READY);
}

void TestCascadeIsTransitiveAndSparesIndependentJobs() {
  Fixture f;
  f.AddWorker("w1", 2);
  f.store->CreateGroup(MakeGroup("g"),
                       {MakeJob("g", 0, "a"), MakeJob("g", 1, "b", {"a"}), MakeJob("g", 2, "c", {"b"}), MakeJob("g", 3, "d")});
  f.scheduler->Activate("g", 2000);
  assert(StateOf(*f.store, "g/d") == JOB_STATE_READY);

  f.Assign("g/a", "w1");
  f.scheduler->OnFailed("g/a", "w1", "", 3100);

  assert(f.store->GetJob("g/a")->failure_reason == "build failed");
  assert(StateOf(*f.store, "g/b") == JOB_STATE_DEPENDENCY_FAILED);
  assert(StateOf(*f.store, "g/c") == JOB_STATE_DEPENDENCY_FAILED);
  assert(StateOf(*f.store, "g/d") == JOB_STATE_READY);
  // independent work is still allowed to finish
  assert(f.GroupStateOf("g") == GROUP_STATE_QUEUED);

  f.Assign("g/d", "w1");
  f.scheduler->OnSucceeded("g/d", "w1", "artifacts/d", 3200);
  assert(f.GroupStateOf("g") == GROUP_STATE_FAILED);
}

void TestDiamondWaitsForAllDependencies() {
  Fixture f;
  f.AddWorker("w1", 4);
  f.store->CreateGroup(MakeGroup("g"), {MakeJob("g", 0, "a"), MakeJob("g", 1, "b", {"a"}), MakeJob("g", 2, "c", {"a"}),
                                        MakeJob("g", 3, "d", {"b", "c"})});
  f.scheduler->Activate("g", 2000);

  f.Assign("g/a", "w1");
  f.scheduler->OnSucceeded("g/a", "w1", "", 3100);
  assert(StateOf(*f.store, "g/b") == JOB_STATE_READY);
  assert(StateOf(*f.store, "g/c") == JOB_STATE_READY);

  f.Assign("g/b", "w1");
  f.Assign("g/c", "w1");
  f.scheduler->OnSucceeded("g/b", "w1", "", 3200);
  assert(StateOf(*f.store, "g/d") == JOB_STATE_PENDING);

  f.scheduler->OnSucceeded("g/c", "w1", "", 3300);
  assert(StateOf(*f.store, "g/d") == JOB_STATE_READY);
}

void TestWorkerLossRequeuesUntilBudgetIsSpent() {
  SchedulerOptions options;
  options.retry_budget = 1;
  Fixture f(options);
  f.AddWorker("w1", 1);
  f.store->CreateGroup(MakeGroup("g"), {MakeJob("g", 0, "c"), MakeJob("g", 1, "e", {"c"})});
  f.scheduler->Activate("g", 2000);

  f.Assign("g/c", "w1");
  const auto lost = f.scheduler->HandleWorkerLost("w1", 4000, 4000);
  assert(lost.removed);
  assert(lost.jobs == std::vector<std::string>{"g/c"});

  auto c = f.store->GetJob("g/c");
  assert(c->state == JOB_STATE_READY);
  assert(c->retry_count == 1);
  assert(c->worker_id.empty());
  assert(!f.store->GetWorker("w1").has_value());

  f.AddWorker("w2", 1);
  f.Assign("g/c", "w2");
  f.scheduler->OnStarted("g/c", "w2", 4100);
  f.scheduler->HandleWorkerLost("w2", 5000, 5000);

  c = f.store->GetJob("g/c");
  assert(c->state == JOB_STATE_FAILED);
  assert(c->failure_reason == "retry budget exhausted: worker w2 lost");
  assert(StateOf(*f.store, "g/e") == JOB_STATE_DEPENDENCY_FAILED);
  assert(f.GroupStateOf("g") == GROUP_STATE_FAILED);

  // nothing held: the worker is just removed
  f.AddWorker("idle", 1);
  const auto idle = f.scheduler->HandleWorkerLost("idle", 5100, 5100);
  assert(idle.removed && idle.jobs.empty());
  assert(!f.store->GetWorker("idle").has_value());
}

void TestWorkerThatHeartbeatAgainKeepsItsJobs() {
  Fixture f;
  f.AddWorker("w1", 1);
  f.store->CreateGroup(MakeGroup("g"), {MakeJob("g", 0, "a")});
  f.scheduler->Activate("g", 2000);
  f.Assign("g/a", "w1");
  f.scheduler->OnStarted("g/a", "w1", 3100);

  // judged stale against a cutoff that predates its latest heartbeat
  const auto outcome = f.scheduler->HandleWorkerLost("w1", 900, 4000);
  assert(!outcome.removed);
  assert(outcome.jobs.empty());
  assert(f.store->GetWorker("w1")->load == 1);

  auto a = f.store->GetJob("g/a");
  assert(a->state == JOB_STATE_RUNNING);
  assert(a->worker_id == "w1");
  assert(a->retry_count == 0);
}

void TestAbortAndReleaseReturnJobToReady() {
  Fixture f;
  f.AddWorker("w1", 1);
  f.store->CreateGroup(MakeGroup("g"), {MakeJob("g", 0, "a")});
  f.scheduler->Activate("g", 2000);

  f.Assign("g/a", "w1");
  assert(f.scheduler->ReleaseAssignment("g/a", "w1", 3100) == ReportOutcome::kApplied);
  auto a = f.store->GetJob("g/a");
  assert(a->state == JOB_STATE_READY);
  assert(a->retry_count == 0);
  assert(f.store->GetWorker("w1")->load == 0);

  f.Assign("g/a", "w1");
  f.scheduler->OnStarted("g/a", "w1", 3200);
  // the worker has it after all
  assert(f.scheduler->ReleaseAssignment("g/a", "w1", 3300) == ReportOutcome::kIgnored);

  assert(f.scheduler->OnAborted("g/a", "w1", "oom", 3400) == ReportOutcome::kApplied);
  a = f.store->GetJob("g/a");
  assert(a->state == JOB_STATE_READY);
  assert(a->retry_count == 1);
  assert(f.store->GetWorker("w1")->load == 0);
}

void TestScenarioCancelWhileRunning() {
  Fixture f;
  f.AddWorker("w1", 1);
  f.store->CreateGroup(MakeGroup("g"), {MakeJob("g", 0, "d"), MakeJob("g", 1, "p", {"d"}), MakeJob("g", 2, "q")});
  f.scheduler->Activate("g", 2000);
  f.Assign("g/d", "w1");
  f.scheduler->OnStarted("g/d", "w1", 3100);

  const auto outcome = f.scheduler->CancelGroup("g", 3200);
  assert(!outcome.already_terminal);
  assert(outcome.state == GROUP_STATE_CANCELED);
  assert(outcome.canceled_jobs.size() == 3);
  assert(outcome.aborts.size() == 1);
  assert(outcome.aborts[0].job_id == "g/d");
  assert(outcome.aborts[0].worker_id == "w1");

  assert(StateOf(*f.store, "g/d") == JOB_STATE_CANCELED);
  assert(f.store->GetJob("g/q")->failure_reason == "group canceled");
  assert(f.store->GetWorker("w1")->load == 0);
  assert(f.store->GetGroup("g")->cancel_requested);

  // the worker's late success changes nothing
  assert(f.scheduler->OnSucceeded("g/d", "w1", "artifacts/d", 3300) == ReportOutcome::kIgnored);
  assert(StateOf(*f.store, "g/d") == JOB_STATE_CANCELED);

  const auto again = f.scheduler->CancelGroup("g", 3400);
  assert(again.already_terminal);
  assert(again.state == GROUP_STATE_CANCELED);
  assert(again.canceled_jobs.empty());
}

void TestCancelFinishedOrUnknownGroup() {
  Fixture f;
  f.AddWorker("w1", 1);
  f.store->CreateGroup(MakeGroup("g"), {MakeJob("g", 0, "a")});
  f.scheduler->Activate("g", 2000);
  f.Assign("g/a", "w1");
  f.scheduler->OnSucceeded("g/a", "w1", "", 3000);

  const auto outcome = f.scheduler->CancelGroup("g", 3100);
  assert(outcome.already_terminal);
  assert(outcome.state == GROUP_STATE_COMPLETE);
  assert(!f.store->GetGroup("g")->cancel_requested);

  bool threw = false;
  try {
    f.scheduler->CancelGroup("missing", 3100);
  } catch (const jobsrv::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestRecoverPromotesOpenGroups() {
  auto store = std::make_shared<StateStore>(std::make_shared<MemoryRepository>());
  store->CreateGroup(MakeGroup("g1", 1000), {MakeJob("g1", 0, "a"), MakeJob("g1", 1, "b", {"a"})});
  store->CreateGroup(MakeGroup("g2", 1100), {MakeJob("g2", 0, "x")});

  // a fresh scheduler over durable state, as after a restart
  Scheduler scheduler(store);
  assert(scheduler.Recover(5000) == 2);
  assert(StateOf(*store, "g1/a") == JOB_STATE_READY);
  assert(StateOf(*store, "g1/b") == JOB_STATE_PENDING);
  assert(StateOf(*store, "g2/x") == JOB_STATE_READY);

  // idempotent
  assert(scheduler.Recover(5100) == 2);
  assert(store->ListReadyJobs().size() == 2);
}

void TestConcurrentGroupsKeepLoadWithinCapacity() {
  constexpr int      kGroups   = 4;
  constexpr int      kChain    = 6;
  constexpr uint32_t kCapacity = 2;

  Fixture f({}, 10000);
  f.AddWorker("w", kCapacity);

  for (int g = 0; g < kGroups; ++g) {
    const std::string                group_id = "g" + std::to_string(g);
    std::vector<jobsrv::db::model::JobRecord> jobs;
    for (int i = 0; i < kChain; ++i) {
      std::vector<std::string> deps;
      if (i > 0) deps.push_back("p" + std::to_string(i - 1));
      jobs.push_back(MakeJob(group_id, static_cast<uint32_t>(i), "p" + std::to_string(i), deps));
    }
    f.store->CreateGroup(MakeGroup(group_id, 1000 + g), jobs);
    f.scheduler->Activate(group_id, 2000);
  }

  std::atomic<bool>        overfilled{false};
  std::vector<std::thread> threads;
  for (int g = 0; g < kGroups; ++g) {
    threads.emplace_back([&, g] {
      const std::string group_id = "g" + std::to_string(g);
      while (jobsrv::model::IsTerminal(f.store->GetGroup(group_id)->state) == false) {
        for (const auto& job : f.store->ListGroupJobs(group_id)) {
          if (job.state != JOB_STATE_READY) continue;
          if (f.store->RecordAssignment(job.id, "w", 3000) != TransitionStatus::kApplied) continue;
          if (f.store->GetWorker("w")->load > kCapacity) overfilled = true;
          f.scheduler->OnStarted(job.id, "w", 3100);
          f.scheduler->OnSucceeded(job.id, "w", "artifacts/" + job.project, 3200);
        }
        std::this_thread::yield();
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(!overfilled);
  for (int g = 0; g < kGroups; ++g) {
    assert(f.GroupStateOf("g" + std::to_string(g)) == GROUP_STATE_COMPLETE);
  }
  assert(f.store->GetWorker("w")->load == 0);
}

} // namespace

int main() {
  TestScenarioDependencyCompletesThenDependentRuns();
  TestScenarioFailureCascadesWithoutReady();
  TestDuplicateAndStaleReportsAreIgnored();
  TestCascadeIsTransitiveAndSparesIndependentJobs();
  TestDiamondWaitsForAllDependencies();
  TestWorkerLossRequeuesUntilBudgetIsSpent();
  TestWorkerThatHeartbeatAgainKeepsItsJobs();
  TestAbortAndReleaseReturnJobToReady();
  TestScenarioCancelWhileRunning();
  TestCancelFinishedOrUnknownGroup();
  TestRecoverPromotesOpenGroups();
  TestConcurrentGroupsKeepLoadWithinCapacity();

  std::cout << "jobsrv_unit_scheduler: pass\n";
  return 0;
}
