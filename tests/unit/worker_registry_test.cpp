#include "internal/worker/worker_registry.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/scheduler/scheduler.hpp"
#include "internal/util/errors.hpp"
#include "internal/worker/liveness_sweeper.hpp"
#include "support/fixtures.hpp"

namespace {

using jobsrv::core::StateStore;
using jobsrv::db::memory::MemoryRepository;
using jobsrv::testing::MakeGroup;
using jobsrv::testing::MakeHeartbeat;
using jobsrv::testing::MakeJob;
using jobsrv::worker::WorkerRegistry;

constexpr uint64_t kTimeoutMs = 1000;

std::shared_ptr<StateStore> NewStore() {
  return std::make_shared<StateStore>(std::make_shared<MemoryRepository>());
}

void TestFirstHeartbeatRegisters() {
  auto           store = NewStore();
  WorkerRegistry registry(store, kTimeoutMs);

  assert(registry.Heartbeat(MakeHeartbeat("w1", 2, {"gpu"}), 100));
  assert(!registry.Heartbeat(MakeHeartbeat("w1", 3, {"gpu"}), 200));

  auto worker = registry.Find("w1");
  assert(worker.has_value());
  assert(worker->capacity == 3);
  assert(worker->last_heartbeat_ms == 200);
  assert(worker->endpoint == "w1.local:7000");
  assert(worker->tags == (std::vector<std::string>{jobsrv::testing::kTarget, "gpu"}));
  assert(worker->load == 0);
}

void TestInvalidHeartbeatsRejected() {
  WorkerRegistry registry(NewStore(), kTimeoutMs);

  bool threw = false;
  try {
    registry.Heartbeat(MakeHeartbeat("", 1), 100);
  } catch (const jobsrv::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    registry.Heartbeat(MakeHeartbeat("w1", 1, {"two words"}), 100);
  } catch (const jobsrv::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(!registry.Find("w1").has_value());

  threw = false;
  try {
    registry.Heartbeat(MakeHeartbeat("w1", 0), 100);
  } catch (const jobsrv::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(!registry.Find("w1").has_value());

  threw = false;
  try {
    WorkerRegistry bad(NewStore(), 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestLiveWorkersExcludeStaleAndSuspect() {
  WorkerRegistry registry(NewStore(), kTimeoutMs);
  registry.Heartbeat(MakeHeartbeat("fresh", 1), 1000);
  registry.Heartbeat(MakeHeartbeat("old", 1), 100);
  registry.Heartbeat(MakeHeartbeat("flaky", 1), 1000);

  assert(registry.FlagSuspect("flaky"));
  assert(!registry.FlagSuspect("unknown"));

  auto live = registry.LiveWorkers(1500);
  assert(live.size() == 1);
  assert(live[0].id == "fresh");

  // heartbeat clears suspicion
  registry.Heartbeat(MakeHeartbeat("flaky", 1), 1600);
  live = registry.LiveWorkers(1600);
  assert(live.size() == 2);
}

void TestSweepHandsDeadWorkersToHandler() {
  WorkerRegistry registry(NewStore(), kTimeoutMs);
  registry.Heartbeat(MakeHeartbeat("w1", 1), 100);
  registry.Heartbeat(MakeHeartbeat("w2", 1), 900);

  // without a handler nothing is removed
  assert(registry.Sweep(1500).empty());
  assert(registry.Find("w1").has_value());

  std::vector<std::string> lost;
  registry.SetLostHandler([&](const std::string& worker_id, uint64_t, uint64_t) {
    lost.push_back(worker_id);
    return true;
  });

  // exactly at the timeout is still alive
  assert(registry.Sweep(1100).empty());

  const auto dead = registry.Sweep(1500);
  assert(dead == std::vector<std::string>{"w1"});
  assert(lost == std::vector<std::string>{"w1"});
}

void TestSweepRetriesAfterHandlerFailure() {
  WorkerRegistry registry(NewStore(), kTimeoutMs);
  registry.Heartbeat(MakeHeartbeat("w1", 1), 100);

  int calls = 0;
  registry.SetLostHandler([&](const std::string&, uint64_t, uint64_t) {
    if (++calls == 1) throw std::runtime_error("store unavailable");
    return true;
  });

  assert(registry.Sweep(2000).empty());
  assert(registry.Sweep(2100) == std::vector<std::string>{"w1"});
  assert(calls == 2);
}

void TestShrinkingCapacityNeverGoesBelowLoad() {
  auto           store = NewStore();
  WorkerRegistry registry(store, kTimeoutMs);
  registry.Heartbeat(MakeHeartbeat("w1", 2), 100);

  auto a  = MakeJob("g", 0, "a");
  auto b  = MakeJob("g", 1, "b");
  a.state = jobsrv::v1::JOB_STATE_READY;
  b.state = jobsrv::v1::JOB_STATE_READY;
  store->CreateGroup(MakeGroup("g"), {a, b});
  assert(store->RecordAssignment("g/a", "w1", 150) == jobsrv::core::TransitionStatus::kApplied);
  assert(store->RecordAssignment("g/b", "w1", 150) == jobsrv::core::TransitionStatus::kApplied);

  registry.Heartbeat(MakeHeartbeat("w1", 1), 200);
  auto worker = registry.Find("w1");
  assert(worker->load == 2);
  assert(worker->capacity >= worker->load);
  assert(registry.LiveWorkers(200).size() == 1);
}

void TestHeartbeatDuringSweepKeepsWorker() {
  auto store     = NewStore();
  auto scheduler = std::make_shared<jobsrv::scheduler::Scheduler>(store);
  auto registry  = std::make_shared<WorkerRegistry>(store, kTimeoutMs);
  registry->Heartbeat(MakeHeartbeat("w1", 1), 100);

  auto job  = MakeJob("g", 0, "a");
  job.state = jobsrv::v1::JOB_STATE_READY;
  store->CreateGroup(MakeGroup("g"), {job});
  assert(store->RecordAssignment("g/a", "w1", 150) == jobsrv::core::TransitionStatus::kApplied);

  // the heartbeat commits after the sweep judged w1 stale
  registry->SetLostHandler([&](const std::string& worker_id, uint64_t stale_before_ms, uint64_t now_ms) {
    registry->Heartbeat(MakeHeartbeat(worker_id, 1), now_ms);
    return scheduler->HandleWorkerLost(worker_id, stale_before_ms, now_ms).removed;
  });

  assert(registry->Sweep(2000).empty());

  auto worker = registry->Find("w1");
  assert(worker.has_value());
  assert(worker->last_heartbeat_ms == 2000);
  assert(worker->load == 1);
  auto a = store->GetJob("g/a");
  assert(a->state == jobsrv::v1::JOB_STATE_DISPATCHED);
  assert(a->worker_id == "w1");
  assert(registry->LiveWorkers(2000).size() == 1);
}

void TestHydrateGivesGracePeriod() {
  auto store = NewStore();
  {
    WorkerRegistry before_restart(store, kTimeoutMs);
    before_restart.Heartbeat(MakeHeartbeat("w1", 1), 100);
  }

  WorkerRegistry registry(store, kTimeoutMs);
  assert(registry.Hydrate(50000) == 1);
  assert(registry.LiveWorkers(50500).size() == 1);
  assert(registry.Sweep(50500).empty());
}

void TestLivenessSweeperRunsInBackground() {
  auto store    = NewStore();
  auto registry = std::make_shared<WorkerRegistry>(store, kTimeoutMs);
  // far in the past relative to the wall clock
  registry->Heartbeat(MakeHeartbeat("w1", 1), 1);

  std::atomic<int> lost{0};
  registry->SetLostHandler([&](const std::string&, uint64_t, uint64_t) {
    ++lost;
    return true;
  });

  jobsrv::worker::LivenessSweeper sweeper(registry, std::chrono::milliseconds(10));
  sweeper.Start();
  for (int i = 0; i < 500 && lost == 0; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  sweeper.Stop();

  assert(lost >= 1);
}

} // namespace

int main() {
  TestFirstHeartbeatRegisters();
  TestInvalidHeartbeatsRejected();
  TestLiveWorkersExcludeStaleAndSuspect();
  TestSweepHandsDeadWorkersToHandler();
  TestSweepRetriesAfterHandlerFailure();
  TestShrinkingCapacityNeverGoesBelowLoad();
  TestHeartbeatDuringSweepKeepsWorker();
  TestHydrateGivesGracePeriod();
  TestLivenessSweeperRunsInBackground();

  std::cout << "jobsrv_unit_worker_registry: pass\n";
  return 0;
}
