#include "internal/core/state_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "support/fixtures.hpp"

namespace {

using jobsrv::core::JobTransition;
using jobsrv::core::StateStore;
using jobsrv::core::TransitionBatch;
using jobsrv::core::TransitionStatus;
using jobsrv::db::memory::MemoryRepository;
using jobsrv::testing::MakeGroup;
using jobsrv::testing::MakeJob;
using jobsrv::testing::StateOf;
using namespace jobsrv::v1;

std::shared_ptr<StateStore> NewStore() {
  return std::make_shared<StateStore>(std::make_shared<MemoryRepository>());
}

JobTransition Move(const std::string& job_id, std::vector<JobState> expected, JobState next) {
  JobTransition t;
  t.job_id   = job_id;
  t.expected = std::move(expected);
  t.next     = next;
  return t;
}

TransitionBatch Batch(const std::string& group_id, std::vector<JobTransition> transitions) {
  TransitionBatch batch;
  batch.group_id    = group_id;
  batch.transitions = std::move(transitions);
  return batch;
}

jobsrv::db::model::WorkerRecord Worker(const std::string& id, uint32_t capacity) {
  jobsrv::db::model::WorkerRecord worker;
  worker.id                = id;
  worker.endpoint          = id + ":7000";
  worker.tags              = {jobsrv::testing::kTarget};
  worker.capacity          = capacity;
  worker.last_heartbeat_ms = 1000;
  return worker;
}

// g: a <- b (b depends on a), c independent
std::shared_ptr<StateStore> SeedGroup(const std::string& group_id = "g") {
  auto store = NewStore();
  store->CreateGroup(MakeGroup(group_id), {MakeJob(group_id, 0, "a"), MakeJob(group_id, 1, "b", {"a"}), MakeJob(group_id, 2, "c")});
  return store;
}

void TestCreateGroupPersistsJobsInOrdinalOrder() {
  auto store = SeedGroup();

  auto group = store->GetGroup("g");
  assert(group.has_value());
  assert(group->state == GROUP_STATE_QUEUED);

  const auto jobs = store->ListGroupJobs("g");
  assert(jobs.size() == 3);
  assert(jobs[0].project == "a");
  assert(jobs[1].dependencies == std::vector<std::string>{"g/a"});
  assert(jobs[2].state == JOB_STATE_PENDING);

  assert(store->ListOpenGroups().size() == 1);
}

void TestDuplicateGroupRejected() {
  auto store = SeedGroup();
  bool threw = false;
  try {
    store->CreateGroup(MakeGroup("g"), {});
  } catch (const jobsrv::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
}

void TestRootsMayStartReady() {
  auto store = NewStore();

  auto root  = MakeJob("g", 0, "a");
  root.state = JOB_STATE_READY;
  store->CreateGroup(MakeGroup("g"), {root, MakeJob("g", 1, "b", {"a"})});
  assert(StateOf(*store, "g/a") == JOB_STATE_READY);
  assert(StateOf(*store, "g/b") == JOB_STATE_PENDING);
  assert(store->ListReadyJobs().size() == 1);

  // a job with dependencies waits for them
  auto early  = MakeJob("h", 1, "b", {"a"});
  early.state = JOB_STATE_READY;
  bool threw  = false;
  try {
    store->CreateGroup(MakeGroup("h"), {MakeJob("h", 0, "a"), early});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(!store->GetGroup("h").has_value());
}

void TestReadyRequiresCompleteDependencies() {
  auto store = SeedGroup();

  auto rejected = store->ApplyTransitions(Batch("g", {Move("g/b", {JOB_STATE_PENDING}, JOB_STATE_READY)}), 2000);
  assert(rejected.status == TransitionStatus::kRejected);
  assert(StateOf(*store, "g/b") == JOB_STATE_PENDING);

  auto applied = store->ApplyTransitions(
      Batch("g", {Move("g/a", {JOB_STATE_PENDING}, JOB_STATE_READY), Move("g/c", {JOB_STATE_PENDING}, JOB_STATE_READY)}), 2000);
  assert(applied.status == TransitionStatus::kApplied);
  assert(applied.jobs.size() == 2);
  assert(applied.prior_states[0] == JOB_STATE_PENDING);
  // no terminal move, no group rewrite
  assert(applied.groups.empty());
  assert(store->ListReadyJobs().size() == 2);
}

void TestExpectedStateMismatchIsConflictAndWritesNothing() {
  auto store = SeedGroup();

  auto result = store->ApplyTransitions(
      Batch("g", {Move("g/c", {JOB_STATE_PENDING}, JOB_STATE_READY), Move("g/a", {JOB_STATE_READY}, JOB_STATE_CANCELED)}), 2000);
  assert(result.status == TransitionStatus::kConflict);
  assert(result.jobs.empty());
  // first transition of the batch rolled back with the rest
  assert(StateOf(*store, "g/c") == JOB_STATE_PENDING);
}

void TestIllegalAndForeignTransitionsRejected() {
  auto store = SeedGroup();
  store->CreateGroup(MakeGroup("other", 1500), {MakeJob("other", 0, "x")});

  assert(store->ApplyTransitions(Batch("g", {Move("g/a", {}, JOB_STATE_RUNNING)}), 2000).status == TransitionStatus::kRejected);
  assert(store->ApplyTransitions(Batch("g", {Move("other/x", {}, JOB_STATE_READY)}), 2000).status == TransitionStatus::kRejected);
  assert(store->ApplyTransitions(Batch("g", {Move("g/missing", {}, JOB_STATE_READY)}), 2000).status == TransitionStatus::kRejected);

  // Dispatched only through RecordAssignment
  assert(store->ApplyTransitions(Batch("g", {Move("g/a", {}, JOB_STATE_READY)}), 2000).status == TransitionStatus::kApplied);
  assert(store->ApplyTransitions(Batch("g", {Move("g/a", {}, JOB_STATE_DISPATCHED)}), 2000).status == TransitionStatus::kRejected);
}

void TestRecordAssignmentRespectsCapacity() {
  auto store = SeedGroup();
  store->ApplyTransitions(
      Batch("g", {Move("g/a", {JOB_STATE_PENDING}, JOB_STATE_READY), Move("g/c", {JOB_STATE_PENDING}, JOB_STATE_READY)}), 2000);

  assert(store->RecordAssignment("g/a", "w1", 2100) == TransitionStatus::kRejected); // unknown worker

  store->UpsertWorker(Worker("w1", 1));
  assert(store->RecordAssignment("g/a", "w1", 2100) == TransitionStatus::kApplied);
  assert(store->RecordAssignment("g/c", "w1", 2100) == TransitionStatus::kRejected); // full
  assert(store->RecordAssignment("g/a", "w1", 2100) == TransitionStatus::kConflict); // left Ready
  assert(store->RecordAssignment("g/b", "w1", 2100) == TransitionStatus::kConflict); // never Ready

  auto job = store->GetJob("g/a");
  assert(job->state == JOB_STATE_DISPATCHED);
  assert(job->worker_id == "w1");
  assert(job->dispatched_at_ms == 2100);

  auto worker = store->GetWorker("w1");
  assert(worker->load == 1);
  assert(worker->last_dispatch_ms == 2100);
  assert(store->ListWorkerJobs("w1").size() == 1);
}

void TestTerminalTransitionReleasesSlotAndRederivesGroup() {
  auto store = SeedGroup();
  store->UpsertWorker(Worker("w1", 2));
  store->ApplyTransitions(Batch("g", {Move("g/a", {}, JOB_STATE_READY), Move("g/c", {}, JOB_STATE_READY)}), 2000);
  assert(store->RecordAssignment("g/a", "w1", 2100) == TransitionStatus::kApplied);
  assert(store->RecordAssignment("g/c", "w1", 2100) == TransitionStatus::kApplied);

  auto running         = Move("g/a", {JOB_STATE_DISPATCHED}, JOB_STATE_RUNNING);
  running.expected_worker = "w1";
  assert(store->ApplyTransitions(Batch("g", {running}), 2200).status == TransitionStatus::kApplied);
  assert(store->GetJob("g/a")->started_at_ms == 2200);

  auto wrong_holder            = Move("g/a", {JOB_STATE_RUNNING}, JOB_STATE_COMPLETE);
  wrong_holder.expected_worker = "w2";
  assert(store->ApplyTransitions(Batch("g", {wrong_holder}), 2300).status == TransitionStatus::kConflict);

  auto done          = Move("g/a", {JOB_STATE_RUNNING}, JOB_STATE_COMPLETE);
  done.artifact_ref  = "artifacts/a";
  auto result        = store->ApplyTransitions(Batch("g", {done, Move("g/b", {JOB_STATE_PENDING}, JOB_STATE_READY)}), 2300);
  assert(result.status == TransitionStatus::kApplied);
  assert(result.groups.size() == 1);
  assert(result.groups[0].state == GROUP_STATE_QUEUED);
  assert(store->GetWorker("w1")->load == 1);

  auto a = store->GetJob("g/a");
  assert(a->artifact_ref == "artifacts/a");
  assert(a->completed_at_ms == 2300);
  assert(StateOf(*store, "g/b") == JOB_STATE_READY);

  auto failed   = Move("g/c", {JOB_STATE_DISPATCHED}, JOB_STATE_FAILED);
  failed.reason = "compile error";
  auto cascade  = Move("g/b", {JOB_STATE_READY}, JOB_STATE_DEPENDENCY_FAILED);
  result        = store->ApplyTransitions(Batch("g", {failed, cascade}), 2400);
  assert(result.status == TransitionStatus::kApplied);
  assert(result.groups[0].state == GROUP_STATE_FAILED);
  assert(result.groups[0].completed_at_ms == 2400);
  assert(store->GetWorker("w1")->load == 0);
  assert(store->GetJob("g/c")->failure_reason == "compile error");
  assert(store->ListOpenGroups().empty());

  // terminal rows never move again
  assert(store->ApplyTransitions(Batch("g", {Move("g/a", {}, JOB_STATE_CANCELED)}), 2500).status == TransitionStatus::kRejected);
}

void TestRequeueClearsAssignmentAndCountsRetry() {
  auto store = SeedGroup();
  store->UpsertWorker(Worker("w1", 1));
  store->ApplyTransitions(Batch("g", {Move("g/a", {}, JOB_STATE_READY)}), 2000);
  store->RecordAssignment("g/a", "w1", 2100);

  auto requeue        = Move("g/a", {JOB_STATE_DISPATCHED}, JOB_STATE_PENDING);
  requeue.count_retry = true;
  auto result = store->ApplyTransitions(Batch("g", {requeue, Move("g/a", {JOB_STATE_PENDING}, JOB_STATE_READY)}), 2200);
  assert(result.status == TransitionStatus::kApplied);
  assert(result.jobs.size() == 2);

  auto job = store->GetJob("g/a");
  assert(job->state == JOB_STATE_READY);
  assert(job->retry_count == 1);
  assert(job->worker_id.empty());
  assert(job->dispatched_at_ms == 0);
  assert(store->GetWorker("w1")->load == 0);
}

void TestCancelRequestMarksGroup() {
  auto store = SeedGroup();
  store->UpsertWorker(Worker("w1", 1));
  store->ApplyTransitions(Batch("g", {Move("g/a", {}, JOB_STATE_READY)}), 2000);
  store->RecordAssignment("g/a", "w1", 2100);

  TransitionBatch cancel = Batch("g", {Move("g/b", {}, JOB_STATE_CANCELED)});
  cancel.request_cancel  = true;
  auto result            = store->ApplyTransitions(cancel, 2200);
  assert(result.status == TransitionStatus::kApplied);
  assert(result.groups[0].state == GROUP_STATE_CANCEL_REQUESTED);
  assert(result.groups[0].cancel_requested);

  cancel = Batch("g", {Move("g/a", {}, JOB_STATE_CANCELED), Move("g/c", {}, JOB_STATE_CANCELED)});
  result = store->ApplyTransitions(cancel, 2300);
  assert(result.groups[0].state == GROUP_STATE_CANCELED);
  assert(store->GetWorker("w1")->load == 0);
}

void TestRemoveWorkerMustCoverHeldJobs() {
  auto store = SeedGroup();
  store->UpsertWorker(Worker("w1", 2));
  store->ApplyTransitions(Batch("g", {Move("g/a", {}, JOB_STATE_READY), Move("g/c", {}, JOB_STATE_READY)}), 2000);
  store->RecordAssignment("g/a", "w1", 2100);
  store->RecordAssignment("g/c", "w1", 2100);

  auto partial = store->RemoveWorker("w1", {Batch("g", {Move("g/a", {JOB_STATE_DISPATCHED}, JOB_STATE_PENDING)})}, 2000, 2200);
  assert(partial.status == TransitionStatus::kConflict);
  assert(store->GetWorker("w1").has_value());

  auto full = store->RemoveWorker(
      "w1", {Batch("g", {Move("g/a", {JOB_STATE_DISPATCHED}, JOB_STATE_PENDING), Move("g/c", {JOB_STATE_DISPATCHED}, JOB_STATE_PENDING)})},
      2000, 2200);
  assert(full.status == TransitionStatus::kApplied);
  assert(!store->GetWorker("w1").has_value());
  assert(store->ListWorkerJobs("w1").empty());

  // idle and unknown workers go away without batches
  store->UpsertWorker(Worker("idle", 1));
  assert(store->RemoveWorker("idle", {}, 2000, 2300).status == TransitionStatus::kApplied);
  assert(store->RemoveWorker("ghost", {}, 2000, 2300).status == TransitionStatus::kApplied);
}

void TestRemoveWorkerRefusesFreshHeartbeat() {
  auto store = SeedGroup();
  store->UpsertWorker(Worker("w1", 1));
  store->ApplyTransitions(Batch("g", {Move("g/a", {}, JOB_STATE_READY)}), 2000);
  store->RecordAssignment("g/a", "w1", 2100);

  // the sweep judged w1 stale before 1500, but a heartbeat landed since
  auto fresh = Worker("w1", 1);
  fresh.last_heartbeat_ms = 2200;
  store->UpsertWorker(fresh);

  auto result = store->RemoveWorker("w1", {Batch("g", {Move("g/a", {JOB_STATE_DISPATCHED}, JOB_STATE_PENDING)})}, 1500, 2300);
  assert(result.status == TransitionStatus::kRejected);
  assert(store->GetWorker("w1")->load == 1);
  auto job = store->GetJob("g/a");
  assert(job->state == JOB_STATE_DISPATCHED);
  assert(job->worker_id == "w1");
}

void TestCapacityNeverDropsBelowLoad() {
  auto store = SeedGroup();
  store->UpsertWorker(Worker("w1", 2));
  store->ApplyTransitions(Batch("g", {Move("g/a", {}, JOB_STATE_READY), Move("g/c", {}, JOB_STATE_READY)}), 2000);
  store->RecordAssignment("g/a", "w1", 2100);
  store->RecordAssignment("g/c", "w1", 2100);

  store->UpsertWorker(Worker("w1", 1));
  auto worker = store->GetWorker("w1");
  assert(worker->load == 2);
  assert(worker->capacity == 2);

  // once the jobs are gone the next heartbeat takes effect
  store->ApplyTransitions(Batch("g", {Move("g/a", {}, JOB_STATE_CANCELED), Move("g/c", {}, JOB_STATE_CANCELED)}), 2200);
  store->UpsertWorker(Worker("w1", 1));
  worker = store->GetWorker("w1");
  assert(worker->load == 0);
  assert(worker->capacity == 1);
}

void TestWorkerSuspectFlag() {
  auto store = NewStore();
  assert(!store->SetWorkerSuspect("nobody", true));

  store->UpsertWorker(Worker("w1", 1));
  assert(store->SetWorkerSuspect("w1", true));
  assert(store->GetWorker("w1")->suspect);

  // upsert keeps load, refreshes the rest
  auto refreshed              = Worker("w1", 4);
  refreshed.last_heartbeat_ms = 5000;
  store->UpsertWorker(refreshed);
  auto worker = store->GetWorker("w1");
  assert(!worker->suspect);
  assert(worker->capacity == 4);
  assert(worker->last_heartbeat_ms == 5000);
  assert(store->ListWorkers().size() == 1);
}

} // namespace

int main() {
  TestCreateGroupPersistsJobsInOrdinalOrder();
  TestDuplicateGroupRejected();
  TestRootsMayStartReady();
  TestReadyRequiresCompleteDependencies();
  TestExpectedStateMismatchIsConflictAndWritesNothing();
  TestIllegalAndForeignTransitionsRejected();
  TestRecordAssignmentRespectsCapacity();
  TestTerminalTransitionReleasesSlotAndRederivesGroup();
  TestRequeueClearsAssignmentAndCountsRetry();
  TestCancelRequestMarksGroup();
  TestRemoveWorkerMustCoverHeldJobs();
  TestRemoveWorkerRefusesFreshHeartbeat();
  TestCapacityNeverDropsBelowLoad();
  TestWorkerSuspectFlag();

  std::cout << "jobsrv_unit_state_store: pass\n";
  return 0;
}
