#pragma once

#include <string_view>

#include "jobsrv/v1.hpp"

namespace jobsrv::model {

using JobState   = jobsrv::v1::JobState;
using GroupState = jobsrv::v1::GroupState;

constexpr bool IsTerminal(JobState state) {
  switch (state) {
    case jobsrv::v1::JOB_STATE_COMPLETE:
    case jobsrv::v1::JOB_STATE_FAILED:
    case jobsrv::v1::JOB_STATE_DEPENDENCY_FAILED:
    case jobsrv::v1::JOB_STATE_CANCELED:
      return true;
    default:
      return false;
  }
}

// Job is held by a worker and counts against its load.
constexpr bool IsAssigned(JobState state) {
  return state == jobsrv::v1::JOB_STATE_DISPATCHED || state == jobsrv::v1::JOB_STATE_RUNNING;
}

constexpr bool IsTerminal(GroupState state) {
  return state == jobsrv::v1::GROUP_STATE_COMPLETE || state == jobsrv::v1::GROUP_STATE_FAILED ||
         state == jobsrv::v1::GROUP_STATE_CANCELED;
}

/*
  Job state machine.

    Pending    -> Ready | DependencyFailed | Canceled
    Ready      -> Dispatched | DependencyFailed | Canceled
    Dispatched -> Running | Complete | Failed | Pending | Canceled
    Running    -> Complete | Failed | Pending | Canceled

  Pending after Dispatched/Running is the requeue after worker loss.
  Terminal states never move.
*/
constexpr bool CanTransition(JobState from, JobState to) {
  using namespace jobsrv::v1;

  if (IsTerminal(from) || from == JOB_STATE_UNSPECIFIED || to == JOB_STATE_UNSPECIFIED) {
    return false;
  }
  if (to == JOB_STATE_CANCELED) {
    return true;
  }

  switch (from) {
    case JOB_STATE_PENDING:
      return to == JOB_STATE_READY || to == JOB_STATE_DEPENDENCY_FAILED;
    case JOB_STATE_READY:
      return to == JOB_STATE_DISPATCHED || to == JOB_STATE_DEPENDENCY_FAILED;
    case JOB_STATE_DISPATCHED:
      return to == JOB_STATE_RUNNING || to == JOB_STATE_COMPLETE || to == JOB_STATE_FAILED || to == JOB_STATE_PENDING;
    case JOB_STATE_RUNNING:
      return to == JOB_STATE_COMPLETE || to == JOB_STATE_FAILED || to == JOB_STATE_PENDING;
    default:
      return false;
  }
}

/*
  Aggregate over member states, fed one job at a time.

  The group stays Queued while any member is non-terminal, even after a
  failure: independent jobs may still complete and are allowed to finish.
*/
class GroupStateAccumulator {
 public:
  void Add(JobState state) {
    ++total_;
    if (!IsTerminal(state)) {
      ++open_;
    } else if (state == jobsrv::v1::JOB_STATE_FAILED || state == jobsrv::v1::JOB_STATE_DEPENDENCY_FAILED) {
      ++failed_;
    } else if (state == jobsrv::v1::JOB_STATE_CANCELED) {
      ++canceled_;
    }
  }

  GroupState Derive(bool cancel_requested) const {
    using namespace jobsrv::v1;

    if (open_ > 0) {
      return cancel_requested ? GROUP_STATE_CANCEL_REQUESTED : GROUP_STATE_QUEUED;
    }
    if (cancel_requested || canceled_ > 0) {
      return GROUP_STATE_CANCELED;
    }
    if (failed_ > 0) {
      return GROUP_STATE_FAILED;
    }
    return total_ == 0 ? GROUP_STATE_QUEUED : GROUP_STATE_COMPLETE;
  }

 private:
  int total_    = 0;
  int open_     = 0;
  int failed_   = 0;
  int canceled_ = 0;
};

constexpr std::string_view ShortName(JobState state) {
  switch (state) {
    case jobsrv::v1::JOB_STATE_PENDING:
      return "pending";
    case jobsrv::v1::JOB_STATE_READY:
      return "ready";
    case jobsrv::v1::JOB_STATE_DISPATCHED:
      return "dispatched";
    case jobsrv::v1::JOB_STATE_RUNNING:
      return "running";
    case jobsrv::v1::JOB_STATE_COMPLETE:
      return "complete";
    case jobsrv::v1::JOB_STATE_FAILED:
      return "failed";
    case jobsrv::v1::JOB_STATE_DEPENDENCY_FAILED:
      return "dependency_failed";
    case jobsrv::v1::JOB_STATE_CANCELED:
      return "canceled";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ShortName(GroupState state) {
  switch (state) {
    case jobsrv::v1::GROUP_STATE_QUEUED:
      return "queued";
    case jobsrv::v1::GROUP_STATE_COMPLETE:
      return "complete";
    case jobsrv::v1::GROUP_STATE_FAILED:
      return "failed";
    case jobsrv::v1::GROUP_STATE_CANCEL_REQUESTED:
      return "cancel_requested";
    case jobsrv::v1::GROUP_STATE_CANCELED:
      return "canceled";
    default:
      return "unspecified";
  }
}

} // namespace jobsrv::model
