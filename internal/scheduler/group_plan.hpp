#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/model/job_record.hpp"

namespace jobsrv::scheduler {

/*
  In-memory dependency cache for one group.

  Holds the reverse-dependency index and, per job, the number of dependencies
  not yet Complete. Everything here is rebuildable from the job rows; the
  counters only move through Observe() after a commit, so a stale plan can
  produce a transition the store refuses but never one it accepts wrongly.
*/
class GroupPlan {
 public:
  static GroupPlan FromJobs(const std::string& group_id, const std::vector<db::model::JobRecord>& jobs);

  const std::string& GroupId() const {
    return group_id_;
  }

  bool Contains(const std::string& job_id) const;

  // Direct dependents, in job order.
  const std::vector<std::string>& Dependents(const std::string& job_id) const;

  // Every job reachable along reverse edges, breadth first, without job_id.
  std::vector<std::string> TransitiveDependents(const std::string& job_id) const;

  uint32_t Remaining(const std::string& job_id) const;
  bool     IsSettled(const std::string& job_id) const;

  // Pending jobs whose dependencies are all Complete.
  std::vector<std::string> Promotable() const;

  // Jobs not yet terminal, in job order.
  std::vector<std::string> OpenJobs() const;

  // Folds a committed row into the cache. Idempotent.
  void Observe(const db::model::JobRecord& job);

 private:
  struct Node {
    std::vector<std::string> dependents;
    uint32_t                 remaining = 0;
    bool                     complete  = false;
    bool                     settled   = false;
    bool                     pending   = false;
  };

  const Node* Find(const std::string& job_id) const;

  std::string                           group_id_;
  std::vector<std::string>              order_;
  std::unordered_map<std::string, Node> nodes_;
};

} // namespace jobsrv::scheduler
