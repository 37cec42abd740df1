#include "group_plan.hpp"

#include <queue>
#include <unordered_set>

#include "internal/model/state_machine.hpp"

namespace jobsrv::scheduler {

namespace {

const std::vector<std::string> kNoDependents;

} // namespace

GroupPlan GroupPlan::FromJobs(const std::string& group_id, const std::vector<db::model::JobRecord>& jobs) {
  GroupPlan plan;
  plan.group_id_ = group_id;
  plan.order_.reserve(jobs.size());

  for (const auto& job : jobs) {
    plan.order_.push_back(job.id);
    auto& node    = plan.nodes_[job.id];
    node.complete = job.state == jobsrv::v1::JOB_STATE_COMPLETE;
    node.settled  = model::IsTerminal(job.state);
    node.pending  = job.state == jobsrv::v1::JOB_STATE_PENDING;
  }

  for (const auto& job : jobs) {
    auto& node = plan.nodes_[job.id];
    for (const auto& dep : job.dependencies) {
      auto it = plan.nodes_.find(dep);
      if (it == plan.nodes_.end()) {
        continue;
      }
      it->second.dependents.push_back(job.id);
      if (!it->second.complete) {
        ++node.remaining;
      }
    }
  }

  return plan;
}

const GroupPlan::Node* GroupPlan::Find(const std::string& job_id) const {
  auto it = nodes_.find(job_id);
  return it == nodes_.end() ? nullptr : &it->second;
}

bool GroupPlan::Contains(const std::string& job_id) const {
  return Find(job_id) != nullptr;
}

const std::vector<std::string>& GroupPlan::Dependents(const std::string& job_id) const {
  const auto* node = Find(job_id);
  return node ? node->dependents : kNoDependents;
}

std::vector<std::string> GroupPlan::TransitiveDependents(const std::string& job_id) const {
  std::vector<std::string>        out;
  std::queue<std::string>         q;
  std::unordered_set<std::string> visited;

  q.push(job_id);
  visited.insert(job_id);

  while (!q.empty()) {
    const auto current = q.front();
    q.pop();

    for (const auto& dependent : Dependents(current)) {
      if (!visited.insert(dependent).second)
        continue;
      out.push_back(dependent);
      q.push(dependent);
    }
  }

  return out;
}

uint32_t GroupPlan::Remaining(const std::string& job_id) const {
  const auto* node = Find(job_id);
  return node ? node->remaining : 0;
}

bool GroupPlan::IsSettled(const std::string& job_id) const {
  const auto* node = Find(job_id);
  return node && node->settled;
}

std::vector<std::string> GroupPlan::Promotable() const {
  std::vector<std::string> out;
  for (const auto& id : order_) {
    const auto& node = nodes_.at(id);
    if (node.pending && node.remaining == 0) {
      out.push_back(id);
    }
  }
  return out;
}

std::vector<std::string> GroupPlan::OpenJobs() const {
  std::vector<std::string> out;
  for (const auto& id : order_) {
    if (!nodes_.at(id).settled) {
      out.push_back(id);
    }
  }
  return out;
}

void GroupPlan::Observe(const db::model::JobRecord& job) {
  auto it = nodes_.find(job.id);
  if (it == nodes_.end()) {
    return;
  }

  auto& node   = it->second;
  node.pending = job.state == jobsrv::v1::JOB_STATE_PENDING;
  node.settled = model::IsTerminal(job.state);

  if (job.state == jobsrv::v1::JOB_STATE_COMPLETE && !node.complete) {
    node.complete = true;
    for (const auto& dependent : node.dependents) {
      auto& d = nodes_.at(dependent);
      if (d.remaining > 0) {
        --d.remaining;
      }
    }
  }
}

} // namespace jobsrv::scheduler
