#include "job_service.hpp"

#include <algorithm>
#include <chrono>
#include <type_traits>
#include <unordered_map>

#include "internal/core/state_store.hpp"
#include "internal/dispatch/dispatcher.hpp"
#include "internal/graph/graph_builder.hpp"
#include "internal/ingest/status_ingestor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/scheduler/scheduler.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace jobsrv::service {

using namespace jobsrv::v1;
using jobsrv::db::model::GroupRecord;
using jobsrv::db::model::JobRecord;

namespace {

void SetTime(uint64_t unix_ms, google::protobuf::Timestamp* out) {
  if (unix_ms != 0) {
    *out = jobsrv::util::MillisToProto(unix_ms);
  }
}

Job ToProto(const JobRecord& record) {
  Job job;
  job.set_id(record.id);
  job.set_group_id(record.group_id);
  job.set_ordinal(record.ordinal);
  job.set_project(record.project);
  job.set_target(record.target);
  for (const auto& dep : record.dependencies) {
    job.add_dependencies(dep);
  }
  job.set_state(record.state);
  job.set_worker_id(record.worker_id);
  job.set_retry_count(record.retry_count);
  job.set_failure_reason(record.failure_reason);
  job.set_artifact_ref(record.artifact_ref);
  job.set_inputs_ref(record.inputs_ref);
  for (const auto& tag : record.tags) {
    job.add_tags(tag);
  }
  SetTime(record.created_at_ms, job.mutable_created_at());
  SetTime(record.dispatched_at_ms, job.mutable_dispatched_at());
  SetTime(record.started_at_ms, job.mutable_started_at());
  SetTime(record.completed_at_ms, job.mutable_completed_at());
  return job;
}

JobGroup ToProto(const GroupRecord& record) {
  JobGroup group;
  group.set_id(record.id);
  group.set_state(record.state);
  group.set_target(record.target);
  group.set_cancel_requested(record.cancel_requested);
  SetTime(record.created_at_ms, group.mutable_created_at());
  SetTime(record.completed_at_ms, group.mutable_completed_at());
  return group;
}

// A worker must offer the job's target platform plus every extra tag.
std::vector<std::string> RequiredTags(const jobsrv::graph::BuildNode& node) {
  std::vector<std::string> tags{node.target};
  for (const auto& tag : node.tags) {
    if (std::find(tags.begin(), tags.end(), tag) == tags.end()) {
      tags.push_back(tag);
    }
  }
  return tags;
}

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  jobsrv::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute("subject.id", subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    jobsrv::observability::Metrics::Instance().RecordRequest(route, success);
    jobsrv::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const jobsrv::util::ValidationError& ex) {
    // caller error, not a server fault
    span.RecordException(ex.what());
    JOBSRV_LOG_WARN("RPC rejected", {jobsrv::observability::StringField("route", route), jobsrv::observability::StringField("error", ex.what())});
    finish(false);
    throw;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    JOBSRV_LOG_ERROR("RPC failed", {jobsrv::observability::StringField("route", route), jobsrv::observability::StringField("error", ex.what()),
                                    jobsrv::observability::StringField("subject", subject)});
    finish(false);
    throw;
  }
}

} // namespace

JobService::JobService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitGroupResponse JobService::SubmitGroup(const SubmitGroupRequest& req) {
  return ObserveRpc("JobService.SubmitGroup", "", [&] {
    const auto graph  = jobsrv::graph::GraphBuilder::FromSubmission(req.graph());
    const auto now_ms = jobsrv::util::NowMillis();

    GroupRecord group;
    group.id            = jobsrv::util::NewId();
    group.state         = GROUP_STATE_QUEUED;
    group.target        = graph.Target();
    group.created_at_ms = now_ms;

    const auto& nodes = graph.Nodes();
    std::vector<std::string> ids(nodes.size());
    for (auto& id : ids) {
      id = jobsrv::util::NewId();
    }

    // topological order: every job is inserted after its dependencies
    std::vector<JobRecord> jobs;
    jobs.reserve(nodes.size());
    uint32_t ordinal = 0;
    for (const auto index : graph.TopologicalOrder()) {
      const auto& node = nodes[index];

      JobRecord job;
      job.id            = ids[index];
      job.group_id      = group.id;
      job.ordinal       = ordinal++;
      job.project       = node.project;
      job.target        = node.target;
      job.tags          = RequiredTags(node);
      job.inputs_ref    = node.inputs_ref;
      job.state         = node.dependencies.empty() ? JOB_STATE_READY : JOB_STATE_PENDING;
      job.created_at_ms = now_ms;
      for (const auto dep : node.dependencies) {
        job.dependencies.push_back(ids[dep]);
      }
      jobs.push_back(std::move(job));
    }

    ctx_.store->CreateGroup(group, jobs);
    JOBSRV_LOG_INFO("group submitted", {jobsrv::observability::StringField("group_id", group.id),
                                        jobsrv::observability::StringField("target", group.target),
                                        jobsrv::observability::IntField("jobs", static_cast<std::int64_t>(jobs.size()))});

    // roots were committed Ready; the group is complete as stored
    ctx_.scheduler->NotifyReady();

    SubmitGroupResponse resp;
    resp.set_group_id(group.id);
    return resp;
  });
}

GetGroupResponse JobService::GetGroup(const GetGroupRequest& req) {
  return ObserveRpc("JobService.GetGroup", req.group_id(), [&] {
    auto group = ctx_.store->GetGroup(req.group_id());
    if (!group) {
      throw jobsrv::util::NotFound("group not found: " + req.group_id());
    }

    GetGroupResponse resp;
    auto*            out = resp.mutable_group();
    *out                 = ToProto(*group);

    for (const auto& job : ctx_.store->ListGroupJobs(group->id)) {
      if (job.state == JOB_STATE_FAILED) {
        out->add_failed_job_ids(job.id);
      }
      if (req.include_jobs()) {
        *out->add_jobs() = ToProto(job);
      }
    }
    return resp;
  });
}

GetJobResponse JobService::GetJob(const GetJobRequest& req) {
  return ObserveRpc("JobService.GetJob", req.job_id(), [&] {
    auto job = ctx_.store->GetJob(req.job_id());
    if (!job) {
      throw jobsrv::util::NotFound("job not found: " + req.job_id());
    }

    GetJobResponse resp;
    *resp.mutable_job() = ToProto(*job);
    return resp;
  });
}

CancelGroupResponse JobService::CancelGroup(const CancelGroupRequest& req) {
  return ObserveRpc("JobService.CancelGroup", req.group_id(), [&] {
    const auto outcome = ctx_.scheduler->CancelGroup(req.group_id(), jobsrv::util::NowMillis());

    // no lock held here; workers may be slow or gone
    if (!outcome.aborts.empty()) {
      ctx_.dispatcher->SendAborts(outcome.aborts);
    }

    CancelGroupResponse resp;
    resp.set_state(outcome.state);
    resp.set_canceled_jobs(static_cast<uint32_t>(outcome.canceled_jobs.size()));
    return resp;
  });
}

void JobService::ReportJob(const JobReport& report) {
  ObserveRpc("JobService.ReportJob", report.job_id(), [&] { ctx_.ingestor->Submit(report); });
}

void JobService::Heartbeat(const jobsrv::v1::Heartbeat& heartbeat) {
  ObserveRpc("JobService.Heartbeat", heartbeat.worker_id(), [&] { ctx_.ingestor->Submit(heartbeat); });
}

}
