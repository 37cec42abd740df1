#pragma once

#include "jobsrv/v1.hpp"
#include "service_context.hpp"

namespace jobsrv::service {

/*
  Application service behind the JobServer RPC surface.

  Client side: submission, status queries, cancellation.
  Worker side: reports and heartbeats, handed to the StatusIngestor.
*/
class JobService {
public:
  explicit JobService(ServiceContext ctx);

  // Throws a util::ValidationError subclass for a rejected graph; nothing
  // is stored in that case.
  jobsrv::v1::SubmitGroupResponse
  SubmitGroup(const jobsrv::v1::SubmitGroupRequest& req);

  jobsrv::v1::GetGroupResponse
  GetGroup(const jobsrv::v1::GetGroupRequest& req);

  jobsrv::v1::GetJobResponse
  GetJob(const jobsrv::v1::GetJobRequest& req);

  // Idempotent once the group is terminal.
  jobsrv::v1::CancelGroupResponse
  CancelGroup(const jobsrv::v1::CancelGroupRequest& req);

  void ReportJob(const jobsrv::v1::JobReport& report);

  void Heartbeat(const jobsrv::v1::Heartbeat& heartbeat);

private:
  ServiceContext ctx_;
};

}
