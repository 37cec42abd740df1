#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/job_service.hpp"
#include "jobsrv/v1.hpp"

namespace jobsrv::grpc {

class JobServer final : public jobsrv::v1::JobServer::Service {
public:
  explicit JobServer(std::shared_ptr<jobsrv::service::JobService> svc);

  ::grpc::Status SubmitGroup(::grpc::ServerContext* ctx,
                             const jobsrv::v1::SubmitGroupRequest* req,
                             jobsrv::v1::SubmitGroupResponse* resp) override;

  ::grpc::Status GetGroup(::grpc::ServerContext* ctx,
                          const jobsrv::v1::GetGroupRequest* req,
                          jobsrv::v1::GetGroupResponse* resp) override;

  ::grpc::Status GetJob(::grpc::ServerContext* ctx,
                        const jobsrv::v1::GetJobRequest* req,
                        jobsrv::v1::GetJobResponse* resp) override;

  ::grpc::Status CancelGroup(::grpc::ServerContext* ctx,
                             const jobsrv::v1::CancelGroupRequest* req,
                             jobsrv::v1::CancelGroupResponse* resp) override;

  ::grpc::Status ReportJob(::grpc::ServerContext* ctx,
                           const jobsrv::v1::JobReport* req,
                           jobsrv::v1::ReportJobResponse* resp) override;

  ::grpc::Status SendHeartbeat(::grpc::ServerContext* ctx,
                               const jobsrv::v1::Heartbeat* req,
                               jobsrv::v1::HeartbeatResponse* resp) override;

private:
  std::shared_ptr<jobsrv::service::JobService> service_;
};

}
