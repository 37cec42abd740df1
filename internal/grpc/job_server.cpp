#include "job_server.hpp"
#include "grpc_error.hpp"

namespace jobsrv::grpc {

JobServer::JobServer(std::shared_ptr<jobsrv::service::JobService> svc)
    : service_(std::move(svc)) {}

::grpc::Status JobServer::SubmitGroup(::grpc::ServerContext*,
                                      const jobsrv::v1::SubmitGroupRequest* req,
                                      jobsrv::v1::SubmitGroupResponse* resp) {
  try {
    *resp = service_->SubmitGroup(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::GetGroup(::grpc::ServerContext*,
                                   const jobsrv::v1::GetGroupRequest* req,
                                   jobsrv::v1::GetGroupResponse* resp) {
  try {
    *resp = service_->GetGroup(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::GetJob(::grpc::ServerContext*,
                                 const jobsrv::v1::GetJobRequest* req,
                                 jobsrv::v1::GetJobResponse* resp) {
  try {
    *resp = service_->GetJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::CancelGroup(::grpc::ServerContext*,
                                      const jobsrv::v1::CancelGroupRequest* req,
                                      jobsrv::v1::CancelGroupResponse* resp) {
  try {
    *resp = service_->CancelGroup(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::ReportJob(::grpc::ServerContext*,
                                    const jobsrv::v1::JobReport* req,
                                    jobsrv::v1::ReportJobResponse*) {
  try {
    service_->ReportJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::SendHeartbeat(::grpc::ServerContext*,
                                        const jobsrv::v1::Heartbeat* req,
                                        jobsrv::v1::HeartbeatResponse*) {
  try {
    service_->Heartbeat(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
