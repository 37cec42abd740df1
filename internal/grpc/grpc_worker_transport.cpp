#include "grpc_worker_transport.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "internal/observability/logging.hpp"

namespace jobsrv::grpc {

using observability::StringField;

GrpcWorkerTransport::GrpcWorkerTransport(std::chrono::milliseconds send_timeout) : send_timeout_(send_timeout) {
}

std::shared_ptr<jobsrv::v1::BuildWorker::Stub> GrpcWorkerTransport::StubFor(const std::string& endpoint) {
  std::lock_guard lock(mutex_);
  auto&           stub = stubs_[endpoint];
  if (!stub) {
    auto channel = ::grpc::CreateChannel(endpoint, ::grpc::InsecureChannelCredentials());
    stub         = jobsrv::v1::BuildWorker::NewStub(channel);
  }
  return stub;
}

bool GrpcWorkerTransport::Send(const db::model::WorkerRecord& worker, const jobsrv::v1::JobAssignment& assignment) {
  if (worker.endpoint.empty()) return false;

  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + send_timeout_);

  jobsrv::v1::WorkerAck ack;
  const auto            status = StubFor(worker.endpoint)->Assign(&ctx, assignment, &ack);
  if (!status.ok()) {
    JOBSRV_LOG_DEBUG("assign rpc failed", {StringField("worker_id", worker.id), StringField("error", status.error_message())});
    return false;
  }
  if (!ack.accepted()) {
    JOBSRV_LOG_DEBUG("assignment refused", {StringField("worker_id", worker.id), StringField("message", ack.message())});
  }
  return ack.accepted();
}

bool GrpcWorkerTransport::Abort(const db::model::WorkerRecord& worker, const jobsrv::v1::JobAbort& abort) {
  if (worker.endpoint.empty()) return false;

  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + send_timeout_);

  jobsrv::v1::WorkerAck ack;
  const auto            status = StubFor(worker.endpoint)->Abort(&ctx, abort, &ack);
  return status.ok() && ack.accepted();
}

} // namespace jobsrv::grpc
