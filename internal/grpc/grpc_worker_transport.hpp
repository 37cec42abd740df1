#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <grpcpp/channel.h>

#include "internal/dispatch/worker_transport.hpp"
#include "jobsrv/v1.hpp"

namespace jobsrv::grpc {

/*
  WorkerTransport over the BuildWorker gRPC service.

  One channel per worker endpoint, created on first use and kept. Every call
  carries the configured deadline.
*/
class GrpcWorkerTransport : public dispatch::WorkerTransport {
 public:
  explicit GrpcWorkerTransport(std::chrono::milliseconds send_timeout);

  bool Send(const db::model::WorkerRecord& worker, const jobsrv::v1::JobAssignment& assignment) override;
  bool Abort(const db::model::WorkerRecord& worker, const jobsrv::v1::JobAbort& abort) override;

 private:
  std::shared_ptr<jobsrv::v1::BuildWorker::Stub> StubFor(const std::string& endpoint);

  std::chrono::milliseconds send_timeout_;

  std::mutex                                                                     mutex_;
  std::unordered_map<std::string, std::shared_ptr<jobsrv::v1::BuildWorker::Stub>> stubs_;
};

} // namespace jobsrv::grpc
