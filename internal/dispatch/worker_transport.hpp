#pragma once

#include "internal/db/model/worker_record.hpp"
#include "jobsrv/v1.hpp"

namespace jobsrv::dispatch {

/*
  Delivery of scheduler -> worker messages.

  Calls block for at most the transport's send timeout and are never made
  while a state lock is held. false means the message was not accepted.
*/
class WorkerTransport {
 public:
  virtual ~WorkerTransport() = default;

  virtual bool Send(const db::model::WorkerRecord& worker, const jobsrv::v1::JobAssignment& assignment) = 0;

  virtual bool Abort(const db::model::WorkerRecord& worker, const jobsrv::v1::JobAbort& abort) = 0;
};

} // namespace jobsrv::dispatch
