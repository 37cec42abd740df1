#pragma once

#include "jobsrv/v1/types.pb.h"
#include "jobsrv/v1/worker.pb.h"
#include "jobsrv/v1/jobsrv_service.pb.h"

#ifdef JOBSRV_WITH_GRPC
#include "jobsrv/v1/worker.grpc.pb.h"
#include "jobsrv/v1/jobsrv_service.grpc.pb.h"
#endif
