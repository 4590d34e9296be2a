#ifndef PARCEL_ERROR_H_
#define PARCEL_ERROR_H_

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "parcel/common.h"

namespace parcel {

// Error taxonomy of the execution engine. Every error is an absl::Status
// with the code below and a payload under kErrorCategoryUrl naming its
// category. Other statuses with the same code (system call failures, misuse of
// a handle) carry no payload and match none of the predicates.
//
//   ConfigurationError    kInvalidArgument    rejected before any worker starts
//   PoolClosedError       kFailedPrecondition submit after shutdown began
//   WorkerExecutionError  kInternal           work callback failed in a worker
//   WorkerProcessLoss     kAborted            worker process died with a task

extern const char kErrorCategoryUrl[];

absl::Status ConfigurationError(absl::string_view message);
absl::Status PoolClosedError(absl::string_view message);
absl::Status WorkerExecutionError(WorkerId worker_id, TaskId task_id,
                                  absl::string_view message);
absl::Status WorkerProcessLoss(WorkerId worker_id, TaskId task_id,
                               absl::string_view message);

bool IsConfigurationError(const absl::Status& status);
bool IsPoolClosedError(const absl::Status& status);
bool IsWorkerExecutionError(const absl::Status& status);
bool IsWorkerProcessLoss(const absl::Status& status);

}  // namespace parcel

#endif  // PARCEL_ERROR_H_
