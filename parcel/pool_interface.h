#ifndef PARCEL_POOL_INTERFACE_H_
#define PARCEL_POOL_INTERFACE_H_

#include <cstddef>

#include "absl/status/statusor.h"
#include "parcel/partitioner.h"
#include "parcel/task_handle.h"

namespace parcel {

// Minimal interface the task submitter needs from a pool
class IWorkerPool {
 public:
  IWorkerPool() = default;
  virtual ~IWorkerPool() = default;

  // Enqueues one chunk; never blocks on task execution.
  virtual absl::StatusOr<TaskHandle> Submit(const Chunk& chunk) = 0;
  virtual size_t GetNumWorkers() const = 0;
};

}  // namespace parcel

#endif  // PARCEL_POOL_INTERFACE_H_
