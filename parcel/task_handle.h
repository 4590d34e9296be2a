#ifndef PARCEL_TASK_HANDLE_H_
#define PARCEL_TASK_HANDLE_H_

#include <future>

#include "absl/status/statusor.h"
#include "parcel/common.h"
#include "parcel/payload.h"

namespace parcel {

// Eventual result of one submitted task. Move-only; resolved exactly once by
// Get().
class TaskHandle {
 public:
  TaskHandle() = default;
  TaskHandle(TaskId task_id, std::future<absl::StatusOr<ResultSet>> future);

  TaskHandle(TaskHandle&&) = default;
  TaskHandle& operator=(TaskHandle&&) = default;

  TaskId GetId() const { return task_id_; }
  // False once the result has been taken
  bool IsValid() const { return future_.valid(); }
  bool IsReady() const;
  // Blocks until the task completed, successfully or not
  void Wait() const;
  // Blocks until the task completed and takes its result
  absl::StatusOr<ResultSet> Get();

 private:
  TaskId task_id_ = -1;
  std::future<absl::StatusOr<ResultSet>> future_;
};

}  // namespace parcel

#endif  // PARCEL_TASK_HANDLE_H_
