// Copyright 2023 Seoul National University
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef PARCEL_WORKER_H_
#define PARCEL_WORKER_H_

#include <sys/types.h>

#include <functional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/optional.h"
#include "parcel/common.h"
#include "parcel/partitioner.h"
#include "parcel/payload.h"
#include "parcel/wire.h"

/**
 * @file worker.h
 * @brief Declaration of `parcel::WorkerProcess`, the coordinator-side handle
 * of one worker process.
 */

namespace parcel {

/**
 * @brief Identity of a worker process, handed to the initializer and to every
 * task the process runs.
 */
struct WorkerContext {
  WorkerId worker_id = -1;
  // Device the process is bound to; empty when workers are not bound.
  absl::optional<DeviceId> device_id;
  int device_count = 0;
  // Number of processes that held this slot before this one.
  int generation = 0;
};

// Work callback, run inside a worker process for each chunk.
using TaskFunction = std::function<absl::StatusOr<ResultSet>(
    const Chunk&, const WorkerContext&)>;
// Run once at the start of each worker process, before its first task.
using Initializer = std::function<absl::Status(const WorkerContext&)>;

/**
 * @class WorkerProcess
 * @brief Coordinator-side end of one worker process.
 *
 * `Start()` forks a process that runs the initializer and then serves tasks
 * sent over a private socket, one at a time, until it is told to shut down or
 * has completed `max_tasks` tasks. The process is a copy of the coordinator,
 * so the task function and the workload it reads need not be transferred.
 *
 * All methods are called from a single coordinator thread.
 */
class WorkerProcess {
 public:
  /**
   * @brief Constructs a WorkerProcess object; no process is started yet.
   * @param context Identity of the worker slot.
   */
  explicit WorkerProcess(const WorkerContext& context);

  /**
   * @brief Destroys the object. A process that was not ended is killed.
   */
  ~WorkerProcess();

  WorkerProcess(const WorkerProcess&) = delete;
  WorkerProcess& operator=(const WorkerProcess&) = delete;

  /**
   * @brief Forks the worker process. A slot restarted after recycling or a
   * loss keeps its identity and device; only its generation advances.
   * @param task_function Callback run for every task.
   * @param initializer Callback run once at process start. May be empty.
   * @param max_tasks Tasks after which the process exits, 0 for no limit.
   * @param inherited_fds Coordinator descriptors the child has to close.
   * @return The status of the fork.
   */
  absl::Status Start(const TaskFunction& task_function,
                     const Initializer& initializer, int max_tasks,
                     const std::vector<int>& inherited_fds);

  /**
   * @brief Sends a task to the idle process.
   * @return UnavailableError if the process has gone away.
   */
  absl::Status Dispatch(TaskId task_id, const Chunk& chunk);

  /**
   * @brief Reads the reply to the current task. Blocks until it is complete.
   */
  absl::StatusOr<Message> Receive();

  /**
   * @brief Marks the current task as answered.
   */
  void CompleteTask();

  /**
   * @brief Asks the process to exit and reaps it.
   */
  void End();

  /**
   * @brief Reaps a process that exited (or is about to exit) on its own.
   * @return A description of how the process terminated.
   */
  std::string Reap();

  /**
   * @brief Kills the process if it still runs and reaps it.
   * @return A description of how the process terminated.
   */
  std::string Kill();

  const WorkerContext& GetContext() const { return context_; }
  WorkerId GetId() const { return context_.worker_id; }
  pid_t GetPid() const { return pid_; }
  int GetFd() const { return fd_; }
  bool IsAlive() const { return pid_ > 0; }
  bool IsBusy() const { return current_task_id_ >= 0; }
  TaskId GetCurrentTaskId() const { return current_task_id_; }
  int GetCompletedTasks() const { return completed_tasks_; }

  /**
   * @brief Checks if the process reached its task limit and has exited.
   */
  bool NeedsRecycle() const;

  // Exit codes of the worker process
  static constexpr int kExitOk = 0;
  static constexpr int kExitInitializerFailure = 3;
  static constexpr int kExitLostCoordinator = 4;

 private:
  [[noreturn]] static void Work(int fd, const WorkerContext& context,
                                const TaskFunction& task_function,
                                const Initializer& initializer, int max_tasks);

  WorkerContext context_;
  pid_t pid_ = -1;
  int fd_ = -1;
  int max_tasks_ = 0;
  int num_starts_ = 0;
  int completed_tasks_ = 0;
  TaskId current_task_id_ = -1;
};

}  // namespace parcel

#endif  // PARCEL_WORKER_H_
