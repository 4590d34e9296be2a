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

#ifndef PARCEL_WORKER_POOL_H_
#define PARCEL_WORKER_POOL_H_

#include <sys/types.h>

#include <atomic>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/optional.h"
#include "parcel/config.h"
#include "parcel/device_assigner.h"
#include "parcel/pool_interface.h"
#include "parcel/progress.h"
#include "parcel/worker.h"

namespace parcel {

/**
 * @class WorkerPool
 * @brief Fixed set of worker processes fed from one task queue.
 *
 * A dispatcher thread owns the worker processes. It hands queued tasks to idle
 * workers, multiplexes their sockets with poll(2), fulfils the task promises
 * and restarts workers that reached their task limit or died. Submission only
 * touches the queue and never waits for execution.
 *
 * Worker slot i is bound to device i % device_count for the pool's lifetime,
 * including every process that later replaces the slot's first one.
 */
class WorkerPool : public IWorkerPool {
 public:
  /**
   * @brief Spawns `config.num_workers` processes and starts dispatching.
   * @param config Pool size, recycle threshold and device count.
   * @param task_function Callback run in the workers for every chunk.
   * @param initializer Callback run once per worker process. May be empty.
   * @param progress Channel receiving one event per resolved task. May be
   * null; must outlive the pool.
   * @return ConfigurationError for an invalid config, or the spawn error.
   */
  static absl::StatusOr<std::unique_ptr<WorkerPool>> Create(
      const PoolConfig& config, TaskFunction task_function,
      Initializer initializer = nullptr, ProgressChannel* progress = nullptr);

  // Shuts the pool down if the owner did not.
  ~WorkerPool() override;

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  /**
   * @brief Enqueues a chunk.
   * @return PoolClosedError once Shutdown() has begun.
   */
  absl::StatusOr<TaskHandle> Submit(const Chunk& chunk) override;

  size_t GetNumWorkers() const override { return config_.num_workers; }

  /**
   * @brief Stops accepting tasks, waits for every submitted task to finish
   * and releases the worker processes. Idempotent.
   */
  void Shutdown();

  bool IsClosed() const;
  absl::optional<DeviceId> GetWorkerDevice(WorkerId worker_id) const;

  // Probes
  size_t GetNumAliveWorkers() const { return num_alive_workers_; }
  size_t GetNumRecycledWorkers() const { return num_recycled_workers_; }
  size_t GetNumLostWorkers() const { return num_lost_workers_; }
  int GetNumReleases() const { return num_releases_; }
  // Every process the pool has forked, in spawn order
  std::vector<pid_t> GetSpawnedPids() const;

 private:
  struct PendingTask {
    TaskId task_id = -1;
    Chunk chunk;
    std::promise<absl::StatusOr<ResultSet>> promise;
    uint64_t dispatch_time = 0;
  };

  WorkerPool(const PoolConfig& config, TaskFunction task_function,
             Initializer initializer, ProgressChannel* progress);

  absl::Status Init();
  absl::Status SpawnWorker(WorkerProcess& worker);
  std::vector<int> GetCoordinatorFds() const;

  // Dispatcher thread
  void Dispatch();
  void AssignPendingTasks();
  void HandleReply(WorkerProcess& worker);
  void HandleLoss(WorkerProcess& worker, const std::string& reason);
  void Recycle(WorkerProcess& worker);
  void Resolve(PendingTask& task, WorkerId worker_id, TaskStatus status,
               absl::StatusOr<ResultSet> result);
  void FailPendingTasks(const std::string& reason);
  void Wake();
  void DrainWake();

  const PoolConfig config_;
  const TaskFunction task_function_;
  const Initializer initializer_;
  ProgressChannel* const progress_;
  const DeviceAssigner device_assigner_;

  // Owned by the dispatcher thread once it runs
  std::vector<std::unique_ptr<WorkerProcess>> workers_;
  std::map<WorkerId, PendingTask> in_flight_;

  mutable std::mutex mtx_;
  std::deque<PendingTask> pending_;
  bool closing_ = false;
  TaskId next_task_id_ = 0;
  std::vector<pid_t> spawned_pids_;

  std::atomic<size_t> num_alive_workers_{0};
  std::atomic<size_t> num_recycled_workers_{0};
  std::atomic<size_t> num_lost_workers_{0};
  std::atomic<int> num_releases_{0};

  std::once_flag shutdown_flag_;
  // self-pipe waking the dispatcher out of poll(2)
  int wake_fds_[2] = {-1, -1};
  std::thread dispatcher_;
};

}  // namespace parcel

#endif  // PARCEL_WORKER_POOL_H_
