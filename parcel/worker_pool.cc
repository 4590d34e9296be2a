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

#include "parcel/worker_pool.h"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "absl/strings/str_format.h"
#include "parcel/error.h"
#include "parcel/logger.h"
#include "parcel/time.h"

namespace parcel {

absl::StatusOr<std::unique_ptr<WorkerPool>> WorkerPool::Create(
    const PoolConfig& config, TaskFunction task_function,
    Initializer initializer, ProgressChannel* progress) {
  if (config.num_workers <= 0) {
    return ConfigurationError(absl::StrFormat(
        "Pool requires at least one worker, got %d", config.num_workers));
  }
  if (config.max_tasks_per_worker < 0) {
    return ConfigurationError(
        absl::StrFormat("Invalid max_tasks_per_worker %d",
                        config.max_tasks_per_worker));
  }
  if (!task_function) {
    return ConfigurationError("Pool requires a task function");
  }

  std::unique_ptr<WorkerPool> pool(new WorkerPool(
      config, std::move(task_function), std::move(initializer), progress));
  RETURN_IF_ERROR(pool->Init());
  return pool;
}

WorkerPool::WorkerPool(const PoolConfig& config, TaskFunction task_function,
                       Initializer initializer, ProgressChannel* progress)
    : config_(config),
      task_function_(std::move(task_function)),
      initializer_(std::move(initializer)),
      progress_(progress),
      device_assigner_(config.device_count, config.num_workers) {}

WorkerPool::~WorkerPool() {
  Shutdown();
  // A Submit racing with Shutdown may still Wake() until this point
  for (int& fd : wake_fds_) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }
}

absl::Status WorkerPool::Init() {
  if (pipe2(wake_fds_, O_NONBLOCK | O_CLOEXEC) != 0) {
    return absl::InternalError(
        absl::StrFormat("Failed to create wake pipe: %s", strerror(errno)));
  }

  for (WorkerId worker_id = 0; worker_id < config_.num_workers; worker_id++) {
    WorkerContext context;
    context.worker_id = worker_id;
    context.device_id = device_assigner_.GetDevice(worker_id);
    context.device_count = config_.device_count;
    workers_.emplace_back(new WorkerProcess(context));
    RETURN_IF_ERROR(SpawnWorker(*workers_.back()));
  }

  PARCEL_LOG_DEBUG("Started %d workers (device count %d)",
                   config_.num_workers, config_.device_count);
  dispatcher_ = std::thread([this] { this->Dispatch(); });
  return absl::OkStatus();
}

absl::Status WorkerPool::SpawnWorker(WorkerProcess& worker) {
  absl::Status status =
      worker.Start(task_function_, initializer_, config_.max_tasks_per_worker,
                   GetCoordinatorFds());
  if (!status.ok()) {
    return status;
  }
  num_alive_workers_++;
  std::lock_guard<std::mutex> lock(mtx_);
  spawned_pids_.push_back(worker.GetPid());
  return absl::OkStatus();
}

std::vector<int> WorkerPool::GetCoordinatorFds() const {
  std::vector<int> fds;
  for (int fd : wake_fds_) {
    if (fd >= 0) {
      fds.push_back(fd);
    }
  }
  for (auto& worker : workers_) {
    if (worker->GetFd() >= 0) {
      fds.push_back(worker->GetFd());
    }
  }
  return fds;
}

absl::StatusOr<TaskHandle> WorkerPool::Submit(const Chunk& chunk) {
  TaskHandle handle;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closing_) {
      return PoolClosedError(absl::StrFormat(
          "Cannot submit chunk %s to a pool that is shutting down",
          chunk.ToString()));
    }
    PendingTask task;
    task.task_id = next_task_id_++;
    task.chunk = chunk;
    handle = TaskHandle(task.task_id, task.promise.get_future());
    pending_.push_back(std::move(task));
  }
  Wake();
  return handle;
}

void WorkerPool::Shutdown() {
  std::call_once(shutdown_flag_, [this]() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      closing_ = true;
    }
    Wake();

    if (dispatcher_.joinable()) {
      dispatcher_.join();
    } else {
      // Init failed before dispatching started
      for (auto& worker : workers_) {
        if (worker->IsAlive()) {
          worker->End();
          num_alive_workers_--;
        }
      }
      FailPendingTasks("pool failed to start");
    }

    num_releases_++;
    PARCEL_LOG_DEBUG("Pool released (%zu recycled, %zu lost)",
                     num_recycled_workers_.load(), num_lost_workers_.load());
  });
}

bool WorkerPool::IsClosed() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return closing_;
}

absl::optional<DeviceId> WorkerPool::GetWorkerDevice(
    WorkerId worker_id) const {
  return device_assigner_.GetDevice(worker_id);
}

std::vector<pid_t> WorkerPool::GetSpawnedPids() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return spawned_pids_;
}

void WorkerPool::Wake() {
  if (wake_fds_[1] < 0) {
    return;
  }
  const char byte = 1;
  // a full pipe already guarantees a wake-up
  while (write(wake_fds_[1], &byte, 1) < 0 && errno == EINTR) {
  }
}

void WorkerPool::DrainWake() {
  char buffer[64];
  while (read(wake_fds_[0], buffer, sizeof(buffer)) > 0) {
  }
}

void WorkerPool::Dispatch() {
  std::vector<struct pollfd> poll_fds;
  std::vector<WorkerProcess*> polled_workers;

  while (true) {
    AssignPendingTasks();
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (closing_ && pending_.empty() && in_flight_.empty()) {
        break;
      }
    }

    poll_fds.clear();
    polled_workers.clear();
    poll_fds.push_back({wake_fds_[0], POLLIN, 0});
    for (auto& worker : workers_) {
      if (worker->IsAlive() && worker->IsBusy()) {
        poll_fds.push_back({worker->GetFd(), POLLIN, 0});
        polled_workers.push_back(worker.get());
      }
    }

    if (poll(poll_fds.data(), poll_fds.size(), -1) < 0) {
      if (errno != EINTR) {
        PARCEL_LOG(LogSeverity::kError, "Dispatcher poll failed: %s",
                   strerror(errno));
      }
      continue;
    }

    if (poll_fds[0].revents) {
      DrainWake();
    }
    for (size_t i = 0; i < polled_workers.size(); i++) {
      if (poll_fds[i + 1].revents) {
        HandleReply(*polled_workers[i]);
      }
    }
  }

  for (auto& worker : workers_) {
    if (worker->IsAlive()) {
      worker->End();
      num_alive_workers_--;
    }
  }
}

void WorkerPool::AssignPendingTasks() {
  for (auto& worker : workers_) {
    if (!worker->IsAlive() || worker->IsBusy()) {
      continue;
    }

    PendingTask task;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (pending_.empty()) {
        return;
      }
      task = std::move(pending_.front());
      pending_.pop_front();
    }

    task.dispatch_time = time::NowMicros();
    const TaskId task_id = task.task_id;
    const Chunk chunk = task.chunk;
    in_flight_[worker->GetId()] = std::move(task);
    absl::Status status = worker->Dispatch(task_id, chunk);
    if (!status.ok()) {
      HandleLoss(*worker, status.ToString());
    }
  }

  bool has_live_worker = false;
  for (auto& worker : workers_) {
    has_live_worker |= worker->IsAlive();
  }
  if (!has_live_worker) {
    FailPendingTasks("no live worker process left");
  }
}

void WorkerPool::HandleReply(WorkerProcess& worker) {
  absl::StatusOr<Message> message = worker.Receive();
  if (!message.ok()) {
    HandleLoss(worker, message.status().ToString());
    return;
  }

  const TaskId task_id = worker.GetCurrentTaskId();
  if (message->task_id != task_id ||
      (message->type != MessageType::kResult &&
       message->type != MessageType::kFailure)) {
    HandleLoss(worker,
               absl::StrFormat("unexpected reply (type %d, task %d)",
                               static_cast<int>(message->type),
                               message->task_id));
    return;
  }

  auto it = in_flight_.find(worker.GetId());
  if (message->type == MessageType::kResult) {
    absl::StatusOr<ResultSet> result = DecodeResultSet(message->payload);
    if (result.ok()) {
      Resolve(it->second, worker.GetId(), TaskStatus::kSuccess,
              std::move(result));
    } else {
      Resolve(it->second, worker.GetId(), TaskStatus::kExecutionFailure,
              WorkerExecutionError(worker.GetId(), task_id,
                                   result.status().message()));
    }
  } else {
    Resolve(it->second, worker.GetId(), TaskStatus::kExecutionFailure,
            WorkerExecutionError(worker.GetId(), task_id, message->payload));
  }
  in_flight_.erase(it);
  worker.CompleteTask();

  if (worker.NeedsRecycle()) {
    Recycle(worker);
  }
}

void WorkerPool::Recycle(WorkerProcess& worker) {
  const std::string exit_description = worker.Reap();
  num_alive_workers_--;
  num_recycled_workers_++;
  PARCEL_LOG_DEBUG("Worker %d recycled after %d tasks: %s", worker.GetId(),
                   worker.GetCompletedTasks(), exit_description.c_str());

  absl::Status status = SpawnWorker(worker);
  if (!status.ok()) {
    PARCEL_LOG(LogSeverity::kError, "Failed to restart worker %d: %s",
               worker.GetId(), status.ToString().c_str());
  }
}

void WorkerPool::HandleLoss(WorkerProcess& worker, const std::string& reason) {
  const TaskId task_id = worker.GetCurrentTaskId();
  if (worker.IsAlive()) {
    num_alive_workers_--;
  }
  const std::string exit_description = worker.Kill();
  num_lost_workers_++;
  PARCEL_LOG(LogSeverity::kError, "Worker %d lost with task %d (%s): %s",
             worker.GetId(), task_id, reason.c_str(),
             exit_description.c_str());

  auto it = in_flight_.find(worker.GetId());
  if (it != in_flight_.end()) {
    Resolve(it->second, worker.GetId(), TaskStatus::kProcessLoss,
            WorkerProcessLoss(worker.GetId(), it->second.task_id,
                              exit_description));
    in_flight_.erase(it);
  }

  absl::Status status = SpawnWorker(worker);
  if (!status.ok()) {
    PARCEL_LOG(LogSeverity::kError, "Failed to replace worker %d: %s",
               worker.GetId(), status.ToString().c_str());
  }
}

void WorkerPool::Resolve(PendingTask& task, WorkerId worker_id,
                         TaskStatus status,
                         absl::StatusOr<ResultSet> result) {
  task.promise.set_value(std::move(result));
  if (progress_) {
    CompletionEvent event;
    event.task_id = task.task_id;
    event.worker_id = worker_id;
    event.status = status;
    event.elapsed_us =
        static_cast<int64_t>(time::NowMicros() - task.dispatch_time);
    progress_->Push(event);
  }
}

void WorkerPool::FailPendingTasks(const std::string& reason) {
  std::deque<PendingTask> tasks;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    tasks.swap(pending_);
  }
  for (PendingTask& task : tasks) {
    Resolve(task, -1, TaskStatus::kProcessLoss,
            WorkerProcessLoss(-1, task.task_id, reason));
  }
}

}  // namespace parcel
