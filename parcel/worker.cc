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

#include "parcel/worker.h"

#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>

#include "absl/strings/str_format.h"
#include "parcel/logger.h"

namespace parcel {
namespace {

absl::StatusOr<ResultSet> RunTask(const TaskFunction& task_function,
                                  const Chunk& chunk,
                                  const WorkerContext& context) {
  try {
    return task_function(chunk, context);
  } catch (const std::exception& e) {
    return absl::InternalError(e.what());
  }
}

}  // anonymous namespace

WorkerProcess::WorkerProcess(const WorkerContext& context)
    : context_(context) {}

WorkerProcess::~WorkerProcess() {
  if (IsAlive()) {
    PARCEL_LOG(LogSeverity::kError,
               "Worker %d should explicitly end its process before "
               "destruction",
               context_.worker_id);
    Kill();
  }
}

absl::Status WorkerProcess::Start(const TaskFunction& task_function,
                                  const Initializer& initializer,
                                  int max_tasks,
                                  const std::vector<int>& inherited_fds) {
  if (IsAlive()) {
    return absl::FailedPreconditionError(absl::StrFormat(
        "Worker %d already runs process %d", context_.worker_id, pid_));
  }

  int fds[2];
  if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
    return absl::InternalError(
        absl::StrFormat("Worker %d failed to create socket: %s",
                        context_.worker_id, strerror(errno)));
  }

  context_.generation = num_starts_++;
  pid_t pid = fork();
  if (pid < 0) {
    const int error = errno;
    close(fds[0]);
    close(fds[1]);
    return absl::InternalError(absl::StrFormat(
        "Worker %d failed to fork: %s", context_.worker_id, strerror(error)));
  }

  if (pid == 0) {
    close(fds[0]);
    for (int fd : inherited_fds) {
      close(fd);
    }
    Work(fds[1], context_, task_function, initializer, max_tasks);
  }

  close(fds[1]);
  fd_ = fds[0];
  pid_ = pid;
  max_tasks_ = max_tasks;
  completed_tasks_ = 0;
  current_task_id_ = -1;
  PARCEL_LOG_DEBUG("Worker %d started process %d (generation %d)",
                   context_.worker_id, pid_, context_.generation);
  return absl::OkStatus();
}

absl::Status WorkerProcess::Dispatch(TaskId task_id, const Chunk& chunk) {
  if (!IsAlive()) {
    return absl::UnavailableError(
        absl::StrFormat("Worker %d has no process", context_.worker_id));
  }
  if (IsBusy()) {
    return absl::FailedPreconditionError(
        absl::StrFormat("Worker %d is busy with task %d", context_.worker_id,
                        current_task_id_));
  }

  Message message;
  message.type = MessageType::kTask;
  message.task_id = task_id;
  message.payload = EncodeChunk(chunk);
  // The task is owned by this worker even if the write fails, so that the
  // caller can report it as lost.
  current_task_id_ = task_id;
  return WriteMessage(fd_, message);
}

absl::StatusOr<Message> WorkerProcess::Receive() { return ReadMessage(fd_); }

void WorkerProcess::CompleteTask() {
  current_task_id_ = -1;
  completed_tasks_++;
}

bool WorkerProcess::NeedsRecycle() const {
  return max_tasks_ > 0 && completed_tasks_ >= max_tasks_;
}

void WorkerProcess::End() {
  if (!IsAlive()) {
    return;
  }

  Message message;
  message.type = MessageType::kShutdown;
  absl::Status status = WriteMessage(fd_, message);
  if (!status.ok()) {
    // already on its way out; reaping collects it either way
    PARCEL_LOG(LogSeverity::kInternal, "Worker %d shutdown message: %s",
               context_.worker_id, status.ToString().c_str());
  }
  const std::string exit_description = Reap();
  PARCEL_LOG_DEBUG("Worker %d %s", context_.worker_id,
                   exit_description.c_str());
}

std::string WorkerProcess::Kill() {
  if (IsAlive()) {
    kill(pid_, SIGKILL);
  }
  return Reap();
}

std::string WorkerProcess::Reap() {
  if (fd_ >= 0) {
    close(fd_);
    fd_ = -1;
  }
  if (!IsAlive()) {
    return "has no process";
  }

  int wait_status = 0;
  pid_t result;
  do {
    result = waitpid(pid_, &wait_status, 0);
  } while (result < 0 && errno == EINTR);

  const pid_t pid = pid_;
  pid_ = -1;
  current_task_id_ = -1;

  if (result < 0) {
    return absl::StrFormat("process %d could not be reaped: %s", pid,
                           strerror(errno));
  }
  if (WIFEXITED(wait_status)) {
    const int exit_code = WEXITSTATUS(wait_status);
    if (exit_code == kExitInitializerFailure) {
      return absl::StrFormat("process %d exited after its initializer failed",
                             pid);
    }
    return absl::StrFormat("process %d exited with status %d", pid,
                           exit_code);
  }
  if (WIFSIGNALED(wait_status)) {
    return absl::StrFormat("process %d was killed by signal %d", pid,
                           WTERMSIG(wait_status));
  }
  return absl::StrFormat("process %d terminated", pid);
}

void WorkerProcess::Work(int fd, const WorkerContext& context,
                         const TaskFunction& task_function,
                         const Initializer& initializer, int max_tasks) {
  if (initializer) {
    absl::Status status = initializer(context);
    if (!status.ok()) {
      PARCEL_LOG(LogSeverity::kError, "Worker %d failed to initialize: %s",
                 context.worker_id, status.ToString().c_str());
      _exit(kExitInitializerFailure);
    }
  }

  int completed_tasks = 0;
  while (true) {
    absl::StatusOr<Message> message = ReadMessage(fd);
    if (!message.ok()) {
      _exit(kExitLostCoordinator);
    }
    if (message->type == MessageType::kShutdown) {
      _exit(kExitOk);
    }
    if (message->type != MessageType::kTask) {
      PARCEL_LOG(LogSeverity::kWarning,
                 "Worker %d ignores unexpected message type %d",
                 context.worker_id, static_cast<int>(message->type));
      continue;
    }

    Message reply;
    reply.task_id = message->task_id;
    absl::StatusOr<ResultSet> result;
    absl::StatusOr<Chunk> chunk = DecodeChunk(message->payload);
    if (chunk.ok()) {
      result = RunTask(task_function, *chunk, context);
    } else {
      result = chunk.status();
    }
    if (result.ok()) {
      reply.type = MessageType::kResult;
      reply.payload = EncodeResultSet(*result);
    } else {
      reply.type = MessageType::kFailure;
      reply.payload = std::string(result.status().message());
    }

    if (!WriteMessage(fd, reply).ok()) {
      _exit(kExitLostCoordinator);
    }

    completed_tasks++;
    if (max_tasks > 0 && completed_tasks >= max_tasks) {
      _exit(kExitOk);
    }
  }
}

}  // namespace parcel
