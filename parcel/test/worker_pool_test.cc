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

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sys/resource.h>
#include <unistd.h>

#include <set>
#include <thread>

#include "parcel/error.h"
#include "parcel/test/test_util.h"
#include "parcel/time.h"

namespace parcel {
namespace test {

// Set by the initializer inside the worker process only
int initializer_runs = 0;

// Reports which process ran the chunk:
// {begin, worker id, device id or -1, generation, initializer runs, pid}
absl::StatusOr<ResultSet> Identify(const Chunk& chunk,
                                   const WorkerContext& context) {
  return MakeResult(std::vector<int64_t>{
      static_cast<int64_t>(chunk.begin), context.worker_id,
      context.device_id.value_or(-1), context.generation, initializer_runs,
      getpid()});
}

absl::Status CountInitialization(const WorkerContext&) {
  initializer_runs++;
  return absl::OkStatus();
}

PoolConfig GetPoolConfig(int num_workers, int max_tasks_per_worker,
                         int device_count = 0) {
  PoolConfig config;
  config.num_workers = num_workers;
  config.max_tasks_per_worker = max_tasks_per_worker;
  config.device_count = device_count;
  return config;
}

std::vector<std::vector<int64_t>> RunChunks(WorkerPool& pool,
                                            size_t num_chunks) {
  std::vector<TaskHandle> handles;
  for (size_t i = 0; i < num_chunks; i++) {
    auto handle = pool.Submit(Chunk{i, i, i + 1});
    EXPECT_TRUE(handle.ok());
    handles.push_back(std::move(handle.value()));
  }

  std::vector<std::vector<int64_t>> reports;
  for (auto& handle : handles) {
    absl::StatusOr<ResultSet> result = handle.Get();
    EXPECT_TRUE(result.ok()) << result.status();
    if (result.ok()) {
      reports.push_back(DecodeAll<int64_t>(*(*result)[0]));
    }
  }
  return reports;
}

TEST(WorkerPoolTest, CreateRejectsInvalidConfig) {
  EXPECT_TRUE(IsConfigurationError(
      WorkerPool::Create(GetPoolConfig(0, 50), Identify).status()));
  EXPECT_TRUE(IsConfigurationError(
      WorkerPool::Create(GetPoolConfig(1, -1), Identify).status()));
  EXPECT_TRUE(IsConfigurationError(
      WorkerPool::Create(GetPoolConfig(1, 50), nullptr).status()));
}

TEST(WorkerPoolTest, SpawnsWorkersAndRunsTasks) {
  auto pool = WorkerPool::Create(GetPoolConfig(3, 0), Identify);
  ASSERT_TRUE(pool.ok()) << pool.status();
  EXPECT_EQ((*pool)->GetNumWorkers(), 3);
  EXPECT_EQ((*pool)->GetNumAliveWorkers(), 3);
  EXPECT_EQ((*pool)->GetSpawnedPids().size(), 3);

  auto reports = RunChunks(**pool, 20);
  ASSERT_EQ(reports.size(), 20);
  const std::vector<pid_t> spawned_pids = (*pool)->GetSpawnedPids();
  std::set<int64_t> pids(spawned_pids.begin(), spawned_pids.end());
  for (size_t i = 0; i < reports.size(); i++) {
    EXPECT_EQ(reports[i][0], i);
    EXPECT_EQ(reports[i][2], -1);
    EXPECT_NE(pids.find(reports[i][5]), pids.end());
  }
  EXPECT_EQ((*pool)->GetNumRecycledWorkers(), 0);

  (*pool)->Shutdown();
  EXPECT_EQ((*pool)->GetNumAliveWorkers(), 0);
  for (pid_t pid : (*pool)->GetSpawnedPids()) {
    EXPECT_TRUE(IsGone(pid));
  }
}

TEST(WorkerPoolTest, RecyclesWorkers) {
  auto pool =
      WorkerPool::Create(GetPoolConfig(1, 2), Identify, CountInitialization);
  ASSERT_TRUE(pool.ok());

  auto reports = RunChunks(**pool, 5);
  ASSERT_EQ(reports.size(), 5);
  // Generation of the process that ran each task
  std::vector<int64_t> generations;
  for (auto& report : reports) {
    generations.push_back(report[3]);
    // Every replacement ran the initializer exactly once
    EXPECT_EQ(report[4], 1);
  }
  EXPECT_EQ(generations, std::vector<int64_t>({0, 0, 1, 1, 2}));
  EXPECT_EQ(reports[0][5], reports[1][5]);
  EXPECT_NE(reports[1][5], reports[2][5]);

  (*pool)->Shutdown();
  EXPECT_EQ((*pool)->GetNumRecycledWorkers(), 2);
  EXPECT_EQ((*pool)->GetSpawnedPids().size(), 3);
}

TEST(WorkerPoolTest, ReplacementKeepsDevice) {
  auto pool = WorkerPool::Create(GetPoolConfig(3, 1, 2), Identify);
  ASSERT_TRUE(pool.ok());
  EXPECT_EQ((*pool)->GetWorkerDevice(0).value(), 0);
  EXPECT_EQ((*pool)->GetWorkerDevice(1).value(), 1);
  EXPECT_EQ((*pool)->GetWorkerDevice(2).value(), 0);

  auto reports = RunChunks(**pool, 12);
  ASSERT_EQ(reports.size(), 12);
  for (auto& report : reports) {
    EXPECT_EQ(report[2], report[1] % 2);
  }
  (*pool)->Shutdown();
  EXPECT_EQ((*pool)->GetNumRecycledWorkers(), 12);
}

TEST(WorkerPoolTest, SingleDeviceIsNotBound) {
  auto pool = WorkerPool::Create(GetPoolConfig(1, 0, 1), Identify);
  ASSERT_TRUE(pool.ok());
  EXPECT_FALSE((*pool)->GetWorkerDevice(0).has_value());
  auto reports = RunChunks(**pool, 1);
  ASSERT_EQ(reports.size(), 1);
  EXPECT_EQ(reports[0][2], -1);
}

TEST(WorkerPoolTest, CallbackFailureIsExecutionError) {
  TaskFunction fail_odd = [](const Chunk& chunk, const WorkerContext& context)
      -> absl::StatusOr<ResultSet> {
    if (chunk.begin % 2) {
      return absl::InvalidArgumentError("odd chunk");
    }
    return Identify(chunk, context);
  };
  auto pool = WorkerPool::Create(GetPoolConfig(2, 0), fail_odd);
  ASSERT_TRUE(pool.ok());

  std::vector<TaskHandle> handles;
  for (size_t i = 0; i < 4; i++) {
    handles.push_back((*pool)->Submit(Chunk{i, i, i + 1}).value());
  }
  for (size_t i = 0; i < handles.size(); i++) {
    absl::StatusOr<ResultSet> result = handles[i].Get();
    if (i % 2) {
      EXPECT_TRUE(IsWorkerExecutionError(result.status()));
      EXPECT_THAT(std::string(result.status().message()),
                  testing::HasSubstr("odd chunk"));
    } else {
      EXPECT_TRUE(result.ok());
    }
  }
  // A failing callback does not cost the process
  EXPECT_EQ((*pool)->GetNumLostWorkers(), 0);
  EXPECT_EQ((*pool)->GetSpawnedPids().size(), 2);
}

TEST(WorkerPoolTest, LostWorkerFailsItsTaskAndIsReplaced) {
  TaskFunction crash_first = [](const Chunk& chunk,
                                const WorkerContext& context)
      -> absl::StatusOr<ResultSet> {
    if (chunk.begin == 0) {
      _exit(9);
    }
    return Identify(chunk, context);
  };
  auto pool = WorkerPool::Create(GetPoolConfig(1, 0), crash_first);
  ASSERT_TRUE(pool.ok());

  TaskHandle lost = (*pool)->Submit(Chunk{0, 0, 1}).value();
  TaskHandle next = (*pool)->Submit(Chunk{1, 1, 2}).value();

  absl::StatusOr<ResultSet> lost_result = lost.Get();
  EXPECT_TRUE(IsWorkerProcessLoss(lost_result.status()));
  EXPECT_THAT(std::string(lost_result.status().message()),
              testing::HasSubstr("exited with status 9"));

  absl::StatusOr<ResultSet> next_result = next.Get();
  ASSERT_TRUE(next_result.ok());
  EXPECT_EQ(DecodeAll<int64_t>(*(*next_result)[0])[3], 1);

  (*pool)->Shutdown();
  EXPECT_EQ((*pool)->GetNumLostWorkers(), 1);
  EXPECT_EQ((*pool)->GetSpawnedPids().size(), 2);
}

TEST(WorkerPoolTest, FailedInitializerLosesTask) {
  auto initializer = [](const WorkerContext&) {
    return absl::UnavailableError("device busy");
  };
  auto pool = WorkerPool::Create(GetPoolConfig(1, 0), Identify, initializer);
  ASSERT_TRUE(pool.ok());
  TaskHandle handle = (*pool)->Submit(Chunk{0, 0, 1}).value();
  EXPECT_TRUE(IsWorkerProcessLoss(handle.Get().status()));
}

TEST(WorkerPoolTest, ShutdownWaitsAndRejectsSubmissions) {
  TaskFunction slow = [](const Chunk& chunk, const WorkerContext& context) {
    time::SleepForMicros(20000);
    return Identify(chunk, context);
  };
  auto pool = WorkerPool::Create(GetPoolConfig(2, 0), slow);
  ASSERT_TRUE(pool.ok());

  std::vector<TaskHandle> handles;
  for (size_t i = 0; i < 6; i++) {
    handles.push_back((*pool)->Submit(Chunk{i, i, i + 1}).value());
  }
  (*pool)->Shutdown();
  EXPECT_TRUE((*pool)->IsClosed());
  for (auto& handle : handles) {
    EXPECT_TRUE(handle.IsReady());
    EXPECT_TRUE(handle.Get().ok());
  }

  EXPECT_TRUE(IsPoolClosedError((*pool)->Submit(Chunk{6, 6, 7}).status()));
  (*pool)->Shutdown();
  EXPECT_EQ((*pool)->GetNumReleases(), 1);
  EXPECT_EQ((*pool)->GetNumAliveWorkers(), 0);
}

TEST(WorkerPoolTest, StartupFailureIsNotExecutionError) {
  struct rlimit original;
  ASSERT_EQ(getrlimit(RLIMIT_NOFILE, &original), 0);
  struct rlimit capped = original;
  capped.rlim_cur = 64;
  ASSERT_EQ(setrlimit(RLIMIT_NOFILE, &capped), 0);

  // Take every free descriptor below the cap
  std::vector<int> fds;
  for (int fd = dup(STDERR_FILENO); fd >= 0; fd = dup(STDERR_FILENO)) {
    fds.push_back(fd);
  }
  absl::Status status =
      WorkerPool::Create(GetPoolConfig(2, 0), Identify).status();
  for (int fd : fds) {
    close(fd);
  }
  ASSERT_EQ(setrlimit(RLIMIT_NOFILE, &original), 0);

  EXPECT_FALSE(status.ok());
  EXPECT_FALSE(IsWorkerExecutionError(status));
  EXPECT_FALSE(IsWorkerProcessLoss(status));
  EXPECT_FALSE(IsConfigurationError(status));
}

TEST(WorkerPoolTest, ConsumedHandleIsNotPoolClosed) {
  auto pool = WorkerPool::Create(GetPoolConfig(1, 0), Identify);
  ASSERT_TRUE(pool.ok());
  TaskHandle handle = (*pool)->Submit(Chunk{0, 0, 1}).value();
  EXPECT_TRUE(handle.Get().ok());

  absl::Status status = handle.Get().status();
  EXPECT_TRUE(absl::IsFailedPrecondition(status));
  EXPECT_FALSE(IsPoolClosedError(status));
}

TEST(WorkerPoolTest, ErrorCategoriesNeedTheirTag) {
  EXPECT_FALSE(IsWorkerExecutionError(absl::InternalError("pipe failed")));
  EXPECT_FALSE(IsPoolClosedError(absl::FailedPreconditionError("consumed")));
  EXPECT_FALSE(IsConfigurationError(absl::InvalidArgumentError("bad")));
  EXPECT_FALSE(IsWorkerProcessLoss(absl::AbortedError("aborted")));

  EXPECT_TRUE(IsWorkerExecutionError(WorkerExecutionError(0, 1, "failed")));
  EXPECT_TRUE(IsPoolClosedError(PoolClosedError("closed")));
  EXPECT_TRUE(IsConfigurationError(ConfigurationError("bad")));
  EXPECT_TRUE(IsWorkerProcessLoss(WorkerProcessLoss(0, 1, "killed")));
  EXPECT_FALSE(IsWorkerProcessLoss(WorkerExecutionError(0, 1, "failed")));
}

TEST(WorkerPoolTest, SubmitRacingShutdown) {
  auto pool = WorkerPool::Create(GetPoolConfig(2, 0), Identify);
  ASSERT_TRUE(pool.ok());

  std::vector<TaskHandle> handles;
  size_t num_rejected = 0;
  std::thread submitter([&]() {
    for (size_t i = 0; i < 200; i++) {
      auto handle = (*pool)->Submit(Chunk{i, i, i + 1});
      if (handle.ok()) {
        handles.push_back(std::move(handle.value()));
      } else {
        EXPECT_TRUE(IsPoolClosedError(handle.status()));
        num_rejected++;
      }
    }
  });
  time::SleepForMicros(1000);
  (*pool)->Shutdown();
  submitter.join();

  EXPECT_EQ(handles.size() + num_rejected, 200);
  for (auto& handle : handles) {
    EXPECT_TRUE(handle.Get().ok());
  }
}

TEST(WorkerPoolTest, ReportsCompletionEvents) {
  RecordingSink sink;
  {
    ProgressChannel progress(&sink, "pool", 8);
    auto pool = WorkerPool::Create(GetPoolConfig(2, 3), Identify, nullptr,
                                   &progress);
    ASSERT_TRUE(pool.ok());
    RunChunks(**pool, 8);
    (*pool)->Shutdown();
    progress.Close();
  }
  ASSERT_EQ(sink.events.size(), 8);
  std::set<TaskId> task_ids;
  for (size_t i = 0; i < sink.events.size(); i++) {
    EXPECT_EQ(sink.completed_counts[i], i + 1);
    EXPECT_EQ(sink.events[i].status, TaskStatus::kSuccess);
    task_ids.insert(sink.events[i].task_id);
  }
  EXPECT_EQ(task_ids.size(), 8);
  EXPECT_TRUE(sink.finished);
}

}  // namespace test
}  // namespace parcel

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
