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

#ifndef PARCEL_ENGINE_H_
#define PARCEL_ENGINE_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "parcel/config.h"
#include "parcel/progress.h"
#include "parcel/run_context.h"
#include "parcel/worker.h"

namespace parcel {

/**
 * @class Engine
 * @brief Runs a chunked workload on a pool of worker processes.
 *
 * Every Run() partitions the workload, creates a pool, submits one task per
 * chunk, merges the results in chunk order and releases the pool. The pool is
 * released on every exit path and the run ends in CLOSED. The first task
 * failure is returned and no partial result is produced.
 *
 * The task function sees the workload through the address space inherited by
 * the worker processes; only chunk ranges and encoded results cross the
 * process boundary. The typed entry points are in parcel/parallel.h.
 */
class Engine {
 public:
  explicit Engine(const RuntimeConfig& config);

  /**
   * @brief Runs `task_function` over a workload of `length` items.
   * @param initializer Run once per worker process. May be empty.
   * @return The encoded output buckets. For an empty workload,
   * `output_dim` empty buckets.
   */
  absl::StatusOr<std::vector<std::string>> Run(
      size_t length, TaskFunction task_function,
      Initializer initializer = nullptr);

  // Progress sink of the following runs. Not owned; null disables progress
  // events.
  void SetProgressSink(ProgressSink* sink) { progress_sink_ = sink; }

  const RuntimeConfig& GetConfig() const { return config_; }
  EngineState GetState() const;
  // Statistics of the most recent run
  RunStats GetLastRunStats() const;

 private:
  absl::StatusOr<std::vector<Chunk>> Partition(size_t length) const;
  PoolConfig GetPoolConfig() const;

  const RuntimeConfig config_;
  ProgressSink* progress_sink_ = nullptr;
  std::unique_ptr<RunContext> context_;
};

}  // namespace parcel

#endif  // PARCEL_ENGINE_H_
