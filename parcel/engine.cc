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

#include "parcel/engine.h"

#include "absl/cleanup/cleanup.h"
#include "parcel/aggregator.h"
#include "parcel/logger.h"
#include "parcel/partitioner.h"
#include "parcel/submitter.h"
#include "parcel/time.h"
#include "parcel/worker_pool.h"

namespace parcel {

Engine::Engine(const RuntimeConfig& config) : config_(config) {}

EngineState Engine::GetState() const {
  return context_ ? context_->GetState() : EngineState::kCreated;
}

RunStats Engine::GetLastRunStats() const {
  return context_ ? context_->GetStats() : RunStats();
}

absl::StatusOr<std::vector<Chunk>> Engine::Partition(size_t length) const {
  if (config_.execution_mode == ExecutionMode::kAccelerator) {
    return PartitionByDevice(length, config_.pool_config.device_count);
  }
  return PartitionBySize(length, config_.submit_config.chunk_size);
}

PoolConfig Engine::GetPoolConfig() const {
  PoolConfig pool_config = config_.pool_config;
  if (config_.execution_mode == ExecutionMode::kCPU) {
    pool_config.device_count = 0;
  }
  return pool_config;
}

absl::StatusOr<std::vector<std::string>> Engine::Run(
    size_t length, TaskFunction task_function, Initializer initializer) {
  const SubmitConfig& submit_config = config_.submit_config;
  context_.reset(new RunContext(submit_config.label));
  RunContext& context = *context_;
  const uint64_t start_time = time::NowMicros();

  auto close_run = absl::MakeCleanup([&context, start_time]() {
    context.GetStats().elapsed_us = time::NowMicros() - start_time;
    context.SetState(EngineState::kClosed);
  });

  absl::StatusOr<std::vector<Chunk>> chunks = Partition(length);
  if (!chunks.ok()) {
    return chunks.status();
  }
  context.GetStats().num_chunks = chunks->size();

  if (chunks->empty()) {
    PARCEL_LOG_DEBUG("[%s] Empty workload", context.GetLabel().c_str());
    return std::vector<std::string>(config_.output_dim);
  }

  std::unique_ptr<ProgressChannel> progress;
  if (progress_sink_) {
    if (submit_config.verbose) {
      PARCEL_LOG_ONCE(LogSeverity::kInfo,
                      "Verbose step logging is replaced by the progress sink");
    }
    progress.reset(new ProgressChannel(progress_sink_, submit_config.label,
                                       chunks->size()));
  }

  const PoolConfig pool_config = GetPoolConfig();
  absl::StatusOr<std::unique_ptr<WorkerPool>> pool =
      WorkerPool::Create(pool_config, std::move(task_function),
                         std::move(initializer), progress.get());
  if (!pool.ok()) {
    PARCEL_LOG(LogSeverity::kError, "[%s] Failed to create worker pool: %s",
               context.GetLabel().c_str(), pool.status().ToString().c_str());
    return pool.status();
  }
  context.GetStats().num_workers = (*pool)->GetNumWorkers();

  // Runs before close_run: the pool is released before the run is CLOSED.
  auto release_pool = absl::MakeCleanup([&context, &pool, &progress]() {
    (*pool)->Shutdown();
    if (progress) {
      progress->Close();
    }
    RunStats& stats = context.GetStats();
    stats.spawned_pids = (*pool)->GetSpawnedPids();
    stats.num_releases = (*pool)->GetNumReleases();
    stats.num_recycled_workers = (*pool)->GetNumRecycledWorkers();
    stats.num_lost_workers = (*pool)->GetNumLostWorkers();
  });

  TaskSubmitter submitter(pool->get(), submit_config.submission_mode,
                          submit_config.max_outstanding_tasks);
  RETURN_IF_ERROR(submitter.SubmitAll(*chunks, context));

  ResultAggregator aggregator(config_.output_dim, submit_config.label,
                              submit_config.verbose && !progress_sink_);
  RETURN_IF_ERROR(aggregator.Collect(context.GetHandles()));
  return aggregator.Finish();
}

}  // namespace parcel
