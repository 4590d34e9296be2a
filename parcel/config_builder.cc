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

#include "parcel/config_builder.h"

#include <algorithm>

#include "parcel/error.h"

namespace parcel {

#define REPORT_IF_FALSE(builder, expr)                      \
  do {                                                      \
    if (!(expr)) {                                          \
      return ConfigurationError("[" #builder "] " #expr);   \
    }                                                       \
  } while (0);

absl::Status PoolConfigBuilder::IsValid() {
  REPORT_IF_FALSE(PoolConfigBuilder, num_workers_ > 0);
  REPORT_IF_FALSE(PoolConfigBuilder, max_tasks_per_worker_ >= 0);
  REPORT_IF_FALSE(PoolConfigBuilder, device_count_ >= 0);
  return absl::OkStatus();
}

absl::Status SubmitConfigBuilder::IsValid() {
  REPORT_IF_FALSE(SubmitConfigBuilder, chunk_size_ > 0);
  REPORT_IF_FALSE(SubmitConfigBuilder,
                  submission_mode_ == SubmissionMode::kUnthrottled ||
                      submission_mode_ == SubmissionMode::kThrottled);
  REPORT_IF_FALSE(SubmitConfigBuilder, max_outstanding_tasks_ >= 0);
  return absl::OkStatus();
}

absl::Status RuntimeConfigBuilder::IsValid() {
  REPORT_IF_FALSE(RuntimeConfigBuilder,
                  execution_mode_ == ExecutionMode::kCPU ||
                      execution_mode_ == ExecutionMode::kAccelerator);
  REPORT_IF_FALSE(RuntimeConfigBuilder, output_dim_ > 0);
  // A multi-device run returns one flat sequence
  if (execution_mode_ == ExecutionMode::kAccelerator) {
    REPORT_IF_FALSE(RuntimeConfigBuilder, output_dim_ == 1);
  }

  // Independent validation
  RETURN_IF_ERROR(pool_config_builder_.IsValid());
  RETURN_IF_ERROR(submit_config_builder_.IsValid());

  return absl::OkStatus();
}

absl::StatusOr<PoolConfig> PoolConfigBuilder::Build() {
  RETURN_IF_ERROR(IsValid());

  PoolConfig pool_config;
  pool_config.num_workers = num_workers_;
  pool_config.max_tasks_per_worker = max_tasks_per_worker_;
  pool_config.device_count = device_count_;
  return pool_config;
}

absl::StatusOr<SubmitConfig> SubmitConfigBuilder::Build() {
  RETURN_IF_ERROR(IsValid());

  SubmitConfig submit_config;
  submit_config.chunk_size = chunk_size_;
  submit_config.submission_mode = submission_mode_;
  submit_config.max_outstanding_tasks = max_outstanding_tasks_;
  submit_config.label = label_;
  submit_config.verbose = verbose_;
  return submit_config;
}

absl::StatusOr<RuntimeConfig> RuntimeConfigBuilder::Build() {
  RETURN_IF_ERROR(IsValid());
  RuntimeConfig runtime_config;
  runtime_config.execution_mode = execution_mode_;
  runtime_config.output_dim = output_dim_;
  // No need to check the return value of Build() because it has been checked
  runtime_config.pool_config = pool_config_builder_.Build().value();
  runtime_config.submit_config = submit_config_builder_.Build().value();

  // One worker process per device; a single accelerator (or none) runs the
  // whole workload in one worker.
  if (execution_mode_ == ExecutionMode::kAccelerator) {
    runtime_config.pool_config.num_workers =
        std::max(1, runtime_config.pool_config.device_count);
  }
  return runtime_config;
}

RuntimeConfig RuntimeConfigBuilder::GetDefaultConfig() {
  RuntimeConfigBuilder builder;

  builder.AddExecutionMode(ExecutionMode::kCPU);
  builder.AddOutputDim(1);
  builder.AddNumWorkers(4);
  builder.AddMaxTasksPerWorker(50);
  builder.AddDeviceCount(0);
  builder.AddChunkSize(100);
  builder.AddSubmissionMode(SubmissionMode::kUnthrottled);
  builder.AddMaxOutstandingTasks(0);
  builder.AddVerbose(false);
  return builder.Build().value();
}

}  // namespace parcel
