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

#ifndef PARCEL_CONFIG_H_
#define PARCEL_CONFIG_H_

#include <string>

#include "parcel/common.h"

namespace parcel {

struct PoolConfig {
  int num_workers = 1;
  // Tasks a worker process completes before it is replaced by a fresh one.
  // 0 disables recycling.
  int max_tasks_per_worker = 50;
  // Accelerators available to the pool. Workers are bound to a device only
  // when more than one device is given.
  int device_count = 0;
};

struct SubmitConfig {
  // Items per chunk (cpu mode only)
  int chunk_size = 1;
  SubmissionMode submission_mode = SubmissionMode::kUnthrottled;
  // Bound of outstanding handles for throttled submission.
  // 0 selects num_workers + 1.
  int max_outstanding_tasks = 0;
  // Description shown by progress sinks and verbose logs
  std::string label = "";
  bool verbose = false;
};

struct RuntimeConfig {
  ExecutionMode execution_mode;
  // Number of result streams a work callback produces
  int output_dim;
  PoolConfig pool_config;
  SubmitConfig submit_config;

 private:
  friend class RuntimeConfigBuilder;
  RuntimeConfig() {
    execution_mode = ExecutionMode::kCPU;
    output_dim = 1;
  };
};

}  // namespace parcel
#endif  // PARCEL_CONFIG_H_
