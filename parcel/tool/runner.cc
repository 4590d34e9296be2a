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

#include "parcel/tool/runner.h"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <numeric>
#include <set>
#include <string>

#include "parcel/config_loader.h"
#include "parcel/error.h"
#include "parcel/json_util.h"
#include "parcel/logger.h"
#include "parcel/parallel.h"
#include "parcel/sample_pool.h"
#include "parcel/time.h"

namespace parcel {
namespace tool {
namespace {

void SimulateWork(size_t num_items, int item_time_us) {
  if (item_time_us > 0) {
    time::SleepForMicros(num_items * item_time_us);
  }
}

// Pretends to pin the process to its accelerator, the way a training process
// restricts the devices its framework sees.
absl::Status BindDevice(const WorkerContext& context) {
  if (!context.device_id.has_value()) {
    return absl::OkStatus();
  }
  const std::string visible_devices = std::to_string(*context.device_id);
  if (setenv("CUDA_VISIBLE_DEVICES", visible_devices.c_str(), 1) != 0) {
    return absl::InternalError("Failed to set CUDA_VISIBLE_DEVICES");
  }
  PARCEL_LOG_DEBUG("Worker %d (generation %d) bound to device %d",
                   context.worker_id, context.generation, *context.device_id);
  return absl::OkStatus();
}

// Deterministic pseudo uncertainty of an item in [0, 1)
float Uncertainty(float value, int round) {
  uint32_t x = static_cast<uint32_t>(value) * 2654435761u +
               static_cast<uint32_t>(round) * 40503u;
  x ^= x >> 13;
  return static_cast<float>(x % 10000) / 10000.f;
}

absl::Status ParseRunnerConfig(const Json::Value& root, RunnerConfig& config) {
  RETURN_IF_ERROR(json::Validate(root, {"workload", "workload_size"}));
  RETURN_IF_ERROR(json::AssignIfValid(config.workload, root, "workload"));
  RETURN_IF_ERROR(
      json::AssignIfValid(config.workload_size, root, "workload_size"));
  RETURN_IF_ERROR(
      json::AssignIfValid(config.item_time_us, root, "item_time_us"));
  RETURN_IF_ERROR(
      json::AssignIfValid(config.acquire_rounds, root, "acquire_rounds"));
  RETURN_IF_ERROR(
      json::AssignIfValid(config.acquire_size, root, "acquire_size"));
  return absl::OkStatus();
}

}  // anonymous namespace

Runner::~Runner() {
  if (runtime_config_) {
    delete runtime_config_;
  }
}

absl::Status Runner::Initialize(int argc, const char** argv) {
  if (!ParseArgs(argc, argv)) {
    return ConfigurationError("Failed to parse arguments");
  }
  engine_.reset(new Engine(*runtime_config_));
  return absl::OkStatus();
}

bool Runner::ParseArgs(int argc, const char** argv) {
  if (argc < 2) {
    std::cout << "Usage:\n\tparcel_runner <config-json-path> [<verbosity> = "
                 "default value: WARNING]"
              << std::endl;
    std::cout << "List of valid verbosity levels:" << std::endl;
    for (size_t i = 0; i < EnumLength<LogSeverity>(); i++) {
      std::cout << "\t" << i << " : "
                << ToString(static_cast<LogSeverity>(i)) << std::endl;
    }
    return false;
  }
  if (argc >= 3) {
    const int verbosity = atoi(argv[2]);
    if (verbosity < 0 ||
        static_cast<size_t>(verbosity) >= EnumLength<LogSeverity>()) {
      std::cout << "Please check if verbosity " << argv[2] << " is valid"
                << std::endl;
      return false;
    }
    Logger::Get().SetVerbosity(static_cast<LogSeverity>(verbosity));
  } else {
    Logger::Get().SetVerbosity(LogSeverity::kWarning);
  }

  absl::StatusOr<Json::Value> json_config = json::LoadFromFile(argv[1]);
  if (!json_config.ok()) {
    std::cout << json_config.status().message() << std::endl;
    return false;
  }
  if (!LoadRunnerConfigs(*json_config)) {
    return false;
  }
  absl::Status status = LoadRuntimeConfigs(*json_config);
  if (!status.ok()) {
    std::cout << "Invalid engine configuration: " << status.message()
              << std::endl;
    return false;
  }
  return true;
}

bool Runner::LoadRunnerConfigs(const Json::Value& root) {
  absl::Status status = ParseRunnerConfig(root, runner_config_);
  if (!status.ok()) {
    std::cout << "Invalid runner configuration: " << status.message()
              << std::endl;
    return false;
  }

  std::set<std::string> supported_workloads{"transform", "predict",
                                            "acquire"};
  if (supported_workloads.find(runner_config_.workload) ==
      supported_workloads.end()) {
    std::cout << "Please check if argument workload "
              << runner_config_.workload << " is valid" << std::endl;
    return false;
  }

  if (runner_config_.workload_size < 0) {
    std::cout << "Please check if argument workload_size "
              << runner_config_.workload_size << " >= 0" << std::endl;
    return false;
  }

  if (runner_config_.acquire_rounds < 0 || runner_config_.acquire_size < 0) {
    std::cout << "Please check if acquire_rounds and acquire_size are >= 0"
              << std::endl;
    return false;
  }
  return true;
}

absl::Status Runner::LoadRuntimeConfigs(const Json::Value& root) {
  absl::StatusOr<RuntimeConfig> runtime_config = LoadRuntimeConfig(root);
  if (!runtime_config.ok()) {
    return runtime_config.status();
  }
  delete runtime_config_;
  runtime_config_ = new RuntimeConfig(*runtime_config);

  const bool accelerator =
      runtime_config_->execution_mode == ExecutionMode::kAccelerator;
  if ((runner_config_.workload == "predict") != accelerator) {
    return ConfigurationError(
        "The predict workload runs in accelerator mode, the others in cpu "
        "mode");
  }
  return absl::OkStatus();
}

absl::Status Runner::Run() {
  if (runner_config_.workload == "transform") {
    return RunTransform();
  } else if (runner_config_.workload == "predict") {
    return RunPredict();
  } else {
    return RunAcquire();
  }
}

absl::Status Runner::RunTransform() {
  std::vector<float> data(runner_config_.workload_size);
  std::iota(data.begin(), data.end(), 0.f);

  const int output_dim = runtime_config_->output_dim;
  const int item_time_us = runner_config_.item_time_us;
  auto scale = [](absl::Span<const float> items, int output_dim,
                  int item_time_us) -> absl::StatusOr<Buckets<float>> {
    SimulateWork(items.size(), item_time_us);
    Buckets<float> buckets;
    for (int k = 0; k < output_dim; k++) {
      std::vector<float> column;
      for (float item : items) {
        column.push_back(item * (k + 1));
      }
      buckets.push_back(column);
    }
    return buckets;
  };

  const uint64_t start_time = time::NowMicros();
  absl::StatusOr<std::vector<std::vector<float>>> outputs =
      MultiprocessRun<float>(*engine_, scale, data, output_dim, item_time_us);
  if (!outputs.ok()) {
    return outputs.status();
  }
  LogResults("transform", time::NowMicros() - start_time);
  for (size_t k = 0; k < outputs->size(); k++) {
    PARCEL_LOG(LogSeverity::kInfo, "Output %zu holds %zu items", k,
               (*outputs)[k].size());
  }
  return absl::OkStatus();
}

absl::Status Runner::RunPredict() {
  std::vector<float> features(runner_config_.workload_size);
  std::iota(features.begin(), features.end(), 0.f);
  std::vector<int> labels(features.size());
  for (size_t i = 0; i < labels.size(); i++) {
    labels[i] = static_cast<int>(i % 10);
  }

  auto predict = [](const DeviceChunk<float, int>& share,
                    int item_time_us) -> absl::StatusOr<std::vector<float>> {
    SimulateWork(share.features.size(), item_time_us);
    std::vector<float> scores;
    for (size_t i = 0; i < share.features.size(); i++) {
      scores.push_back(share.features[i] * 0.5f + share.labels[i]);
    }
    return scores;
  };

  const uint64_t start_time = time::NowMicros();
  absl::StatusOr<std::vector<float>> scores = MultiDeviceRun<float>(
      *engine_, predict, features, labels, BindDevice,
      runner_config_.item_time_us);
  if (!scores.ok()) {
    return scores.status();
  }
  LogResults("predict", time::NowMicros() - start_time);
  PARCEL_LOG(LogSeverity::kInfo, "Predicted %zu items", scores->size());
  return absl::OkStatus();
}

absl::Status Runner::RunAcquire() {
  std::vector<float> data(runner_config_.workload_size);
  std::iota(data.begin(), data.end(), 0.f);
  SamplePool pool(data.size());
  acquired_counts_.clear();
  num_unacquired_ = pool.GetNumRemaining();

  auto score = [](absl::Span<const float> items, int round,
                  int item_time_us) -> absl::StatusOr<Buckets<float>> {
    SimulateWork(items.size(), item_time_us);
    std::vector<float> uncertainty;
    for (float item : items) {
      uncertainty.push_back(Uncertainty(item, round));
    }
    return Buckets<float>{uncertainty};
  };

  for (int round = 0; round < runner_config_.acquire_rounds; round++) {
    if (pool.GetNumRemaining() == 0) {
      PARCEL_LOG(LogSeverity::kWarning, "Pool exhausted after %d rounds",
                 round);
      break;
    }

    const std::vector<float> remaining = Gather(data, pool.GetRemaining());
    const uint64_t start_time = time::NowMicros();
    absl::StatusOr<std::vector<std::vector<float>>> scores =
        MultiprocessRun<float>(*engine_, score, remaining, round,
                               runner_config_.item_time_us);
    if (!scores.ok()) {
      return scores.status();
    }
    LogResults("acquire round " + std::to_string(round),
               time::NowMicros() - start_time);

    const std::vector<float>& uncertainty = scores->front();
    std::vector<size_t> positions(uncertainty.size());
    std::iota(positions.begin(), positions.end(), 0);
    const size_t num_acquired = std::min(
        positions.size(), static_cast<size_t>(runner_config_.acquire_size));
    std::partial_sort(positions.begin(), positions.begin() + num_acquired,
                      positions.end(), [&uncertainty](size_t a, size_t b) {
                        return uncertainty[a] > uncertainty[b];
                      });
    positions.resize(num_acquired);

    absl::StatusOr<std::vector<size_t>> acquired = pool.Acquire(positions);
    if (!acquired.ok()) {
      return acquired.status();
    }
    acquired_counts_.push_back(acquired->size());
    num_unacquired_ = pool.GetNumRemaining();
    PARCEL_LOG(LogSeverity::kInfo,
               "Round %d acquired %zu items, %zu left in the pool", round,
               acquired->size(), pool.GetNumRemaining());
  }
  return absl::OkStatus();
}

void Runner::LogResults(const std::string& title,
                        uint64_t wall_time_us) const {
  const RunStats stats = engine_->GetLastRunStats();
  std::cout << "--- " << title << " ---" << std::endl;
  std::cout << "wall time (us): " << wall_time_us << std::endl;
  std::cout << "chunks: " << stats.num_chunks << std::endl;
  std::cout << "workers: " << stats.num_workers << std::endl;
  std::cout << "spawned processes: " << stats.spawned_pids.size()
            << std::endl;
  std::cout << "recycled workers: " << stats.num_recycled_workers
            << std::endl;
  std::cout << "lost workers: " << stats.num_lost_workers << std::endl;
  std::cout << "peak outstanding handles: " << stats.peak_outstanding
            << std::endl;
}

}  // namespace tool
}  // namespace parcel
