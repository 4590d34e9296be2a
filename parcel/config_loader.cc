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

#include "parcel/config_loader.h"

#include "absl/strings/str_format.h"
#include "parcel/config_builder.h"
#include "parcel/error.h"
#include "parcel/json_util.h"

namespace parcel {
namespace {

template <typename EnumType>
absl::StatusOr<EnumType> ParseEnum(const Json::Value& root, const char* key) {
  if (!root[key].isString()) {
    return ConfigurationError(
        absl::StrFormat("[Loader] %s must be a string", key));
  }
  const std::string name = root[key].asString();
  absl::optional<EnumType> value = FromString<EnumType>(name);
  if (!value.has_value()) {
    return ConfigurationError(
        absl::StrFormat("[Loader] Unknown %s \"%s\"", key, name));
  }
  return *value;
}

}  // anonymous namespace

absl::StatusOr<RuntimeConfig> LoadRuntimeConfig(const Json::Value& root) {
  RETURN_IF_ERROR(json::Validate(root, {}));

  RuntimeConfigBuilder builder;
  if (!root["execution_mode"].isNull()) {
    absl::StatusOr<ExecutionMode> execution_mode =
        ParseEnum<ExecutionMode>(root, "execution_mode");
    if (!execution_mode.ok()) {
      return execution_mode.status();
    }
    builder.AddExecutionMode(*execution_mode);
  }
  if (!root["submission_mode"].isNull()) {
    absl::StatusOr<SubmissionMode> submission_mode =
        ParseEnum<SubmissionMode>(root, "submission_mode");
    if (!submission_mode.ok()) {
      return submission_mode.status();
    }
    builder.AddSubmissionMode(*submission_mode);
  }

  int output_dim = 1;
  RETURN_IF_ERROR(json::AssignIfValid(output_dim, root, "output_dim"));
  builder.AddOutputDim(output_dim);

  int num_workers = 1;
  RETURN_IF_ERROR(json::AssignIfValid(num_workers, root, "num_workers"));
  builder.AddNumWorkers(num_workers);

  int max_tasks_per_worker = 50;
  RETURN_IF_ERROR(
      json::AssignIfValid(max_tasks_per_worker, root, "max_tasks_per_worker"));
  builder.AddMaxTasksPerWorker(max_tasks_per_worker);

  int device_count = 0;
  RETURN_IF_ERROR(json::AssignIfValid(device_count, root, "device_count"));
  builder.AddDeviceCount(device_count);

  int chunk_size = 1;
  RETURN_IF_ERROR(json::AssignIfValid(chunk_size, root, "chunk_size"));
  builder.AddChunkSize(chunk_size);

  int max_outstanding_tasks = 0;
  RETURN_IF_ERROR(json::AssignIfValid(max_outstanding_tasks, root,
                                      "max_outstanding_tasks"));
  builder.AddMaxOutstandingTasks(max_outstanding_tasks);

  if (root.isMember("label")) {
    std::string label;
    RETURN_IF_ERROR(json::AssignIfValid(label, root, "label"));
    builder.AddLabel(label);
  }
  if (root.isMember("verbose")) {
    bool verbose = false;
    RETURN_IF_ERROR(json::AssignIfValid(verbose, root, "verbose"));
    builder.AddVerbose(verbose);
  }

  return builder.Build();
}

absl::StatusOr<RuntimeConfig> LoadRuntimeConfigFromFile(
    const std::string& file_path) {
  absl::StatusOr<Json::Value> root = json::LoadFromFile(file_path);
  if (!root.ok()) {
    return root.status();
  }
  return LoadRuntimeConfig(*root);
}

}  // namespace parcel
