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

#include "parcel/error.h"

#include "absl/strings/cord.h"
#include "absl/strings/str_format.h"
#include "absl/types/optional.h"

namespace parcel {

const char kErrorCategoryUrl[] = "type.parcel/error_category";

namespace {

const char kConfiguration[] = "ConfigurationError";
const char kPoolClosed[] = "PoolClosedError";
const char kWorkerExecution[] = "WorkerExecutionError";
const char kWorkerProcessLoss[] = "WorkerProcessLoss";

absl::Status Tag(absl::Status status, const char* category) {
  status.SetPayload(kErrorCategoryUrl, absl::Cord(category));
  return status;
}

bool HasCategory(const absl::Status& status, absl::StatusCode code,
                 const char* category) {
  if (status.code() != code) {
    return false;
  }
  absl::optional<absl::Cord> payload = status.GetPayload(kErrorCategoryUrl);
  return payload.has_value() && *payload == absl::string_view(category);
}

}  // anonymous namespace

absl::Status ConfigurationError(absl::string_view message) {
  return Tag(absl::InvalidArgumentError(message), kConfiguration);
}

absl::Status PoolClosedError(absl::string_view message) {
  return Tag(absl::FailedPreconditionError(message), kPoolClosed);
}

absl::Status WorkerExecutionError(WorkerId worker_id, TaskId task_id,
                                  absl::string_view message) {
  return Tag(absl::InternalError(absl::StrFormat(
                 "Worker %d failed task %d: %s", worker_id, task_id, message)),
             kWorkerExecution);
}

absl::Status WorkerProcessLoss(WorkerId worker_id, TaskId task_id,
                               absl::string_view message) {
  return Tag(absl::AbortedError(absl::StrFormat(
                 "Worker %d lost while running task %d: %s", worker_id,
                 task_id, message)),
             kWorkerProcessLoss);
}

bool IsConfigurationError(const absl::Status& status) {
  return HasCategory(status, absl::StatusCode::kInvalidArgument,
                     kConfiguration);
}

bool IsPoolClosedError(const absl::Status& status) {
  return HasCategory(status, absl::StatusCode::kFailedPrecondition,
                     kPoolClosed);
}

bool IsWorkerExecutionError(const absl::Status& status) {
  return HasCategory(status, absl::StatusCode::kInternal, kWorkerExecution);
}

bool IsWorkerProcessLoss(const absl::Status& status) {
  return HasCategory(status, absl::StatusCode::kAborted, kWorkerProcessLoss);
}

}  // namespace parcel
