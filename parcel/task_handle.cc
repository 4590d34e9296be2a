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

#include "parcel/task_handle.h"

#include <chrono>

#include "absl/strings/str_format.h"

namespace parcel {

TaskHandle::TaskHandle(TaskId task_id,
                       std::future<absl::StatusOr<ResultSet>> future)
    : task_id_(task_id), future_(std::move(future)) {}

bool TaskHandle::IsReady() const {
  return future_.valid() && future_.wait_for(std::chrono::seconds(0)) ==
                                std::future_status::ready;
}

void TaskHandle::Wait() const {
  if (future_.valid()) {
    future_.wait();
  }
}

absl::StatusOr<ResultSet> TaskHandle::Get() {
  if (!future_.valid()) {
    return absl::FailedPreconditionError(
        absl::StrFormat("Task %d has no pending result", task_id_));
  }
  return future_.get();
}

}  // namespace parcel
