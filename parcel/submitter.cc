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

#include "parcel/submitter.h"

#include <algorithm>

#include "parcel/logger.h"

namespace parcel {

TaskSubmitter::TaskSubmitter(IWorkerPool* pool, SubmissionMode submission_mode,
                             size_t max_outstanding)
    : pool_(pool),
      submission_mode_(submission_mode),
      max_outstanding_(max_outstanding > 0 ? max_outstanding
                                           : pool->GetNumWorkers() + 1) {}

absl::Status TaskSubmitter::SubmitAll(const std::vector<Chunk>& chunks,
                                      RunContext& context) {
  std::vector<TaskHandle>& handles = context.GetHandles();
  context.SetState(EngineState::kSubmitting);

  for (const Chunk& chunk : chunks) {
    if (submission_mode_ == SubmissionMode::kThrottled) {
      Throttle(handles);
    }

    absl::StatusOr<TaskHandle> handle = pool_->Submit(chunk);
    if (!handle.ok()) {
      PARCEL_LOG(LogSeverity::kError, "[%s] Failed to submit chunk %s: %s",
                 context.GetLabel().c_str(), chunk.ToString().c_str(),
                 handle.status().ToString().c_str());
      return handle.status();
    }
    handles.push_back(std::move(handle.value()));
    outstanding_.push_back(handles.size() - 1);
    peak_outstanding_ = std::max(peak_outstanding_, outstanding_.size());
  }

  context.SetState(EngineState::kDraining);
  context.GetStats().peak_outstanding = peak_outstanding_;
  return absl::OkStatus();
}

void TaskSubmitter::Throttle(std::vector<TaskHandle>& handles) {
  outstanding_.erase(
      std::remove_if(outstanding_.begin(), outstanding_.end(),
                     [&handles](size_t i) { return handles[i].IsReady(); }),
      outstanding_.end());

  while (outstanding_.size() >= max_outstanding_) {
    handles[outstanding_.front()].Wait();
    outstanding_.pop_front();
  }
}

}  // namespace parcel
