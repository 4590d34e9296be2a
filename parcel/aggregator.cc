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

#include "parcel/aggregator.h"

#include "absl/strings/str_format.h"
#include "parcel/error.h"
#include "parcel/logger.h"

namespace parcel {

ResultAggregator::ResultAggregator(int output_dim, std::string label,
                                   bool verbose)
    : output_dim_(output_dim),
      label_(label),
      verbose_(verbose),
      buckets_(output_dim > 0 ? output_dim : 0) {}

absl::Status ResultAggregator::Collect(std::vector<TaskHandle>& handles) {
  for (size_t i = 0; i < handles.size(); i++) {
    absl::StatusOr<ResultSet> result = handles[i].Get();
    if (!result.ok()) {
      PARCEL_LOG(LogSeverity::kError, "[%s] Task %d failed: %s",
                 label_.c_str(), handles[i].GetId(),
                 result.status().ToString().c_str());
      return result.status();
    }
    RETURN_IF_ERROR(Add(handles[i].GetId(), *result));

    if (verbose_) {
      PARCEL_LOG(LogSeverity::kInfo, "[%s] Done transformations (step %zu/%zu)",
                 label_.c_str(), i + 1, handles.size());
    }
  }
  return absl::OkStatus();
}

absl::Status ResultAggregator::Add(TaskId task_id, const ResultSet& result) {
  if (result.size() != static_cast<size_t>(output_dim_)) {
    return WorkerExecutionError(
        -1, task_id,
        absl::StrFormat("expected %d output columns, got %d", output_dim_,
                        result.size()));
  }

  for (size_t k = 0; k < result.size(); k++) {
    if (!result[k].has_value()) {
      continue;
    }
    if (!buckets_[k].has_value()) {
      buckets_[k] = std::string();
    }
    buckets_[k]->append(*result[k]);
  }
  num_results_++;
  return absl::OkStatus();
}

std::vector<std::string> ResultAggregator::Finish() const {
  std::vector<std::string> buckets;
  for (const auto& bucket : buckets_) {
    if (bucket.has_value()) {
      buckets.push_back(*bucket);
    }
  }
  return buckets;
}

}  // namespace parcel
