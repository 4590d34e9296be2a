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

#include "parcel/sample_pool.h"

#include "absl/strings/str_format.h"

namespace parcel {

std::vector<size_t> SamplePool::GetRemaining() const {
  std::vector<size_t> remaining;
  remaining.reserve(GetNumRemaining());
  auto excluded = excluded_.begin();
  for (size_t index = 0; index < size_; index++) {
    if (excluded != excluded_.end() && *excluded == index) {
      ++excluded;
      continue;
    }
    remaining.push_back(index);
  }
  return remaining;
}

absl::Status SamplePool::Exclude(const std::vector<size_t>& indices) {
  for (size_t index : indices) {
    if (index >= size_) {
      return absl::OutOfRangeError(absl::StrFormat(
          "Index %d is outside of a pool of %d items", index, size_));
    }
  }
  excluded_.insert(indices.begin(), indices.end());
  return absl::OkStatus();
}

absl::StatusOr<std::vector<size_t>> SamplePool::Acquire(
    const std::vector<size_t>& positions) {
  const std::vector<size_t> remaining = GetRemaining();
  std::vector<size_t> acquired;
  acquired.reserve(positions.size());
  for (size_t position : positions) {
    if (position >= remaining.size()) {
      return absl::OutOfRangeError(
          absl::StrFormat("Position %d is outside of %d remaining items",
                          position, remaining.size()));
    }
    acquired.push_back(remaining[position]);
  }
  const std::set<size_t> unique(acquired.begin(), acquired.end());
  if (unique.size() != acquired.size()) {
    return absl::InvalidArgumentError(
        "Acquire positions must not repeat an item");
  }
  excluded_.insert(acquired.begin(), acquired.end());
  return acquired;
}

}  // namespace parcel
