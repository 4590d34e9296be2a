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

#include "parcel/partitioner.h"

#include <algorithm>

#include "absl/strings/str_format.h"
#include "parcel/error.h"

namespace parcel {
namespace {

void AppendChunk(std::vector<Chunk>& chunks, size_t begin, size_t end) {
  // The work callback is never invoked on empty input
  if (end <= begin) {
    return;
  }
  Chunk chunk;
  chunk.index = chunks.size();
  chunk.begin = begin;
  chunk.end = end;
  chunks.push_back(chunk);
}

}  // anonymous namespace

std::string Chunk::ToString() const {
  return absl::StrFormat("chunk %d [%d, %d)", index, begin, end);
}

bool operator==(const Chunk& lhs, const Chunk& rhs) {
  return lhs.index == rhs.index && lhs.begin == rhs.begin &&
         lhs.end == rhs.end;
}

absl::StatusOr<std::vector<Chunk>> PartitionBySize(size_t length,
                                                   int chunk_size) {
  if (chunk_size <= 0) {
    return ConfigurationError(
        absl::StrFormat("Chunk size must be positive, got %d", chunk_size));
  }

  const size_t step = static_cast<size_t>(chunk_size);
  const size_t num_chunks = length / step + (length % step > 0);

  std::vector<Chunk> chunks;
  chunks.reserve(num_chunks);
  for (size_t i = 0; i < num_chunks; i++) {
    AppendChunk(chunks, i * step, std::min((i + 1) * step, length));
  }
  return chunks;
}

std::vector<Chunk> PartitionByDevice(size_t length, int device_count) {
  std::vector<Chunk> chunks;
  if (device_count <= 1) {
    AppendChunk(chunks, 0, length);
    return chunks;
  }

  const size_t num_devices = static_cast<size_t>(device_count);
  const size_t step_size = length / num_devices;
  if (step_size == 0) {
    for (size_t i = 0; i < length; i++) {
      AppendChunk(chunks, i, i + 1);
    }
    return chunks;
  }

  for (size_t i = 0; i < num_devices; i++) {
    AppendChunk(chunks, i * step_size, (i + 1) * step_size);
  }
  // remainder
  AppendChunk(chunks, num_devices * step_size, length);
  return chunks;
}

}  // namespace parcel
