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

#include "parcel/payload.h"

#include <cstdint>

namespace parcel {
namespace {

// Layout (host byte order, the peer is always a fork of this process):
//   u32 num_columns
//   per column: u8 present, u64 num_bytes, bytes

template <typename T>
void Put(std::string& out, T value) {
  out.append(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
bool Take(absl::string_view& in, T& value) {
  if (in.size() < sizeof(T)) {
    return false;
  }
  std::memcpy(&value, in.data(), sizeof(T));
  in.remove_prefix(sizeof(T));
  return true;
}

}  // anonymous namespace

std::string EncodeResultSet(const ResultSet& result_set) {
  size_t total = sizeof(uint32_t);
  for (const auto& column : result_set) {
    total += sizeof(uint8_t) + sizeof(uint64_t) + (column ? column->size() : 0);
  }

  std::string out;
  out.reserve(total);
  Put<uint32_t>(out, static_cast<uint32_t>(result_set.size()));
  for (const auto& column : result_set) {
    Put<uint8_t>(out, column.has_value() ? 1 : 0);
    Put<uint64_t>(out, column ? column->size() : 0);
    if (column) {
      out.append(*column);
    }
  }
  return out;
}

absl::StatusOr<ResultSet> DecodeResultSet(absl::string_view bytes) {
  uint32_t num_columns = 0;
  if (!Take(bytes, num_columns)) {
    return absl::DataLossError("Truncated result header");
  }

  ResultSet result_set;
  result_set.reserve(num_columns);
  for (uint32_t i = 0; i < num_columns; i++) {
    uint8_t present = 0;
    uint64_t num_bytes = 0;
    if (!Take(bytes, present) || !Take(bytes, num_bytes) ||
        bytes.size() < num_bytes) {
      return absl::DataLossError(
          absl::StrFormat("Truncated result column %d", i));
    }
    if (present) {
      result_set.emplace_back(std::string(bytes.substr(0, num_bytes)));
    } else {
      result_set.emplace_back(absl::nullopt);
    }
    bytes.remove_prefix(num_bytes);
  }

  if (!bytes.empty()) {
    return absl::DataLossError(
        absl::StrFormat("%d trailing bytes after result", bytes.size()));
  }
  return result_set;
}

std::string EncodeChunk(const Chunk& chunk) {
  std::string out;
  Put<uint64_t>(out, chunk.index);
  Put<uint64_t>(out, chunk.begin);
  Put<uint64_t>(out, chunk.end);
  return out;
}

absl::StatusOr<Chunk> DecodeChunk(absl::string_view bytes) {
  uint64_t index = 0, begin = 0, end = 0;
  if (!Take(bytes, index) || !Take(bytes, begin) || !Take(bytes, end) ||
      !bytes.empty() || end < begin) {
    return absl::DataLossError("Malformed chunk");
  }
  Chunk chunk;
  chunk.index = index;
  chunk.begin = begin;
  chunk.end = end;
  return chunk;
}

}  // namespace parcel
