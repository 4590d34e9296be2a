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

#ifndef PARCEL_PARALLEL_H_
#define PARCEL_PARALLEL_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/types/optional.h"
#include "absl/types/span.h"
#include "parcel/engine.h"
#include "parcel/error.h"
#include "parcel/payload.h"

/**
 * @file parallel.h
 * @brief Typed entry points of the engine.
 *
 * `MultiprocessRun` runs a callback over chunks of one sequence on CPU
 * workers and may produce several output streams. `MultiDeviceRun` splits a
 * paired feature/label workload into one share per device and produces a
 * single stream.
 *
 * Extra parameters are bound into the task once per run and reach every task
 * unchanged. Inputs and outputs must be trivially copyable.
 */

namespace parcel {

// Output of a CPU callback: one optional column per output stream. A column
// left empty (nullopt) is a null bucket.
template <typename T>
using Buckets = std::vector<absl::optional<std::vector<T>>>;

// Share of an accelerator workload handed to one task
template <typename Feature, typename Label>
struct DeviceChunk {
  absl::Span<const Feature> features;
  absl::Span<const Label> labels;
  Chunk chunk;
  // Identity and device of the worker process running the task
  const WorkerContext* context = nullptr;
};

template <typename Out>
absl::StatusOr<std::vector<std::vector<Out>>> DecodeBuckets(
    const std::vector<std::string>& encoded) {
  std::vector<std::vector<Out>> buckets(encoded.size());
  for (size_t k = 0; k < encoded.size(); k++) {
    RETURN_IF_ERROR(DecodeColumn<Out>(encoded[k], buckets[k]));
  }
  return buckets;
}

/**
 * @brief Runs `fn(absl::Span<const In>, params...)` over chunks of `data`.
 *
 * `fn` returns `absl::StatusOr<Buckets<Out>>` with exactly `output_dim`
 * columns.
 * @return One sequence per output stream that was not null in every chunk,
 * each in the order of `data`.
 */
template <typename Out, typename In, typename Fn, typename... Params>
absl::StatusOr<std::vector<std::vector<Out>>> MultiprocessRun(
    Engine& engine, Fn fn, const std::vector<In>& data, Params... params) {
  if (engine.GetConfig().execution_mode != ExecutionMode::kCPU) {
    return ConfigurationError("MultiprocessRun requires cpu execution mode");
  }

  TaskFunction task = [&data, fn, params...](
                          const Chunk& chunk,
                          const WorkerContext&) -> absl::StatusOr<ResultSet> {
    absl::Span<const In> items(data.data() + chunk.begin, chunk.size());
    absl::StatusOr<Buckets<Out>> buckets = fn(items, params...);
    if (!buckets.ok()) {
      return buckets.status();
    }
    ResultSet result;
    for (const auto& column : *buckets) {
      if (column.has_value()) {
        result.push_back(EncodeColumn(*column));
      } else {
        result.push_back(absl::nullopt);
      }
    }
    return result;
  };

  absl::StatusOr<std::vector<std::string>> encoded =
      engine.Run(data.size(), std::move(task));
  if (!encoded.ok()) {
    return encoded.status();
  }
  return DecodeBuckets<Out>(*encoded);
}

/**
 * @brief Runs `fn(const DeviceChunk<Feature, Label>&, params...)` over one
 * share of the workload per device.
 *
 * `initializer` runs once in every worker process, before its first share;
 * it is the place to bind the process to `context.device_id`.
 * @return The concatenated outputs, in the order of the workload.
 * ConfigurationError if `features` and `labels` differ in length.
 */
template <typename Out, typename Feature, typename Label, typename Fn,
          typename... Params>
absl::StatusOr<std::vector<Out>> MultiDeviceRun(
    Engine& engine, Fn fn, const std::vector<Feature>& features,
    const std::vector<Label>& labels, Initializer initializer,
    Params... params) {
  if (engine.GetConfig().execution_mode != ExecutionMode::kAccelerator) {
    return ConfigurationError(
        "MultiDeviceRun requires accelerator execution mode");
  }
  if (features.size() != labels.size()) {
    return ConfigurationError(
        absl::StrFormat("Got %d features but %d labels", features.size(),
                        labels.size()));
  }

  TaskFunction task = [&features, &labels, fn, params...](
                          const Chunk& chunk, const WorkerContext& context)
      -> absl::StatusOr<ResultSet> {
    DeviceChunk<Feature, Label> share;
    share.features = absl::Span<const Feature>(features.data() + chunk.begin,
                                               chunk.size());
    share.labels =
        absl::Span<const Label>(labels.data() + chunk.begin, chunk.size());
    share.chunk = chunk;
    share.context = &context;
    absl::StatusOr<std::vector<Out>> outputs = fn(share, params...);
    if (!outputs.ok()) {
      return outputs.status();
    }
    return ResultSet{EncodeColumn(*outputs)};
  };

  absl::StatusOr<std::vector<std::string>> encoded =
      engine.Run(features.size(), std::move(task), std::move(initializer));
  if (!encoded.ok()) {
    return encoded.status();
  }
  absl::StatusOr<std::vector<std::vector<Out>>> buckets =
      DecodeBuckets<Out>(*encoded);
  if (!buckets.ok()) {
    return buckets.status();
  }
  if (buckets->empty()) {
    return std::vector<Out>();
  }
  return std::move(buckets->front());
}

}  // namespace parcel

#endif  // PARCEL_PARALLEL_H_
