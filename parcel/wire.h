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

#ifndef PARCEL_WIRE_H_
#define PARCEL_WIRE_H_

#include <cstdint>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "parcel/common.h"

namespace parcel {

// Messages exchanged between the coordinator and one worker process over the
// worker's private stream socket.
enum class MessageType : uint8_t {
  // coordinator -> worker: payload is an encoded Chunk
  kTask = 1,
  // worker -> coordinator: payload is an encoded ResultSet
  kResult = 2,
  // worker -> coordinator: payload is the error message of the callback
  kFailure = 3,
  // coordinator -> worker: exit after the current task
  kShutdown = 4,
};

struct Message {
  MessageType type = MessageType::kShutdown;
  TaskId task_id = -1;
  std::string payload;
};

/**
 * @brief Writes one framed message to `fd`.
 * @return UnavailableError if the peer has gone away.
 */
absl::Status WriteMessage(int fd, const Message& message);

/**
 * @brief Blocks until one complete message is read from `fd`.
 * @return UnavailableError if the peer closed the socket before a message
 * started, DataLossError if it closed in the middle of one.
 */
absl::StatusOr<Message> ReadMessage(int fd);

}  // namespace parcel

#endif  // PARCEL_WIRE_H_
