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

#include "parcel/wire.h"

#include <sys/socket.h>
#include <sys/types.h>

#include <cerrno>
#include <cstring>

#include "absl/strings/str_format.h"

namespace parcel {
namespace {

// u8 type, i32 task id, u64 payload size
constexpr size_t kHeaderSize =
    sizeof(uint8_t) + sizeof(int32_t) + sizeof(uint64_t);

absl::Status SendAll(int fd, const char* data, size_t size) {
  while (size > 0) {
    ssize_t written = send(fd, data, size, MSG_NOSIGNAL);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EPIPE || errno == ECONNRESET) {
        return absl::UnavailableError("Peer closed the connection");
      }
      return absl::InternalError(
          absl::StrFormat("send failed: %s", strerror(errno)));
    }
    data += written;
    size -= static_cast<size_t>(written);
  }
  return absl::OkStatus();
}

// Returns the number of bytes read before end of stream.
absl::StatusOr<size_t> RecvAll(int fd, char* data, size_t size) {
  size_t total = 0;
  while (total < size) {
    ssize_t received = recv(fd, data + total, size - total, 0);
    if (received < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == ECONNRESET) {
        break;
      }
      return absl::InternalError(
          absl::StrFormat("recv failed: %s", strerror(errno)));
    }
    if (received == 0) {
      break;
    }
    total += static_cast<size_t>(received);
  }
  return total;
}

}  // anonymous namespace

absl::Status WriteMessage(int fd, const Message& message) {
  char header[kHeaderSize];
  const uint8_t type = static_cast<uint8_t>(message.type);
  const int32_t task_id = message.task_id;
  const uint64_t size = message.payload.size();
  std::memcpy(header, &type, sizeof(type));
  std::memcpy(header + sizeof(type), &task_id, sizeof(task_id));
  std::memcpy(header + sizeof(type) + sizeof(task_id), &size, sizeof(size));

  RETURN_IF_ERROR(SendAll(fd, header, kHeaderSize));
  return SendAll(fd, message.payload.data(), message.payload.size());
}

absl::StatusOr<Message> ReadMessage(int fd) {
  char header[kHeaderSize];
  absl::StatusOr<size_t> received = RecvAll(fd, header, kHeaderSize);
  if (!received.ok()) {
    return received.status();
  }
  if (*received == 0) {
    return absl::UnavailableError("Peer closed the connection");
  }
  if (*received < kHeaderSize) {
    return absl::DataLossError("Connection closed inside a message header");
  }

  uint8_t type = 0;
  int32_t task_id = 0;
  uint64_t size = 0;
  std::memcpy(&type, header, sizeof(type));
  std::memcpy(&task_id, header + sizeof(type), sizeof(task_id));
  std::memcpy(&size, header + sizeof(type) + sizeof(task_id), sizeof(size));

  if (type < static_cast<uint8_t>(MessageType::kTask) ||
      type > static_cast<uint8_t>(MessageType::kShutdown)) {
    return absl::DataLossError(
        absl::StrFormat("Unknown message type %d", type));
  }

  Message message;
  message.type = static_cast<MessageType>(type);
  message.task_id = task_id;
  message.payload.resize(size);
  received = RecvAll(fd, &message.payload[0], size);
  if (!received.ok()) {
    return received.status();
  }
  if (*received < size) {
    return absl::DataLossError(absl::StrFormat(
        "Connection closed after %d of %d payload bytes", *received, size));
  }
  return message;
}

}  // namespace parcel
