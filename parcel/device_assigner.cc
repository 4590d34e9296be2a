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

#include "parcel/device_assigner.h"

#include "parcel/logger.h"

namespace parcel {

std::deque<DeviceId> MakeDeviceQueue(int device_count, int num_slots) {
  std::deque<DeviceId> device_queue;
  if (device_count <= 0) {
    return device_queue;
  }
  for (int slot = 0; slot < num_slots; slot++) {
    device_queue.push_back(slot % device_count);
  }
  return device_queue;
}

DeviceAssigner::DeviceAssigner(int device_count, int num_slots)
    : device_count_(device_count), num_slots_(num_slots) {
  if (!IsBinding()) {
    return;
  }

  std::deque<DeviceId> device_queue = MakeDeviceQueue(device_count, num_slots);
  while (!device_queue.empty()) {
    slot_devices_.push_back(device_queue.front());
    device_queue.pop_front();
  }
  PARCEL_LOG_DEBUG("Assigned %d devices to %d worker slots", device_count_,
                   num_slots_);
}

absl::optional<DeviceId> DeviceAssigner::GetDevice(WorkerId slot) const {
  if (!IsBinding() || slot < 0 ||
      static_cast<size_t>(slot) >= slot_devices_.size()) {
    return absl::nullopt;
  }
  return slot_devices_[slot];
}

}  // namespace parcel
