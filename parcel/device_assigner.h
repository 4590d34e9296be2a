#ifndef PARCEL_DEVICE_ASSIGNER_H_
#define PARCEL_DEVICE_ASSIGNER_H_

#include <deque>
#include <vector>

#include "absl/types/optional.h"
#include "parcel/common.h"

namespace parcel {

// Round-robin allocation of device ids to worker slots.
//
// The queue is consumed once per slot when the pool is created; the resulting
// slot -> device table is kept for the pool's lifetime, so a worker process
// that replaces a recycled or lost one is bound to the same device as its
// predecessor. Device load is not tracked.
class DeviceAssigner {
 public:
  DeviceAssigner(int device_count, int num_slots);

  // True if workers are bound to devices at all. A single accelerator runs
  // without binding.
  bool IsBinding() const { return device_count_ > 1; }
  int GetDeviceCount() const { return device_count_; }
  int GetNumSlots() const { return num_slots_; }

  // Device of the given worker slot, or nullopt when workers are not bound.
  absl::optional<DeviceId> GetDevice(WorkerId slot) const;
  const std::vector<DeviceId>& GetSlotDevices() const { return slot_devices_; }

 private:
  const int device_count_;
  const int num_slots_;
  std::vector<DeviceId> slot_devices_;
};

// FIFO of `num_slots` device ids where entry i is i % device_count.
std::deque<DeviceId> MakeDeviceQueue(int device_count, int num_slots);

}  // namespace parcel

#endif  // PARCEL_DEVICE_ASSIGNER_H_
