#ifndef PARCEL_PARTITIONER_H_
#define PARCEL_PARTITIONER_H_

#include <cstddef>
#include <string>
#include <vector>

#include "absl/status/statusor.h"

namespace parcel {

// Contiguous half-open range [begin, end) of the workload, submitted as one
// task. `index` is its position in submission order.
struct Chunk {
  size_t index = 0;
  size_t begin = 0;
  size_t end = 0;

  size_t size() const { return end - begin; }
  bool empty() const { return end <= begin; }
  std::string ToString() const;
};

bool operator==(const Chunk& lhs, const Chunk& rhs);

/**
 * @brief Splits a workload of `length` items into chunks of `chunk_size`
 * items. The last chunk is clipped to the workload.
 * @return ConfigurationError if `chunk_size` is not positive.
 */
absl::StatusOr<std::vector<Chunk>> PartitionBySize(size_t length,
                                                   int chunk_size);

/**
 * @brief Splits a workload into one share per device plus a remainder chunk.
 *
 * With more than one device each of the `device_count` chunks holds
 * floor(length / device_count) items and the remainder, if any, forms one
 * extra chunk. With a single device (or none) the whole workload is one
 * chunk. A workload smaller than the device count becomes one chunk per item.
 */
std::vector<Chunk> PartitionByDevice(size_t length, int device_count);

}  // namespace parcel

#endif  // PARCEL_PARTITIONER_H_
