#ifndef PARCEL_SAMPLE_POOL_H_
#define PARCEL_SAMPLE_POOL_H_

#include <cstddef>
#include <set>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace parcel {

// Unlabeled pool over an immutable range of backing indices [0, size).
//
// Acquired or reserved items are recorded in an exclusion set instead of
// being removed from the backing data, so positions handed out by
// GetRemaining() stay valid until the next Exclude()/Acquire().
class SamplePool {
 public:
  explicit SamplePool(size_t size) : size_(size) {}

  size_t GetSize() const { return size_; }
  size_t GetNumExcluded() const { return excluded_.size(); }
  size_t GetNumRemaining() const { return size_ - excluded_.size(); }
  bool IsExcluded(size_t index) const { return excluded_.count(index) > 0; }

  // Backing indices still in the pool, ascending
  std::vector<size_t> GetRemaining() const;

  // Excludes backing indices. Already excluded indices are ignored.
  absl::Status Exclude(const std::vector<size_t>& indices);

  /**
   * @brief Excludes items chosen by their position in GetRemaining().
   * @return The backing indices of the acquired items, in the order of
   * `positions`. OutOfRangeError for a position past the remaining items and
   * InvalidArgumentError for a position given twice; nothing is excluded
   * then.
   */
  absl::StatusOr<std::vector<size_t>> Acquire(
      const std::vector<size_t>& positions);

 private:
  const size_t size_;
  std::set<size_t> excluded_;
};

// Copies data[i] for every i in `indices`, in that order. Indices must be in
// range.
template <typename T>
std::vector<T> Gather(const std::vector<T>& data,
                      const std::vector<size_t>& indices) {
  std::vector<T> gathered;
  gathered.reserve(indices.size());
  for (size_t index : indices) {
    gathered.push_back(data[index]);
  }
  return gathered;
}

}  // namespace parcel

#endif  // PARCEL_SAMPLE_POOL_H_
