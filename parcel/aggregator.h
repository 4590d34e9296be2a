#ifndef PARCEL_AGGREGATOR_H_
#define PARCEL_AGGREGATOR_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/types/optional.h"
#include "parcel/payload.h"
#include "parcel/task_handle.h"

namespace parcel {

/**
 * @class ResultAggregator
 * @brief Merges per-chunk results into `output_dim` ordered buckets.
 *
 * Results are taken in submission order, whatever the order in which the
 * tasks completed. Column k of every result is appended to bucket k. A bucket
 * that is null in every result is dropped by Finish(); a bucket that is
 * present in at least one result is kept, even when empty.
 */
class ResultAggregator {
 public:
  explicit ResultAggregator(int output_dim, std::string label = "",
                            bool verbose = false);

  /**
   * @brief Resolves every handle in order and adds its result.
   * @return The first task error. Aggregation stops there and the remaining
   * handles are left unresolved.
   */
  absl::Status Collect(std::vector<TaskHandle>& handles);

  /**
   * @brief Appends one chunk result.
   * @return WorkerExecutionError if the number of columns is not
   * `output_dim`.
   */
  absl::Status Add(TaskId task_id, const ResultSet& result);

  // Encoded buckets, without the ones that were null in every result
  std::vector<std::string> Finish() const;

  size_t GetNumResults() const { return num_results_; }

 private:
  const int output_dim_;
  const std::string label_;
  const bool verbose_;
  std::vector<absl::optional<std::string>> buckets_;
  size_t num_results_ = 0;
};

}  // namespace parcel

#endif  // PARCEL_AGGREGATOR_H_
