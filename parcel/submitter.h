#ifndef PARCEL_SUBMITTER_H_
#define PARCEL_SUBMITTER_H_

#include <deque>
#include <vector>

#include "absl/status/status.h"
#include "parcel/common.h"
#include "parcel/partitioner.h"
#include "parcel/pool_interface.h"
#include "parcel/run_context.h"

namespace parcel {

/**
 * @class TaskSubmitter
 * @brief Submits one task per chunk, in chunk order.
 *
 * In throttled mode the submitter blocks before a submission while the number
 * of unresolved handles it holds has reached the bound, waiting on the oldest
 * one. This bounds the buffered handles, not the number of running tasks.
 */
class TaskSubmitter {
 public:
  /**
   * @param pool Destination of the tasks. Not owned.
   * @param submission_mode Unthrottled or throttled submission.
   * @param max_outstanding Bound of unresolved handles in throttled mode.
   * 0 selects `pool->GetNumWorkers() + 1`.
   */
  TaskSubmitter(IWorkerPool* pool, SubmissionMode submission_mode,
                size_t max_outstanding = 0);

  /**
   * @brief Submits every chunk and appends the handles to the context.
   *
   * Moves the context from CREATED to SUBMITTING with the first chunk and to
   * DRAINING after the last one.
   * @return The first submission error.
   */
  absl::Status SubmitAll(const std::vector<Chunk>& chunks,
                         RunContext& context);

  size_t GetMaxOutstanding() const { return max_outstanding_; }
  size_t GetPeakOutstanding() const { return peak_outstanding_; }

 private:
  void Throttle(std::vector<TaskHandle>& handles);

  IWorkerPool* const pool_;
  const SubmissionMode submission_mode_;
  const size_t max_outstanding_;
  // Indices of handles that were not seen resolved yet
  std::deque<size_t> outstanding_;
  size_t peak_outstanding_ = 0;
};

}  // namespace parcel

#endif  // PARCEL_SUBMITTER_H_
