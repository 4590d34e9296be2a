#ifndef PARCEL_RUN_CONTEXT_H_
#define PARCEL_RUN_CONTEXT_H_

#include <sys/types.h>

#include <cstdint>
#include <string>
#include <vector>

#include "parcel/common.h"
#include "parcel/logger.h"
#include "parcel/task_handle.h"

namespace parcel {

// Statistics of one engine invocation, collected when its pool is released
struct RunStats {
  size_t num_chunks = 0;
  size_t num_workers = 0;
  // Every worker process forked during the run, replacements included
  std::vector<pid_t> spawned_pids;
  int num_releases = 0;
  size_t num_recycled_workers = 0;
  size_t num_lost_workers = 0;
  // Largest number of unresolved handles seen by the submitter
  size_t peak_outstanding = 0;
  uint64_t elapsed_us = 0;
};

// Coordinator state of a single invocation. Created by the engine for every
// run and discarded with the next one.
class RunContext {
 public:
  explicit RunContext(std::string label) : label_(label) {}

  EngineState GetState() const { return state_; }
  void SetState(EngineState state) {
    if (state == state_) {
      return;
    }
    PARCEL_LOG_DEBUG("[%s] %s -> %s", label_.c_str(), ToString(state_),
                     ToString(state));
    state_ = state;
  }

  const std::string& GetLabel() const { return label_; }
  RunStats& GetStats() { return stats_; }
  const RunStats& GetStats() const { return stats_; }

  // Handles in submission order; owned here until the aggregator takes them
  std::vector<TaskHandle>& GetHandles() { return handles_; }

 private:
  const std::string label_;
  EngineState state_ = EngineState::kCreated;
  RunStats stats_;
  std::vector<TaskHandle> handles_;
};

}  // namespace parcel

#endif  // PARCEL_RUN_CONTEXT_H_
