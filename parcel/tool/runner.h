#ifndef PARCEL_TOOL_RUNNER_H_
#define PARCEL_TOOL_RUNNER_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "parcel/config.h"
#include "parcel/engine.h"
#include "parcel/json_util.h"

namespace parcel {
namespace tool {

struct RunnerConfig {
  // transform, predict or acquire
  std::string workload = "transform";
  int workload_size = 1000;
  // Simulated work per item
  int item_time_us = 0;
  int acquire_rounds = 3;
  int acquire_size = 10;
};

// Drives a synthetic workload through the engine and reports the run
// statistics.
class Runner {
 public:
  Runner() = default;
  ~Runner();
  absl::Status Initialize(int argc, const char** argv);
  absl::Status Run();

  // Items acquired by each round of the last acquire workload
  const std::vector<size_t>& GetAcquiredCounts() const {
    return acquired_counts_;
  }
  size_t GetNumUnacquired() const { return num_unacquired_; }

 private:
  bool ParseArgs(int argc, const char** argv);
  bool LoadRunnerConfigs(const Json::Value& root);
  absl::Status LoadRuntimeConfigs(const Json::Value& root);

  absl::Status RunTransform();
  absl::Status RunPredict();
  absl::Status RunAcquire();
  void LogResults(const std::string& title, uint64_t wall_time_us) const;

  RunnerConfig runner_config_;
  RuntimeConfig* runtime_config_ = nullptr;
  std::unique_ptr<Engine> engine_;

  std::vector<size_t> acquired_counts_;
  size_t num_unacquired_ = 0;
};

}  // namespace tool
}  // namespace parcel

#endif  // PARCEL_TOOL_RUNNER_H_
