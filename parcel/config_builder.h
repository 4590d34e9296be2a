#ifndef PARCEL_CONFIG_BUILDER_H_
#define PARCEL_CONFIG_BUILDER_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "parcel/common.h"
#include "parcel/config.h"

namespace parcel {

// Builder for creating PoolConfig.
class PoolConfigBuilder {
  friend class RuntimeConfigBuilder;

 public:
  PoolConfigBuilder& AddNumWorkers(int num_workers) {
    num_workers_ = num_workers;
    return *this;
  }
  PoolConfigBuilder& AddMaxTasksPerWorker(int max_tasks_per_worker) {
    max_tasks_per_worker_ = max_tasks_per_worker;
    return *this;
  }
  PoolConfigBuilder& AddDeviceCount(int device_count) {
    device_count_ = device_count;
    return *this;
  }

  absl::StatusOr<PoolConfig> Build();
  absl::Status IsValid();

 private:
  int num_workers_ = 1;
  int max_tasks_per_worker_ = 50;
  int device_count_ = 0;
};

// Builder for creating SubmitConfig.
class SubmitConfigBuilder {
  friend class RuntimeConfigBuilder;

 public:
  SubmitConfigBuilder& AddChunkSize(int chunk_size) {
    chunk_size_ = chunk_size;
    return *this;
  }
  SubmitConfigBuilder& AddSubmissionMode(SubmissionMode submission_mode) {
    submission_mode_ = submission_mode;
    return *this;
  }
  SubmitConfigBuilder& AddMaxOutstandingTasks(int max_outstanding_tasks) {
    max_outstanding_tasks_ = max_outstanding_tasks;
    return *this;
  }
  SubmitConfigBuilder& AddLabel(std::string label) {
    label_ = label;
    return *this;
  }
  SubmitConfigBuilder& AddVerbose(bool verbose) {
    verbose_ = verbose;
    return *this;
  }

  absl::StatusOr<SubmitConfig> Build();
  absl::Status IsValid();

 private:
  int chunk_size_ = 1;
  SubmissionMode submission_mode_ = SubmissionMode::kUnthrottled;
  int max_outstanding_tasks_ = 0;
  std::string label_ = "";
  bool verbose_ = false;
};

// Delegate for ConfigBuilders
class RuntimeConfigBuilder {
 public:
  RuntimeConfigBuilder& AddExecutionMode(ExecutionMode execution_mode) {
    execution_mode_ = execution_mode;
    return *this;
  }
  RuntimeConfigBuilder& AddOutputDim(int output_dim) {
    output_dim_ = output_dim;
    return *this;
  }

  // Add PoolConfig
  RuntimeConfigBuilder& AddNumWorkers(int num_workers) {
    pool_config_builder_.AddNumWorkers(num_workers);
    return *this;
  }
  RuntimeConfigBuilder& AddMaxTasksPerWorker(int max_tasks_per_worker) {
    pool_config_builder_.AddMaxTasksPerWorker(max_tasks_per_worker);
    return *this;
  }
  RuntimeConfigBuilder& AddDeviceCount(int device_count) {
    pool_config_builder_.AddDeviceCount(device_count);
    return *this;
  }

  // Add SubmitConfig
  RuntimeConfigBuilder& AddChunkSize(int chunk_size) {
    submit_config_builder_.AddChunkSize(chunk_size);
    return *this;
  }
  RuntimeConfigBuilder& AddSubmissionMode(SubmissionMode submission_mode) {
    submit_config_builder_.AddSubmissionMode(submission_mode);
    return *this;
  }
  RuntimeConfigBuilder& AddMaxOutstandingTasks(int max_outstanding_tasks) {
    submit_config_builder_.AddMaxOutstandingTasks(max_outstanding_tasks);
    return *this;
  }
  RuntimeConfigBuilder& AddLabel(std::string label) {
    submit_config_builder_.AddLabel(label);
    return *this;
  }
  RuntimeConfigBuilder& AddVerbose(bool verbose) {
    submit_config_builder_.AddVerbose(verbose);
    return *this;
  }

  absl::StatusOr<RuntimeConfig> Build();
  absl::Status IsValid();

  static RuntimeConfig GetDefaultConfig();

 private:
  PoolConfigBuilder pool_config_builder_;
  SubmitConfigBuilder submit_config_builder_;
  ExecutionMode execution_mode_ = ExecutionMode::kCPU;
  int output_dim_ = 1;
};

}  // namespace parcel

#endif  // PARCEL_CONFIG_BUILDER_H_
