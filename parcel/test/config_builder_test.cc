#include "parcel/config_builder.h"

#include <gtest/gtest.h>

#include "parcel/error.h"

namespace parcel {
namespace test {

TEST(ConfigBuilderTest, PoolConfigBuilderTest) {
  PoolConfigBuilder b;
  PoolConfig config_ok =
      b.AddNumWorkers(3).AddMaxTasksPerWorker(0).AddDeviceCount(2).Build()
          .value();
  EXPECT_EQ(config_ok.num_workers, 3);
  EXPECT_EQ(config_ok.max_tasks_per_worker, 0);
  EXPECT_EQ(config_ok.device_count, 2);

  b.AddNumWorkers(0);
  EXPECT_TRUE(IsConfigurationError(b.IsValid()));
  b.AddNumWorkers(1).AddMaxTasksPerWorker(-1);
  EXPECT_FALSE(b.IsValid().ok());
  b.AddMaxTasksPerWorker(50).AddDeviceCount(-2);
  EXPECT_FALSE(b.IsValid().ok());
}

TEST(ConfigBuilderTest, SubmitConfigBuilderTest) {
  SubmitConfigBuilder b;
  SubmitConfig config_ok = b.AddChunkSize(16)
                               .AddSubmissionMode(SubmissionMode::kThrottled)
                               .AddMaxOutstandingTasks(3)
                               .AddLabel("features")
                               .AddVerbose(true)
                               .Build()
                               .value();
  EXPECT_EQ(config_ok.chunk_size, 16);
  EXPECT_EQ(config_ok.submission_mode, SubmissionMode::kThrottled);
  EXPECT_EQ(config_ok.max_outstanding_tasks, 3);
  EXPECT_EQ(config_ok.label, "features");
  EXPECT_TRUE(config_ok.verbose);

  b.AddChunkSize(0);
  absl::Status status = b.IsValid();
  EXPECT_TRUE(IsConfigurationError(status));
  EXPECT_NE(status.message().find("chunk_size_ > 0"), std::string::npos);
}

TEST(ConfigBuilderTest, RuntimeConfigBuilderTest) {
  RuntimeConfigBuilder b;
  RuntimeConfig config_ok = b.AddExecutionMode(ExecutionMode::kCPU)
                                .AddOutputDim(2)
                                .AddNumWorkers(4)
                                .AddChunkSize(10)
                                .Build()
                                .value();
  EXPECT_EQ(config_ok.execution_mode, ExecutionMode::kCPU);
  EXPECT_EQ(config_ok.output_dim, 2);
  EXPECT_EQ(config_ok.pool_config.num_workers, 4);
  EXPECT_EQ(config_ok.pool_config.max_tasks_per_worker, 50);
  EXPECT_EQ(config_ok.submit_config.chunk_size, 10);

  b.AddOutputDim(0);
  EXPECT_FALSE(b.IsValid().ok());
  b.AddOutputDim(1).AddChunkSize(-1);
  EXPECT_FALSE(b.IsValid().ok());
}

TEST(ConfigBuilderTest, AcceleratorDerivesWorkerCount) {
  RuntimeConfig config = RuntimeConfigBuilder()
                             .AddExecutionMode(ExecutionMode::kAccelerator)
                             .AddNumWorkers(8)
                             .AddDeviceCount(3)
                             .Build()
                             .value();
  EXPECT_EQ(config.pool_config.num_workers, 3);

  RuntimeConfig single = RuntimeConfigBuilder()
                             .AddExecutionMode(ExecutionMode::kAccelerator)
                             .AddDeviceCount(0)
                             .Build()
                             .value();
  EXPECT_EQ(single.pool_config.num_workers, 1);
}

TEST(ConfigBuilderTest, AcceleratorRequiresSingleOutput) {
  RuntimeConfigBuilder b;
  b.AddExecutionMode(ExecutionMode::kAccelerator).AddOutputDim(2);
  EXPECT_TRUE(IsConfigurationError(b.Build().status()));
}

TEST(ConfigBuilderTest, DefaultConfig) {
  RuntimeConfig config = RuntimeConfigBuilder::GetDefaultConfig();
  EXPECT_EQ(config.execution_mode, ExecutionMode::kCPU);
  EXPECT_EQ(config.pool_config.num_workers, 4);
  EXPECT_EQ(config.submit_config.submission_mode,
            SubmissionMode::kUnthrottled);
}

TEST(ConfigBuilderTest, EnumNames) {
  EXPECT_EQ(FromString<ExecutionMode>("accelerator").value(),
            ExecutionMode::kAccelerator);
  EXPECT_EQ(
      FromString<SubmissionMode>(ToString(SubmissionMode::kThrottled)).value(),
      SubmissionMode::kThrottled);
  EXPECT_FALSE(FromString<ExecutionMode>("gpu").has_value());
  EXPECT_STREQ(ToString(EngineState::kDraining), "DRAINING");
}

}  // namespace test
}  // namespace parcel

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
