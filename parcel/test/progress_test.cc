#include "parcel/progress.h"

#include <gtest/gtest.h>

#include "parcel/logger.h"
#include "parcel/test/test_util.h"

namespace parcel {
namespace test {

CompletionEvent GetEvent(TaskId task_id, TaskStatus status) {
  CompletionEvent event;
  event.task_id = task_id;
  event.worker_id = 0;
  event.status = status;
  return event;
}

TEST(ProgressChannelTest, DeliversEventsInPushOrder) {
  RecordingSink sink;
  ProgressChannel channel(&sink, "scores", 3);
  channel.Push(GetEvent(2, TaskStatus::kSuccess));
  channel.Push(GetEvent(0, TaskStatus::kExecutionFailure));
  channel.Push(GetEvent(1, TaskStatus::kSuccess));
  channel.Close();

  EXPECT_EQ(sink.started_label, "scores");
  EXPECT_EQ(sink.started_total, 3);
  EXPECT_EQ(sink.completed_counts, std::vector<size_t>({1, 2, 3}));
  ASSERT_EQ(sink.events.size(), 3);
  EXPECT_EQ(sink.events[0].task_id, 2);
  EXPECT_EQ(sink.events[1].status, TaskStatus::kExecutionFailure);
  EXPECT_TRUE(sink.finished);
  EXPECT_EQ(sink.finished_completed, 3);
  EXPECT_EQ(channel.GetCompleted(), 3);
}

TEST(ProgressChannelTest, IgnoresEventsAfterClose) {
  RecordingSink sink;
  ProgressChannel channel(&sink, "late", 1);
  channel.Close();
  channel.Close();

  Logger::Get().SetVerbosity(LogSeverity::kWarning);
  channel.Push(GetEvent(0, TaskStatus::kSuccess));
  EXPECT_EQ(Logger::Get().GetLastLog().first, LogSeverity::kWarning);
  EXPECT_TRUE(sink.events.empty());
  EXPECT_EQ(channel.GetCompleted(), 0);
}

TEST(ProgressChannelTest, WorksWithoutSink) {
  ProgressChannel channel(nullptr, "none", 2);
  channel.Push(GetEvent(0, TaskStatus::kSuccess));
  channel.Push(GetEvent(1, TaskStatus::kSuccess));
  channel.Close();
  EXPECT_EQ(channel.GetCompleted(), 2);
}

TEST(LogProgressSinkTest, ReportsThroughLogger) {
  Logger::Get().SetVerbosity(LogSeverity::kInfo);
  LogProgressSink sink;
  {
    ProgressChannel channel(&sink, "labels", 1);
    channel.Push(GetEvent(0, TaskStatus::kSuccess));
  }
  EXPECT_EQ(Logger::Get().GetLastLog().second,
            "[labels] finished 1 of 1 tasks");
}

}  // namespace test
}  // namespace parcel

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
