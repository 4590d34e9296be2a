#include "parcel/wire.h"

#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>

#include "parcel/payload.h"

namespace parcel {
namespace test {

class WireTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds_), 0);
  }
  void TearDown() override {
    for (int fd : fds_) {
      if (fd >= 0) {
        close(fd);
      }
    }
  }
  void CloseWriter() {
    close(fds_[0]);
    fds_[0] = -1;
  }

  int fds_[2] = {-1, -1};
};

TEST_F(WireTest, MessageRoundTrip) {
  Message task;
  task.type = MessageType::kTask;
  task.task_id = 17;
  task.payload = EncodeChunk(Chunk{3, 30, 40});
  ASSERT_TRUE(WriteMessage(fds_[0], task).ok());

  Message empty;
  empty.type = MessageType::kShutdown;
  ASSERT_TRUE(WriteMessage(fds_[0], empty).ok());

  absl::StatusOr<Message> received = ReadMessage(fds_[1]);
  ASSERT_TRUE(received.ok()) << received.status();
  EXPECT_EQ(received->type, MessageType::kTask);
  EXPECT_EQ(received->task_id, 17);
  absl::StatusOr<Chunk> chunk = DecodeChunk(received->payload);
  ASSERT_TRUE(chunk.ok());
  EXPECT_EQ(*chunk, (Chunk{3, 30, 40}));

  received = ReadMessage(fds_[1]);
  ASSERT_TRUE(received.ok());
  EXPECT_EQ(received->type, MessageType::kShutdown);
  EXPECT_TRUE(received->payload.empty());
}

TEST_F(WireTest, CleanCloseIsUnavailable) {
  CloseWriter();
  absl::StatusOr<Message> received = ReadMessage(fds_[1]);
  EXPECT_TRUE(absl::IsUnavailable(received.status()));
}

TEST_F(WireTest, TruncatedMessageIsDataLoss) {
  // Header of a result announcing 64 payload bytes, followed by only 10
  char header[13] = {static_cast<char>(MessageType::kResult)};
  const uint64_t size = 64;
  std::memcpy(header + 5, &size, sizeof(size));
  ASSERT_EQ(write(fds_[0], header, sizeof(header)), sizeof(header));
  const std::string partial(10, 'x');
  ASSERT_EQ(write(fds_[0], partial.data(), partial.size()), partial.size());
  CloseWriter();

  EXPECT_TRUE(absl::IsDataLoss(ReadMessage(fds_[1]).status()));
}

TEST_F(WireTest, TruncatedHeaderIsDataLoss) {
  const char partial[3] = {static_cast<char>(MessageType::kTask), 0, 0};
  ASSERT_EQ(write(fds_[0], partial, sizeof(partial)), sizeof(partial));
  CloseWriter();

  EXPECT_TRUE(absl::IsDataLoss(ReadMessage(fds_[1]).status()));
}

TEST_F(WireTest, UnknownTypeIsDataLoss) {
  char header[13] = {42};
  ASSERT_EQ(write(fds_[0], header, sizeof(header)), sizeof(header));
  EXPECT_TRUE(absl::IsDataLoss(ReadMessage(fds_[1]).status()));
}

TEST_F(WireTest, WriteToClosedPeerIsUnavailable) {
  close(fds_[1]);
  fds_[1] = -1;
  Message message;
  message.type = MessageType::kTask;
  message.payload = std::string(1 << 20, 'x');
  EXPECT_TRUE(absl::IsUnavailable(WriteMessage(fds_[0], message)));
}

TEST(PayloadTest, ResultSetKeepsNullAndEmptyColumns) {
  ResultSet result{EncodeColumn(std::vector<int>{1, 2, 3}), absl::nullopt,
                   std::string()};
  absl::StatusOr<ResultSet> decoded = DecodeResultSet(EncodeResultSet(result));
  ASSERT_TRUE(decoded.ok());
  ASSERT_EQ(decoded->size(), 3);
  EXPECT_EQ((*decoded)[0], result[0]);
  EXPECT_FALSE((*decoded)[1].has_value());
  ASSERT_TRUE((*decoded)[2].has_value());
  EXPECT_TRUE((*decoded)[2]->empty());
}

TEST(PayloadTest, MalformedResultSet) {
  std::string bytes = EncodeResultSet({std::string("abcdef")});
  EXPECT_TRUE(absl::IsDataLoss(
      DecodeResultSet(bytes.substr(0, bytes.size() - 1)).status()));
  EXPECT_TRUE(absl::IsDataLoss(DecodeResultSet(bytes + "z").status()));
  EXPECT_TRUE(absl::IsDataLoss(DecodeResultSet("").status()));
  EXPECT_TRUE(absl::IsDataLoss(DecodeChunk("short").status()));
}

TEST(PayloadTest, DecodeColumnAppends) {
  std::vector<double> values{0.5};
  ASSERT_TRUE(
      DecodeColumn(EncodeColumn(std::vector<double>{1.5, 2.5}), values).ok());
  EXPECT_EQ(values, std::vector<double>({0.5, 1.5, 2.5}));
  EXPECT_TRUE(absl::IsDataLoss(DecodeColumn("abc", values)));
}

}  // namespace test
}  // namespace parcel

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
