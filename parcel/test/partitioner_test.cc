#include "parcel/partitioner.h"

#include <gtest/gtest.h>

#include "parcel/error.h"

namespace parcel {
namespace test {

void ExpectExactCover(const std::vector<Chunk>& chunks, size_t length) {
  size_t next = 0;
  for (size_t i = 0; i < chunks.size(); i++) {
    EXPECT_EQ(chunks[i].index, i);
    EXPECT_EQ(chunks[i].begin, next);
    EXPECT_FALSE(chunks[i].empty());
    next = chunks[i].end;
  }
  EXPECT_EQ(next, length);
}

TEST(PartitionerTest, BySizeClipsLastChunk) {
  auto chunks = PartitionBySize(10, 4);
  ASSERT_TRUE(chunks.ok());
  ASSERT_EQ(chunks->size(), 3);
  EXPECT_EQ((*chunks)[0].begin, 0);
  EXPECT_EQ((*chunks)[0].end, 4);
  EXPECT_EQ((*chunks)[1].begin, 4);
  EXPECT_EQ((*chunks)[1].end, 8);
  EXPECT_EQ((*chunks)[2].begin, 8);
  EXPECT_EQ((*chunks)[2].end, 10);
}

TEST(PartitionerTest, BySizeCoversWorkload) {
  for (size_t length : {1, 7, 99, 100, 101, 1000}) {
    for (int chunk_size : {1, 3, 10, 100, 2000}) {
      auto chunks = PartitionBySize(length, chunk_size);
      ASSERT_TRUE(chunks.ok());
      EXPECT_EQ(chunks->size(), (length + chunk_size - 1) / chunk_size);
      ExpectExactCover(*chunks, length);
    }
  }
}

TEST(PartitionerTest, BySizeEmptyWorkload) {
  auto chunks = PartitionBySize(0, 5);
  ASSERT_TRUE(chunks.ok());
  EXPECT_TRUE(chunks->empty());
}

TEST(PartitionerTest, BySizeRejectsNonPositiveChunkSize) {
  EXPECT_TRUE(IsConfigurationError(PartitionBySize(10, 0).status()));
  EXPECT_TRUE(IsConfigurationError(PartitionBySize(10, -3).status()));
}

TEST(PartitionerTest, ByDeviceWithRemainder) {
  std::vector<Chunk> chunks = PartitionByDevice(10, 3);
  ASSERT_EQ(chunks.size(), 4);
  EXPECT_EQ(chunks[0].size(), 3);
  EXPECT_EQ(chunks[1].size(), 3);
  EXPECT_EQ(chunks[2].size(), 3);
  EXPECT_EQ(chunks[3].begin, 9);
  EXPECT_EQ(chunks[3].end, 10);
  ExpectExactCover(chunks, 10);
}

TEST(PartitionerTest, ByDeviceEvenSplit) {
  std::vector<Chunk> chunks = PartitionByDevice(8, 4);
  ASSERT_EQ(chunks.size(), 4);
  ExpectExactCover(chunks, 8);
}

TEST(PartitionerTest, ByDeviceRemainderLargerThanShare) {
  // 11 = 4 * 2 + 3
  std::vector<Chunk> chunks = PartitionByDevice(11, 4);
  ASSERT_EQ(chunks.size(), 5);
  EXPECT_EQ(chunks[4].begin, 8);
  EXPECT_EQ(chunks[4].end, 11);
  ExpectExactCover(chunks, 11);
}

TEST(PartitionerTest, ByDeviceSmallWorkload) {
  std::vector<Chunk> chunks = PartitionByDevice(3, 5);
  ASSERT_EQ(chunks.size(), 3);
  for (size_t i = 0; i < chunks.size(); i++) {
    EXPECT_EQ(chunks[i].size(), 1);
  }
  ExpectExactCover(chunks, 3);
}

TEST(PartitionerTest, ByDeviceSingleDevice) {
  for (int device_count : {-1, 0, 1}) {
    std::vector<Chunk> chunks = PartitionByDevice(42, device_count);
    ASSERT_EQ(chunks.size(), 1);
    EXPECT_EQ(chunks[0].begin, 0);
    EXPECT_EQ(chunks[0].end, 42);
  }
  EXPECT_TRUE(PartitionByDevice(0, 1).empty());
  EXPECT_TRUE(PartitionByDevice(0, 4).empty());
}

}  // namespace test
}  // namespace parcel

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
