/**
 * @file ring_buffer_test.cpp
 * @brief Unit tests for RingBuffer
 */

#include "utils/ring_buffer.h"

#include <gtest/gtest.h>

#include <vector>

namespace semcache::utils {

TEST(RingBufferTest, KeepsInsertionOrderBeforeWrap) {
  RingBuffer<int> buffer(4);
  buffer.Push(1);
  buffer.Push(2);
  buffer.Push(3);

  EXPECT_EQ(buffer.Size(), 3U);
  EXPECT_EQ(buffer.Capacity(), 4U);
  EXPECT_EQ(buffer.GetAll(), (std::vector<int>{1, 2, 3}));
}

TEST(RingBufferTest, OverwritesOldestWhenFull) {
  RingBuffer<int> buffer(3);
  for (int i = 1; i <= 7; ++i) {
    buffer.Push(i);
  }
  EXPECT_EQ(buffer.Size(), 3U);
  EXPECT_EQ(buffer.GetAll(), (std::vector<int>{5, 6, 7}));
}

TEST(RingBufferTest, ClearEmptiesBuffer) {
  RingBuffer<int> buffer(2);
  buffer.Push(1);
  buffer.Push(2);
  buffer.Clear();
  EXPECT_EQ(buffer.Size(), 0U);
  EXPECT_TRUE(buffer.GetAll().empty());

  buffer.Push(9);
  EXPECT_EQ(buffer.GetAll(), (std::vector<int>{9}));
}

TEST(RingBufferTest, ZeroCapacityDiscardsEverything) {
  RingBuffer<int> buffer(0);
  buffer.Push(1);
  EXPECT_EQ(buffer.Size(), 0U);
  EXPECT_TRUE(buffer.GetAll().empty());
}

}  // namespace semcache::utils
