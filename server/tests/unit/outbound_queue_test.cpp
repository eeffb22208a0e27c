#include <gtest/gtest.h>

#include "arena/outbound_queue.hpp"

TEST(OutboundQueueTest, DropsOldestNormalFrameWhenFull) {
  arena::OutboundQueue queue(3, 2);
  for (arena::Tick tick = 1; tick <= 5; ++tick) {
    auto result = queue.Push(tick, arena::FrameKind::kDelta, arena::FrameClass::kNormal, "d");
    EXPECT_EQ(result, tick <= 3 ? arena::PushResult::kQueued : arena::PushResult::kDroppedOldest);
    EXPECT_LE(queue.Size(), queue.Capacity() + queue.CriticalSize());
  }
  EXPECT_EQ(queue.Dropped(), 2u);
  auto first = queue.Pop();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->tick, 3u);
}

TEST(OutboundQueueTest, CriticalFramesAreNeverDropped) {
  arena::OutboundQueue queue(1, 2);
  EXPECT_EQ(queue.Push(1, arena::FrameKind::kNotice, arena::FrameClass::kCritical, "n1"), arena::PushResult::kQueued);
  EXPECT_EQ(queue.Push(2, arena::FrameKind::kDelta, arena::FrameClass::kNormal, "d2"), arena::PushResult::kQueued);
  EXPECT_EQ(queue.Push(3, arena::FrameKind::kDelta, arena::FrameClass::kNormal, "d3"),
            arena::PushResult::kDroppedOldest);
  EXPECT_EQ(queue.Push(4, arena::FrameKind::kLeaderboard, arena::FrameClass::kCritical, "l4"),
            arena::PushResult::kQueued);
  EXPECT_EQ(queue.Push(5, arena::FrameKind::kNotice, arena::FrameClass::kCritical, "n5"),
            arena::PushResult::kCriticalOverflow);
  EXPECT_EQ(queue.CriticalSize(), 2u);
}

TEST(OutboundQueueTest, PopsInEnqueueOrderAcrossChannels) {
  arena::OutboundQueue queue(8, 8);
  queue.Push(1, arena::FrameKind::kFullSnapshot, arena::FrameClass::kNormal, "a");
  queue.Push(1, arena::FrameKind::kNotice, arena::FrameClass::kCritical, "b");
  queue.Push(2, arena::FrameKind::kDelta, arena::FrameClass::kNormal, "c");
  queue.Push(2, arena::FrameKind::kLeaderboard, arena::FrameClass::kCritical, "d");
  std::string order;
  while (auto frame = queue.Pop()) {
    order += frame->bytes;
  }
  EXPECT_EQ(order, "abcd");
  EXPECT_TRUE(queue.Empty());
}

TEST(OutboundQueueTest, CloseKeepsCriticalFramesAndRejectsNewOnes) {
  arena::OutboundQueue queue(8, 8);
  queue.Push(1, arena::FrameKind::kDelta, arena::FrameClass::kNormal, "d");
  queue.Push(1, arena::FrameKind::kNotice, arena::FrameClass::kCritical, "bye");
  queue.Close();
  EXPECT_TRUE(queue.Closed());
  EXPECT_EQ(queue.Push(2, arena::FrameKind::kDelta, arena::FrameClass::kNormal, "x"), arena::PushResult::kClosed);
  auto frame = queue.Pop();
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->bytes, "bye");
  EXPECT_FALSE(queue.Pop().has_value());
}
