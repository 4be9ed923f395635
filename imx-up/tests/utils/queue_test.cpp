#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "utils/queue/queue.hpp"

namespace imxup {
TEST(ConcurrentBlockingQueueTest, FullQueueDropsOldest) {
  ConcurrentBlockingQueue<int> queue(3);
  EXPECT_FALSE(queue.push(1));
  EXPECT_FALSE(queue.push(2));
  EXPECT_FALSE(queue.push(3));
  EXPECT_TRUE(queue.push(4));

  EXPECT_EQ(queue.size(), 3u);
  EXPECT_EQ(queue.dropped(), 1u);
  EXPECT_EQ(queue.try_pop(), 2);
  EXPECT_EQ(queue.try_pop(), 3);
  EXPECT_EQ(queue.try_pop(), 4);
  EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(ConcurrentBlockingQueueTest, UnboundedQueueKeepsEverything) {
  ConcurrentBlockingQueue<int> queue;
  for (int i = 0; i < 5000; ++i) queue.push(i);
  EXPECT_EQ(queue.size(), 5000u);
  EXPECT_EQ(queue.dropped(), 0u);
}

TEST(ConcurrentBlockingQueueTest, PopWaitsForProducer) {
  ConcurrentBlockingQueue<int> queue;
  std::thread                  producer([&queue] {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    queue.push(42);
  });
  EXPECT_EQ(queue.pop(), 42);
  producer.join();

  EXPECT_FALSE(queue.pop_for(std::chrono::milliseconds(5)).has_value());
}

TEST(ConcurrentBlockingQueueTest, CloseDrainsThenStops) {
  ConcurrentBlockingQueue<int> queue;
  queue.push(1);
  queue.close();
  EXPECT_FALSE(queue.push(2));
  EXPECT_EQ(queue.pop(), 1);
  EXPECT_FALSE(queue.pop().has_value());
}
}  // namespace imxup
