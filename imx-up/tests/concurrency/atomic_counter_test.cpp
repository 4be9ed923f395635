#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

#include "concurrency/atomic_counter.hpp"

namespace imxup {
TEST(ByteCountingSinkTest, AddsDeltasToEveryCounter) {
  auto             global  = std::make_shared<AtomicCounter>();
  auto             gallery = std::make_shared<AtomicCounter>();
  ByteCountingSink sink({global, gallery});

  sink.Update(100);
  sink.Update(250);
  sink.Update(250);
  EXPECT_EQ(global->Get(), 250u);
  EXPECT_EQ(gallery->Get(), 250u);
  EXPECT_EQ(sink.Reported(), 250u);
}

TEST(ByteCountingSinkTest, RestartedTransferCountsFromZero) {
  auto             global = std::make_shared<AtomicCounter>();
  ByteCountingSink sink({global});

  sink.Update(400);
  // Retry: the transport starts over
  sink.Update(100);
  EXPECT_EQ(global->Get(), 500u);

  sink.Restart();
  sink.Update(50);
  EXPECT_EQ(global->Get(), 550u);
}

TEST(AtomicCounterTest, ConcurrentAddsAreNotLost) {
  auto                     counter = std::make_shared<AtomicCounter>();
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([counter] {
      ByteCountingSink sink({counter});
      for (uint64_t sent = 1; sent <= 1000; ++sent) sink.Update(sent);
    });
  }
  for (auto& thread : threads) thread.join();
  EXPECT_EQ(counter->Get(), 8000u);

  counter->Reset();
  EXPECT_EQ(counter->Get(), 0u);
}
}  // namespace imxup
