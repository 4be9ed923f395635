#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <variant>

#include "app/event_bus.hpp"

namespace imxup {
TEST(EventBusTest, EverySubscriberGetsEveryEvent) {
  EventBus bus;
  auto     first  = bus.Subscribe();
  auto     second = bus.Subscribe();

  bus.Publish(GalleryStarted{"/g/a", "a", 3});
  bus.Publish(GalleryFailed{"/g/a", "boom"});

  for (const auto& subscription : {first, second}) {
    auto started = subscription->TryNext();
    ASSERT_TRUE(started.has_value());
    ASSERT_TRUE(std::holds_alternative<GalleryStarted>(*started));
    EXPECT_EQ(std::get<GalleryStarted>(*started).total_images_, 3u);

    auto failed = subscription->TryNext();
    ASSERT_TRUE(failed.has_value());
    EXPECT_STREQ(EventName(*failed), "GalleryFailed");
    EXPECT_FALSE(subscription->TryNext().has_value());
  }
}

TEST(EventBusTest, SlowSubscriberLosesOldestEvents) {
  EventBus bus;
  auto     slow = bus.Subscribe(2);

  for (uint32_t i = 1; i <= 5; ++i) bus.Publish(ProgressUpdated{"/g/a", i, 5, i * 20, {}});

  EXPECT_EQ(slow->Pending(), 2u);
  EXPECT_EQ(slow->Dropped(), 3u);
  auto next = slow->TryNext();
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(std::get<ProgressUpdated>(*next).completed_, 4u);
}

TEST(EventBusTest, DroppedSubscriptionsAreForgotten) {
  EventBus bus;
  auto     kept = bus.Subscribe();
  {
    auto temporary = bus.Subscribe();
    EXPECT_EQ(bus.SubscriberCount(), 2u);
  }
  bus.Publish(GalleryPaused{"/g/a", 1, 2});
  EXPECT_EQ(bus.SubscriberCount(), 1u);

  bus.Unsubscribe(kept);
  EXPECT_EQ(bus.SubscriberCount(), 0u);
}

TEST(EventBusTest, CloseWakesWaitingConsumer) {
  EventBus    bus;
  auto        subscription = bus.Subscribe();
  std::thread consumer([&] {
    auto event = subscription->Next(std::chrono::seconds(10));
    EXPECT_FALSE(event.has_value());
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  auto started = std::chrono::steady_clock::now();
  bus.Close();
  consumer.join();
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));

  bus.Publish(GalleryFailed{"/g/a", "late"});
  EXPECT_FALSE(subscription->TryNext().has_value());
  EXPECT_FALSE(bus.Subscribe()->TryNext().has_value());
}

TEST(EventBusTest, EventNamesCoverEveryEvent) {
  EXPECT_STREQ(EventName(Event{ImageUploaded{}}), "ImageUploaded");
  EXPECT_STREQ(EventName(Event{GalleryCompleted{}}), "GalleryCompleted");
  EXPECT_STREQ(EventName(Event{BandwidthUpdated{}}), "BandwidthUpdated");
  EXPECT_STREQ(EventName(Event{QueueStatsChanged{}}), "QueueStatsChanged");
  EXPECT_STREQ(EventName(Event{HostUploadChanged{}}), "HostUploadChanged");
}
}  // namespace imxup
