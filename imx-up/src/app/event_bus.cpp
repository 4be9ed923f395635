//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.


#include "app/event_bus.hpp"

#include <algorithm>

#include "utils/log/logger.hpp"

namespace imxup {
namespace {
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
}  // namespace

auto EventName(const Event& event) -> const char* {
  return std::visit(Overloaded{
                        [](const GalleryStarted&) { return "GalleryStarted"; },
                        [](const ProgressUpdated&) { return "ProgressUpdated"; },
                        [](const ImageUploaded&) { return "ImageUploaded"; },
                        [](const GalleryCompleted&) { return "GalleryCompleted"; },
                        [](const GalleryFailed&) { return "GalleryFailed"; },
                        [](const GalleryPaused&) { return "GalleryPaused"; },
                        [](const BandwidthUpdated&) { return "BandwidthUpdated"; },
                        [](const QueueStatsChanged&) { return "QueueStatsChanged"; },
                        [](const HostUploadChanged&) { return "HostUploadChanged"; },
                    },
                    event);
}

EventBus::EventBus(uint32_t default_capacity)
    : default_capacity_(std::max<uint32_t>(default_capacity, 1)) {}

auto EventBus::Subscribe(std::optional<uint32_t> capacity) -> std::shared_ptr<EventSubscription> {
  auto subscription =
      std::make_shared<EventSubscription>(std::max<uint32_t>(capacity.value_or(default_capacity_), 1));
  std::lock_guard<std::mutex> lock(mtx_);
  if (closed_) {
    subscription->queue_.close();
  } else {
    subscribers_.push_back(subscription);
  }
  return subscription;
}

void EventBus::Unsubscribe(const std::shared_ptr<EventSubscription>& subscription) {
  if (!subscription) return;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    std::erase_if(subscribers_, [&subscription](const auto& weak) {
      auto locked = weak.lock();
      return !locked || locked == subscription;
    });
  }
  subscription->queue_.close();
}

/**
 * @brief Deliver event to every live subscriber. Subscriptions whose owner went away are
 * forgotten here.
 */
void EventBus::Publish(const Event& event) {
  std::vector<std::shared_ptr<EventSubscription>> targets;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) return;
    std::erase_if(subscribers_, [&targets](const auto& weak) {
      auto locked = weak.lock();
      if (!locked) return true;
      targets.push_back(std::move(locked));
      return false;
    });
  }
  for (const auto& target : targets) {
    if (target->queue_.push(event)) {
      Logger::Get(LogCategory::APP)->trace("Subscriber full, dropped oldest event before {}",
                                           EventName(event));
    }
  }
}

auto EventBus::SubscriberCount() -> size_t {
  std::lock_guard<std::mutex> lock(mtx_);
  std::erase_if(subscribers_, [](const auto& weak) { return weak.expired(); });
  return subscribers_.size();
}

void EventBus::Close() {
  std::vector<std::weak_ptr<EventSubscription>> subscribers;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
    subscribers.swap(subscribers_);
  }
  for (const auto& weak : subscribers) {
    if (auto subscription = weak.lock()) subscription->queue_.close();
  }
}
};  // namespace imxup
