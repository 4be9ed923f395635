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


#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "concurrency/bandwidth_tracker.hpp"
#include "queue/gallery_item.hpp"
#include "queue/host_upload.hpp"
#include "type/type.hpp"
#include "utils/queue/queue.hpp"

namespace imxup {
struct GalleryStarted {
  gallery_key_t path_;
  std::string   name_;
  uint32_t      total_images_ = 0;
};

struct ProgressUpdated {
  gallery_key_t path_;
  uint32_t      completed_ = 0;
  uint32_t      total_     = 0;
  uint32_t      percent_   = 0;
  std::string   current_file_;
};

struct ImageUploaded {
  gallery_key_t path_;
  std::string   file_name_;
  std::string   image_url_;
  uint64_t      size_bytes_ = 0;
};

struct GalleryCompleted {
  gallery_key_t path_;
  std::string   gallery_url_;
  uint32_t      successful_ = 0;
  uint32_t      failed_     = 0;
  // Completed with failures ends up incomplete
  GalleryStatus status_     = GalleryStatus::COMPLETED;
};

struct GalleryFailed {
  gallery_key_t path_;
  std::string   reason_;
};

struct GalleryPaused {
  gallery_key_t path_;
  uint32_t      uploaded_ = 0;
  uint32_t      total_    = 0;
};

struct BandwidthUpdated {
  BandwidthSnapshot snapshot_;
};

struct QueueStatsChanged {
  QueueStats stats_;
};

struct HostUploadChanged {
  HostUploadRecord record_;
};

using Event = std::variant<GalleryStarted, ProgressUpdated, ImageUploaded, GalleryCompleted,
                           GalleryFailed, GalleryPaused, BandwidthUpdated, QueueStatsChanged,
                           HostUploadChanged>;

auto EventName(const Event& event) -> const char*;

/**
 * @brief One consumer's view of the bus. Events wait in a bounded queue; when the consumer
 * falls behind the oldest event is dropped.
 */
class EventSubscription {
 public:
  explicit EventSubscription(uint32_t capacity) : queue_(capacity) {}

  auto Next(std::chrono::milliseconds timeout) -> std::optional<Event> {
    return queue_.pop_for(timeout);
  }
  auto TryNext() -> std::optional<Event> { return queue_.try_pop(); }
  auto Pending() -> size_t { return queue_.size(); }
  auto Dropped() -> uint64_t { return queue_.dropped(); }

 private:
  friend class EventBus;
  ConcurrentBlockingQueue<Event> queue_;
};

/**
 * @brief Typed publish/subscribe channel between the worker threads and whoever displays their
 * state. Publish never blocks on a consumer.
 */
class EventBus {
 public:
  explicit EventBus(uint32_t default_capacity = 1024);

  auto Subscribe(std::optional<uint32_t> capacity = std::nullopt)
      -> std::shared_ptr<EventSubscription>;
  void Unsubscribe(const std::shared_ptr<EventSubscription>& subscription);

  void Publish(const Event& event);

  auto SubscriberCount() -> size_t;

  // Wake every subscriber; nothing is delivered afterwards
  void Close();

 private:
  uint32_t                                        default_capacity_;
  std::mutex                                      mtx_;
  bool                                            closed_ = false;
  std::vector<std::weak_ptr<EventSubscription>>   subscribers_;
};
};  // namespace imxup
