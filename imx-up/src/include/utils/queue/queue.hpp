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
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>

namespace imxup {
/**
 * @brief A thread-safe blocking queue. With a capacity limit, push() drops the oldest element
 * instead of blocking the producer; upload workers must never stall on a slow consumer.
 */
template <typename T>
class ConcurrentBlockingQueue {
 public:
  explicit ConcurrentBlockingQueue() = default;

  explicit ConcurrentBlockingQueue(uint32_t max_size)
      : _max_size(max_size), _has_capacity_limit(max_size > 0) {}

  /**
   * @brief Enqueue an element
   *
   * @param new_request the element to enqueue
   * @return true if an older element had to be dropped to make room
   */
  bool push(T new_request) {
    bool dropped = false;
    {
      std::unique_lock<std::mutex> lock(mtx);
      if (_closed) return false;
      if (_has_capacity_limit && _queue.size() >= _max_size) {
        _queue.pop();
        ++_dropped;
        dropped = true;
      }
      _queue.push(std::move(new_request));
    }
    _consumer_cv.notify_one();
    return dropped;
  }

  /**
   * @brief Wait for an element. Returns nullopt once the queue is closed and drained.
   */
  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(mtx);
    _consumer_cv.wait(lock, [this] { return !_queue.empty() || _closed; });
    return take_front();
  }

  /**
   * @brief Wait at most timeout for an element.
   */
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mtx);
    _consumer_cv.wait_for(lock, timeout, [this] { return !_queue.empty() || _closed; });
    return take_front();
  }

  std::optional<T> try_pop() {
    std::unique_lock<std::mutex> lock(mtx);
    return take_front();
  }

  // Wake every waiting consumer; later pushes are ignored
  void close() {
    {
      std::unique_lock<std::mutex> lock(mtx);
      _closed = true;
    }
    _consumer_cv.notify_all();
  }

  size_t size() {
    std::unique_lock<std::mutex> lock(mtx);
    return _queue.size();
  }

  uint64_t dropped() {
    std::unique_lock<std::mutex> lock(mtx);
    return _dropped;
  }

 private:
  std::optional<T> take_front() {
    if (_queue.empty()) return std::nullopt;
    T front = std::move(_queue.front());
    _queue.pop();
    return front;
  }

  std::uint32_t           _max_size           = 0;
  bool                    _has_capacity_limit = false;
  bool                    _closed             = false;
  uint64_t                _dropped            = 0;
  std::queue<T>           _queue;
  std::mutex              mtx;
  std::condition_variable _consumer_cv;
};
};  // namespace imxup
