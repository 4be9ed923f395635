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

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace imxup {
/**
 * @brief Fixed-size worker pool. Tasks run in submission order, at most thread_count at a time.
 * Destruction drains the queue before joining.
 */
class ThreadPool {
 public:
  explicit ThreadPool(size_t thread_count);
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  void Submit(std::function<void()> task);

  /**
   * @brief Block until the queue is empty and no task is running.
   */
  void WaitIdle();

  auto ThreadCount() const -> size_t { return workers.size(); }

 private:
  std::queue<std::function<void()>> tasks;
  std::mutex                        mtx;
  std::condition_variable           condition;
  std::condition_variable           idle_condition;
  std::vector<std::thread>          workers;

  size_t                            active = 0;
  bool                              stop;

  void                              WorkerThread();
};
};  // namespace imxup
