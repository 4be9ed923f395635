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

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace imxup {
/**
 * @brief Byte accumulator shared by upload workers. One instance lives for the whole process,
 * another one per gallery (reset when the gallery starts).
 */
class AtomicCounter {
 public:
  void Add(uint64_t n) noexcept { value_.fetch_add(n, std::memory_order_relaxed); }
  auto Get() const noexcept -> uint64_t { return value_.load(std::memory_order_relaxed); }
  void Reset() noexcept { value_.store(0, std::memory_order_relaxed); }

 private:
  std::atomic<uint64_t> value_{0};
};

/**
 * @brief Turns the cumulative "bytes sent so far" reported by one transfer into deltas, and
 * adds each delta to every attached counter. A transfer that restarts (retry) reports a smaller
 * value than before; the next delta is then measured from zero.
 */
class ByteCountingSink {
 public:
  explicit ByteCountingSink(std::vector<std::shared_ptr<AtomicCounter>> counters);

  void Update(uint64_t uploaded_so_far);
  void Restart() { last_ = 0; }
  auto Reported() const -> uint64_t { return reported_; }

 private:
  std::vector<std::shared_ptr<AtomicCounter>> counters_;
  uint64_t                                    last_     = 0;
  uint64_t                                    reported_ = 0;
};
};  // namespace imxup
