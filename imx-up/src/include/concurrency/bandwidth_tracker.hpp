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
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "concurrency/atomic_counter.hpp"

namespace imxup {
struct BandwidthOptions {
  std::chrono::milliseconds interval_{200};
  size_t                    window_size_ = 20;
  // Rising rates are followed faster than falling ones
  double                    alpha_up_    = 0.6;
  double                    alpha_down_  = 0.35;
};

struct BandwidthSnapshot {
  double   current_bps_ = 0.0;
  // Unsmoothed mean over the window
  double   average_bps_ = 0.0;
  double   peak_bps_    = 0.0;
  uint64_t total_bytes_ = 0;
  uint64_t ticks_       = 0;
};

/**
 * @brief Rolling average over the last window_size samples, followed by an asymmetric EMA.
 */
class RateSmoother {
 public:
  explicit RateSmoother(const BandwidthOptions& options);

  auto Push(double raw_rate) -> double;
  void Reset();

  auto Smoothed() const -> double { return smoothed_; }
  auto Average() const -> double {
    return samples_.empty() ? 0.0 : sample_sum_ / static_cast<double>(samples_.size());
  }
  auto Peak() const -> double { return peak_; }

 private:
  size_t             window_size_;
  double             alpha_up_;
  double             alpha_down_;
  std::deque<double> samples_;
  double             sample_sum_ = 0.0;
  double             smoothed_   = 0.0;
  double             peak_       = 0.0;
};

/**
 * @brief Samples one or more byte counters on a fixed interval and publishes a smoothed rate per
 * tick. Once Stop() returns no further tick is delivered.
 */
class BandwidthTracker {
 public:
  using TickCallback = std::function<void(const BandwidthSnapshot&)>;

  BandwidthTracker(std::vector<std::shared_ptr<AtomicCounter>> counters,
                   BandwidthOptions options = {}, TickCallback on_tick = nullptr);
  ~BandwidthTracker();

  BandwidthTracker(const BandwidthTracker&)            = delete;
  BandwidthTracker& operator=(const BandwidthTracker&) = delete;

  void Start();
  void Stop();
  auto IsRunning() const -> bool;

  /**
   * @brief Take one sample now. The background thread calls this once per interval; tests call
   * it directly with a synthetic elapsed time.
   */
  auto Sample(std::chrono::steady_clock::duration elapsed) -> BandwidthSnapshot;

  auto Snapshot() const -> BandwidthSnapshot;

 private:
  void                                        Run();
  auto                                        ReadTotal() const -> uint64_t;

  std::vector<std::shared_ptr<AtomicCounter>> counters_;
  BandwidthOptions                            options_;
  TickCallback                                on_tick_;

  mutable std::mutex                          state_mutex_;
  RateSmoother                                smoother_;
  uint64_t                                    last_total_ = 0;
  BandwidthSnapshot                           snapshot_;

  mutable std::mutex                          run_mutex_;
  std::condition_variable                     run_cv_;
  std::thread                                 thread_;
  bool                                        running_ = false;
  bool                                        stop_    = false;
};
};  // namespace imxup
