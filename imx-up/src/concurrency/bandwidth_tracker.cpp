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

#include "concurrency/bandwidth_tracker.hpp"

#include <algorithm>

#include "utils/log/logger.hpp"

namespace imxup {
RateSmoother::RateSmoother(const BandwidthOptions& options)
    : window_size_(std::max<size_t>(options.window_size_, 1)),
      alpha_up_(std::clamp(options.alpha_up_, 0.0, 1.0)),
      alpha_down_(std::clamp(options.alpha_down_, 0.0, 1.0)) {}

auto RateSmoother::Push(double raw_rate) -> double {
  samples_.push_back(raw_rate);
  sample_sum_ += raw_rate;
  if (samples_.size() > window_size_) {
    sample_sum_ -= samples_.front();
    samples_.pop_front();
  }
  double rolling_avg = sample_sum_ / static_cast<double>(samples_.size());
  double alpha       = rolling_avg > smoothed_ ? alpha_up_ : alpha_down_;
  smoothed_          = alpha * rolling_avg + (1.0 - alpha) * smoothed_;
  peak_              = std::max(peak_, smoothed_);
  return smoothed_;
}

void RateSmoother::Reset() {
  samples_.clear();
  sample_sum_ = 0.0;
  smoothed_   = 0.0;
}

BandwidthTracker::BandwidthTracker(std::vector<std::shared_ptr<AtomicCounter>> counters,
                                   BandwidthOptions options, TickCallback on_tick)
    : counters_(std::move(counters)),
      options_(options),
      on_tick_(std::move(on_tick)),
      smoother_(options) {
  last_total_ = ReadTotal();
}

BandwidthTracker::~BandwidthTracker() { Stop(); }

void BandwidthTracker::Start() {
  std::lock_guard<std::mutex> lock(run_mutex_);
  if (running_) return;
  stop_    = false;
  running_ = true;
  {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    last_total_ = ReadTotal();
  }
  thread_ = std::thread(&BandwidthTracker::Run, this);
}

void BandwidthTracker::Stop() {
  {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (!running_) return;
    stop_ = true;
  }
  run_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  std::lock_guard<std::mutex> lock(run_mutex_);
  running_ = false;
}

auto BandwidthTracker::IsRunning() const -> bool {
  std::lock_guard<std::mutex> lock(run_mutex_);
  return running_;
}

auto BandwidthTracker::ReadTotal() const -> uint64_t {
  uint64_t total = 0;
  for (const auto& counter : counters_) {
    if (counter) total += counter->Get();
  }
  return total;
}

auto BandwidthTracker::Sample(std::chrono::steady_clock::duration elapsed) -> BandwidthSnapshot {
  std::lock_guard<std::mutex> lock(state_mutex_);
  uint64_t                    total = ReadTotal();
  // A per-gallery counter may have been reset since the last tick
  uint64_t                    delta = total >= last_total_ ? total - last_total_ : total;
  last_total_                       = total;

  double seconds = std::chrono::duration<double>(elapsed).count();
  double raw     = seconds > 0.0 ? static_cast<double>(delta) / seconds : 0.0;

  snapshot_.current_bps_ = smoother_.Push(raw);
  snapshot_.average_bps_ = smoother_.Average();
  snapshot_.peak_bps_    = smoother_.Peak();
  snapshot_.total_bytes_ = total;
  ++snapshot_.ticks_;
  return snapshot_;
}

auto BandwidthTracker::Snapshot() const -> BandwidthSnapshot {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return snapshot_;
}

void BandwidthTracker::Run() {
  auto last_tick = std::chrono::steady_clock::now();
  while (true) {
    {
      std::unique_lock<std::mutex> lock(run_mutex_);
      if (run_cv_.wait_for(lock, options_.interval_, [this] { return stop_; })) return;
    }
    auto now      = std::chrono::steady_clock::now();
    auto snapshot = Sample(now - last_tick);
    last_tick     = now;
    if (on_tick_) {
      try {
        on_tick_(snapshot);
      } catch (const std::exception& e) {
        Logger::Get(LogCategory::BANDWIDTH)->warn("Bandwidth tick handler failed: {}", e.what());
      }
    }
  }
}
};  // namespace imxup
