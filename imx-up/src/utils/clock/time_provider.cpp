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

#include "utils/clock/time_provider.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace imxup {
std::atomic<std::chrono::system_clock::time_point> TimeProvider::_cached_sys_time;
std::atomic<std::chrono::steady_clock::time_point> TimeProvider::_cached_steady_time;
std::atomic<bool>                                  TimeProvider::_initialized{false};

void TimeProvider::Refresh() {
  _cached_sys_time    = std::chrono::system_clock::now();
  _cached_steady_time = std::chrono::steady_clock::now();
  _initialized        = true;
}

auto TimeProvider::Now() -> std::chrono::system_clock::time_point {
  if (!_initialized.load()) Refresh();
  auto elapsed = std::chrono::steady_clock::now() - _cached_steady_time.load();
  return _cached_sys_time.load() +
         std::chrono::duration_cast<std::chrono::system_clock::duration>(elapsed);
}

auto TimeProvider::NowUnix() -> int64_t { return ToUnix(Now()); }

auto TimeProvider::ToUnix(const std::chrono::system_clock::time_point& tp) -> int64_t {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

auto TimeProvider::FromUnix(int64_t seconds) -> std::chrono::system_clock::time_point {
  return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
}

auto TimeProvider::TimePointToString(const std::chrono::system_clock::time_point& tp)
    -> std::string {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm     tm{};
  localtime_r(&t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}
}  // namespace imxup
