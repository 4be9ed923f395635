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

namespace imxup {
/**
 * @brief Cooperative stop flag handed to every long-running call. It is checked at suspension
 * points only (between transfer chunks, between images), never used to kill a socket.
 */
class CancellationToken {
 public:
  void Cancel() noexcept { canceled_.store(true, std::memory_order_release); }
  void Reset() noexcept { canceled_.store(false, std::memory_order_release); }
  auto IsCancelled() const noexcept -> bool { return canceled_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> canceled_{false};
};

inline auto IsCancelled(const CancellationToken* token) -> bool {
  return token != nullptr && token->IsCancelled();
}
};  // namespace imxup
