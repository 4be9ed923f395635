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

#include "concurrency/atomic_counter.hpp"

namespace imxup {
ByteCountingSink::ByteCountingSink(std::vector<std::shared_ptr<AtomicCounter>> counters)
    : counters_(std::move(counters)) {}

void ByteCountingSink::Update(uint64_t uploaded_so_far) {
  if (uploaded_so_far < last_) {
    last_ = 0;
  }
  uint64_t delta = uploaded_so_far - last_;
  last_          = uploaded_so_far;
  if (delta == 0) return;

  reported_ += delta;
  for (auto& counter : counters_) {
    if (counter) counter->Add(delta);
  }
}
};  // namespace imxup
