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

#include "storage/mapper/mapper_interface.hpp"

#include <stdexcept>
#include <type_traits>
#include <variant>

namespace imxup {
namespace duckutil {
auto AsString(duckorm::VarTypes& cell) -> std::string {
  if (auto value = std::get_if<std::string>(&cell)) return std::move(*value);
  if (std::holds_alternative<std::monostate>(cell)) return {};
  throw std::runtime_error("Encounting unmatching types when parsing the data from the DB");
}

auto AsInt64(const duckorm::VarTypes& cell) -> int64_t {
  return std::visit(
      [](const auto& v) -> int64_t {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::monostate>) {
          return 0;
        } else if constexpr (std::is_same_v<V, std::string>) {
          throw std::runtime_error("Encounting unmatching types when parsing the data from the DB");
        } else {
          return static_cast<int64_t>(v);
        }
      },
      cell);
}

auto AsInt32(const duckorm::VarTypes& cell) -> int32_t {
  return static_cast<int32_t>(AsInt64(cell));
}

auto AsBool(const duckorm::VarTypes& cell) -> bool { return AsInt64(cell) != 0; }
};  // namespace duckutil
};  // namespace imxup
