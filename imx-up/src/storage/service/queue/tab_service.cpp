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

#include "storage/service/queue/tab_service.hpp"

#include <utility>

namespace imxup {
auto TabService::ToParams(const Tab& source) -> TabMapperParams {
  return {source.id_, source.name_, source.display_order_, source.is_default_,
          source.created_ts_};
}

auto TabService::FromParams(TabMapperParams&& param) -> Tab {
  return {param.id, std::move(param.name), param.display_order, param.is_default,
          param.created_ts};
}

auto TabService::GetAllOrdered() -> std::vector<Tab> {
  return GetByPredicate("TRUE", {}, "display_order, id");
}

auto TabService::GetByName(const std::string& name) -> std::optional<Tab> {
  auto rows = GetByPredicate("name = ?", {name});
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

auto TabService::MaxId() -> tab_id_t {
  return duckorm::query_int64(_conn, "SELECT MAX(id) FROM Tab;").value_or(0);
}
};  // namespace imxup
