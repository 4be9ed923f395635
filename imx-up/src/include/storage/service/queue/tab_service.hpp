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

#include <duckdb.h>

#include <optional>
#include <string>
#include <vector>

#include "queue/gallery_item.hpp"
#include "storage/mapper/queue/tab_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace imxup {
class TabService
    : public ServiceInterface<TabService, Tab, TabMapperParams, TabMapper, tab_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const Tab& source) -> TabMapperParams;
  static auto FromParams(TabMapperParams&& param) -> Tab;

  auto        GetAllOrdered() -> std::vector<Tab>;
  auto        GetByName(const std::string& name) -> std::optional<Tab>;
  auto        MaxId() -> tab_id_t;
};
};  // namespace imxup
