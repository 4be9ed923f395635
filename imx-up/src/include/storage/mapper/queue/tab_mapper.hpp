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

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"
#include "type/type.hpp"

namespace imxup {
// CREATE TABLE Tab (id BIGINT PRIMARY KEY, name TEXT UNIQUE, display_order INTEGER,
// is_default BOOLEAN, created_ts BIGINT);
struct TabMapperParams {
  int64_t     id;
  std::string name;
  int32_t     display_order;
  bool        is_default;
  int64_t     created_ts;
};

class TabMapper : public MapperInterface<TabMapper, TabMapperParams, tab_id_t>,
                  public FieldReflectable<TabMapper> {
 private:
  static constexpr uint32_t                                         _field_count      = 5;
  static constexpr const char*                                      _table_name       = "Tab";
  static constexpr const char*                                      _prime_key_clause = "id = ?";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      KEY_FIELD(TabMapperParams, id, INT64), FIELD(TabMapperParams, name, VARCHAR),
      FIELD(TabMapperParams, display_order, INT32), FIELD(TabMapperParams, is_default, BOOLEAN),
      FIELD(TabMapperParams, created_ts, INT64)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> TabMapperParams;
  friend struct FieldReflectable<TabMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace imxup
