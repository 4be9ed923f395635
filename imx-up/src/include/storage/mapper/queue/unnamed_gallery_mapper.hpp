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

namespace imxup {
// CREATE TABLE UnnamedGallery (gallery_id TEXT PRIMARY KEY, intended_name TEXT,
// gallery_path TEXT, queued_ts BIGINT, attempts INTEGER);
struct UnnamedGalleryMapperParams {
  std::string gallery_id;
  std::string intended_name;
  std::string gallery_path;
  int64_t     queued_ts;
  int32_t     attempts;
};

class UnnamedGalleryMapper
    : public MapperInterface<UnnamedGalleryMapper, UnnamedGalleryMapperParams, std::string>,
      public FieldReflectable<UnnamedGalleryMapper> {
 private:
  static constexpr uint32_t    _field_count      = 5;
  static constexpr const char* _table_name       = "UnnamedGallery";
  static constexpr const char* _prime_key_clause = "gallery_id = ?";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs = {
      KEY_FIELD(UnnamedGalleryMapperParams, gallery_id, VARCHAR),
      FIELD(UnnamedGalleryMapperParams, intended_name, VARCHAR),
      FIELD(UnnamedGalleryMapperParams, gallery_path, VARCHAR),
      FIELD(UnnamedGalleryMapperParams, queued_ts, INT64),
      FIELD(UnnamedGalleryMapperParams, attempts, INT32)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> UnnamedGalleryMapperParams;
  friend struct FieldReflectable<UnnamedGalleryMapper>;
  using MapperInterface::MapperInterface;
};

// CREATE TABLE Setting (key TEXT PRIMARY KEY, value JSON);
struct SettingMapperParams {
  std::string key;
  std::string value;
};

class SettingMapper : public MapperInterface<SettingMapper, SettingMapperParams, std::string>,
                      public FieldReflectable<SettingMapper> {
 private:
  static constexpr uint32_t                                         _field_count      = 2;
  static constexpr const char*                                      _table_name       = "Setting";
  static constexpr const char*                                      _prime_key_clause = "key = ?";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      KEY_FIELD(SettingMapperParams, key, VARCHAR), FIELD(SettingMapperParams, value, JSON)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> SettingMapperParams;
  friend struct FieldReflectable<SettingMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace imxup
