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
// CREATE TABLE GalleryImage (gallery_path TEXT, file_name TEXT, size_bytes BIGINT, width INTEGER,
// height INTEGER, order_index INTEGER, uploaded BOOLEAN, remote_id TEXT, image_url TEXT,
// thumb_url TEXT);
struct GalleryImageMapperParams {
  std::string gallery_path;
  std::string file_name;
  int64_t     size_bytes;
  int32_t     width;
  int32_t     height;
  int32_t     order_index;
  bool        uploaded;
  std::string remote_id;
  std::string image_url;
  std::string thumb_url;
};

// Keyed by gallery: Remove(path) drops every image of that gallery
class GalleryImageMapper
    : public MapperInterface<GalleryImageMapper, GalleryImageMapperParams, gallery_key_t>,
      public FieldReflectable<GalleryImageMapper> {
 private:
  static constexpr uint32_t    _field_count      = 10;
  static constexpr const char* _table_name       = "GalleryImage";
  static constexpr const char* _prime_key_clause = "gallery_path = ?";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs = {
      KEY_FIELD(GalleryImageMapperParams, gallery_path, VARCHAR),
      KEY_FIELD(GalleryImageMapperParams, file_name, VARCHAR),
      FIELD(GalleryImageMapperParams, size_bytes, INT64),
      FIELD(GalleryImageMapperParams, width, INT32),
      FIELD(GalleryImageMapperParams, height, INT32),
      FIELD(GalleryImageMapperParams, order_index, INT32),
      FIELD(GalleryImageMapperParams, uploaded, BOOLEAN),
      FIELD(GalleryImageMapperParams, remote_id, VARCHAR),
      FIELD(GalleryImageMapperParams, image_url, VARCHAR),
      FIELD(GalleryImageMapperParams, thumb_url, VARCHAR)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> GalleryImageMapperParams;
  friend struct FieldReflectable<GalleryImageMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace imxup
