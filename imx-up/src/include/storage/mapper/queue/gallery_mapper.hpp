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
// CREATE TABLE Gallery (path TEXT PRIMARY KEY, name TEXT, status TEXT, tab_name TEXT,
// image_host_id TEXT, template_name TEXT, total_images INTEGER, uploaded_images INTEGER,
// failed_images INTEGER, total_size BIGINT, uploaded_size BIGINT, scan_complete BOOLEAN,
// insertion_order BIGINT, added_ts BIGINT, finished_ts BIGINT, gallery_id TEXT,
// gallery_url TEXT, error_message TEXT, failed_files JSON, custom_fields JSON, ext_fields JSON,
// dimensions JSON);
struct GalleryMapperParams {
  std::string path;
  std::string name;
  std::string status;
  std::string tab_name;
  std::string image_host_id;
  std::string template_name;
  int32_t     total_images;
  int32_t     uploaded_images;
  int32_t     failed_images;
  int64_t     total_size;
  int64_t     uploaded_size;
  bool        scan_complete;
  int64_t     insertion_order;
  int64_t     added_ts;
  int64_t     finished_ts;
  std::string gallery_id;
  std::string gallery_url;
  std::string error_message;
  std::string failed_files;
  std::string custom_fields;
  std::string ext_fields;
  std::string dimensions;
};

class GalleryMapper : public MapperInterface<GalleryMapper, GalleryMapperParams, gallery_key_t>,
                      public FieldReflectable<GalleryMapper> {
 private:
  static constexpr uint32_t    _field_count      = 22;
  static constexpr const char* _table_name       = "Gallery";
  static constexpr const char* _prime_key_clause = "path = ?";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs = {
      KEY_FIELD(GalleryMapperParams, path, VARCHAR),
      FIELD(GalleryMapperParams, name, VARCHAR),
      FIELD(GalleryMapperParams, status, VARCHAR),
      FIELD(GalleryMapperParams, tab_name, VARCHAR),
      FIELD(GalleryMapperParams, image_host_id, VARCHAR),
      FIELD(GalleryMapperParams, template_name, VARCHAR),
      FIELD(GalleryMapperParams, total_images, INT32),
      FIELD(GalleryMapperParams, uploaded_images, INT32),
      FIELD(GalleryMapperParams, failed_images, INT32),
      FIELD(GalleryMapperParams, total_size, INT64),
      FIELD(GalleryMapperParams, uploaded_size, INT64),
      FIELD(GalleryMapperParams, scan_complete, BOOLEAN),
      FIELD(GalleryMapperParams, insertion_order, INT64),
      FIELD(GalleryMapperParams, added_ts, INT64),
      FIELD(GalleryMapperParams, finished_ts, INT64),
      FIELD(GalleryMapperParams, gallery_id, VARCHAR),
      FIELD(GalleryMapperParams, gallery_url, VARCHAR),
      FIELD(GalleryMapperParams, error_message, VARCHAR),
      FIELD(GalleryMapperParams, failed_files, JSON),
      FIELD(GalleryMapperParams, custom_fields, JSON),
      FIELD(GalleryMapperParams, ext_fields, JSON),
      FIELD(GalleryMapperParams, dimensions, JSON)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> GalleryMapperParams;
  friend struct FieldReflectable<GalleryMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace imxup
