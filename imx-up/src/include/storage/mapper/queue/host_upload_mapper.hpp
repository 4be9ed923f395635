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
// CREATE TABLE FileHostUpload (id BIGINT PRIMARY KEY, gallery_path TEXT, host_name TEXT,
// status TEXT, uploaded_bytes BIGINT, total_bytes BIGINT, download_url TEXT, file_id TEXT,
// orphaned_file_id TEXT, error_message TEXT, retry_count INTEGER, created_ts BIGINT,
// started_ts BIGINT, finished_ts BIGINT);
struct HostUploadMapperParams {
  int64_t     id;
  std::string gallery_path;
  std::string host_name;
  std::string status;
  int64_t     uploaded_bytes;
  int64_t     total_bytes;
  std::string download_url;
  std::string file_id;
  std::string orphaned_file_id;
  std::string error_message;
  int32_t     retry_count;
  int64_t     created_ts;
  int64_t     started_ts;
  int64_t     finished_ts;
};

class HostUploadMapper
    : public MapperInterface<HostUploadMapper, HostUploadMapperParams, host_upload_id_t>,
      public FieldReflectable<HostUploadMapper> {
 private:
  static constexpr uint32_t    _field_count      = 14;
  static constexpr const char* _table_name       = "FileHostUpload";
  static constexpr const char* _prime_key_clause = "id = ?";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs = {
      KEY_FIELD(HostUploadMapperParams, id, INT64),
      FIELD(HostUploadMapperParams, gallery_path, VARCHAR),
      FIELD(HostUploadMapperParams, host_name, VARCHAR),
      FIELD(HostUploadMapperParams, status, VARCHAR),
      FIELD(HostUploadMapperParams, uploaded_bytes, INT64),
      FIELD(HostUploadMapperParams, total_bytes, INT64),
      FIELD(HostUploadMapperParams, download_url, VARCHAR),
      FIELD(HostUploadMapperParams, file_id, VARCHAR),
      FIELD(HostUploadMapperParams, orphaned_file_id, VARCHAR),
      FIELD(HostUploadMapperParams, error_message, VARCHAR),
      FIELD(HostUploadMapperParams, retry_count, INT32),
      FIELD(HostUploadMapperParams, created_ts, INT64),
      FIELD(HostUploadMapperParams, started_ts, INT64),
      FIELD(HostUploadMapperParams, finished_ts, INT64)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> HostUploadMapperParams;
  friend struct FieldReflectable<HostUploadMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace imxup
