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

#include "storage/mapper/queue/host_upload_mapper.hpp"

#include <stdexcept>

namespace imxup {
using namespace duckutil;

auto HostUploadMapper::FromRawData(std::vector<duckorm::VarTypes>&& data)
    -> HostUploadMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for FileHostUpload");
  }
  HostUploadMapperParams params;
  params.id               = AsInt64(data[0]);
  params.gallery_path     = AsString(data[1]);
  params.host_name        = AsString(data[2]);
  params.status           = AsString(data[3]);
  params.uploaded_bytes   = AsInt64(data[4]);
  params.total_bytes      = AsInt64(data[5]);
  params.download_url     = AsString(data[6]);
  params.file_id          = AsString(data[7]);
  params.orphaned_file_id = AsString(data[8]);
  params.error_message    = AsString(data[9]);
  params.retry_count      = AsInt32(data[10]);
  params.created_ts       = AsInt64(data[11]);
  params.started_ts       = AsInt64(data[12]);
  params.finished_ts      = AsInt64(data[13]);
  return params;
}
};  // namespace imxup
