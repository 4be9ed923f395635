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

#include "storage/mapper/queue/gallery_mapper.hpp"

#include <stdexcept>

namespace imxup {
using namespace duckutil;

auto GalleryMapper::FromRawData(std::vector<duckorm::VarTypes>&& data) -> GalleryMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for Gallery");
  }
  GalleryMapperParams params;
  params.path            = AsString(data[0]);
  params.name            = AsString(data[1]);
  params.status          = AsString(data[2]);
  params.tab_name        = AsString(data[3]);
  params.image_host_id   = AsString(data[4]);
  params.template_name   = AsString(data[5]);
  params.total_images    = AsInt32(data[6]);
  params.uploaded_images = AsInt32(data[7]);
  params.failed_images   = AsInt32(data[8]);
  params.total_size      = AsInt64(data[9]);
  params.uploaded_size   = AsInt64(data[10]);
  params.scan_complete   = AsBool(data[11]);
  params.insertion_order = AsInt64(data[12]);
  params.added_ts        = AsInt64(data[13]);
  params.finished_ts     = AsInt64(data[14]);
  params.gallery_id      = AsString(data[15]);
  params.gallery_url     = AsString(data[16]);
  params.error_message   = AsString(data[17]);
  params.failed_files    = AsString(data[18]);
  params.custom_fields   = AsString(data[19]);
  params.ext_fields      = AsString(data[20]);
  params.dimensions      = AsString(data[21]);
  return params;
}
};  // namespace imxup
