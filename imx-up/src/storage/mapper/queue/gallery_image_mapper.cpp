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

#include "storage/mapper/queue/gallery_image_mapper.hpp"

#include <stdexcept>

namespace imxup {
using namespace duckutil;

auto GalleryImageMapper::FromRawData(std::vector<duckorm::VarTypes>&& data)
    -> GalleryImageMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for GalleryImage");
  }
  return {AsString(data[0]), AsString(data[1]), AsInt64(data[2]),  AsInt32(data[3]),
          AsInt32(data[4]),  AsInt32(data[5]),  AsBool(data[6]),   AsString(data[7]),
          AsString(data[8]), AsString(data[9])};
}
};  // namespace imxup
