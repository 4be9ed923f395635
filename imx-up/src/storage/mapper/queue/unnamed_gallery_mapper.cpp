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

#include "storage/mapper/queue/unnamed_gallery_mapper.hpp"

#include <stdexcept>

namespace imxup {
using namespace duckutil;

auto UnnamedGalleryMapper::FromRawData(std::vector<duckorm::VarTypes>&& data)
    -> UnnamedGalleryMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for UnnamedGallery");
  }
  return {AsString(data[0]), AsString(data[1]), AsString(data[2]), AsInt64(data[3]),
          AsInt32(data[4])};
}

auto SettingMapper::FromRawData(std::vector<duckorm::VarTypes>&& data) -> SettingMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for Setting");
  }
  return {AsString(data[0]), AsString(data[1])};
}
};  // namespace imxup
