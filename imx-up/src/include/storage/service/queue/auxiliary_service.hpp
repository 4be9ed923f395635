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
#include <utility>
#include <vector>

#include "queue/gallery_item.hpp"
#include "storage/mapper/queue/unnamed_gallery_mapper.hpp"
#include "storage/service/service_interface.hpp"

namespace imxup {
class UnnamedGalleryService
    : public ServiceInterface<UnnamedGalleryService, UnnamedGallery, UnnamedGalleryMapperParams,
                              UnnamedGalleryMapper, std::string> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const UnnamedGallery& source) -> UnnamedGalleryMapperParams;
  static auto FromParams(UnnamedGalleryMapperParams&& param) -> UnnamedGallery;

  auto        GetAllOrdered() -> std::vector<UnnamedGallery>;
};

using Setting = std::pair<std::string, std::string>;

class SettingService : public ServiceInterface<SettingService, Setting, SettingMapperParams,
                                               SettingMapper, std::string> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const Setting& source) -> SettingMapperParams;
  static auto FromParams(SettingMapperParams&& param) -> Setting;

  auto        Get(const std::string& key) -> std::optional<std::string>;
  void        Put(const std::string& key, const std::string& json_value);
};
};  // namespace imxup
