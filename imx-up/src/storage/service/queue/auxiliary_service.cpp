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

#include "storage/service/queue/auxiliary_service.hpp"

namespace imxup {
auto UnnamedGalleryService::ToParams(const UnnamedGallery& source) -> UnnamedGalleryMapperParams {
  return {source.gallery_id_, source.intended_name_, source.gallery_path_, source.queued_ts_,
          source.attempts_};
}

auto UnnamedGalleryService::FromParams(UnnamedGalleryMapperParams&& param) -> UnnamedGallery {
  return {std::move(param.gallery_id), std::move(param.intended_name),
          std::move(param.gallery_path), param.queued_ts, param.attempts};
}

auto UnnamedGalleryService::GetAllOrdered() -> std::vector<UnnamedGallery> {
  return GetByPredicate("TRUE", {}, "queued_ts, gallery_id");
}

auto SettingService::ToParams(const Setting& source) -> SettingMapperParams {
  return {source.first, source.second};
}

auto SettingService::FromParams(SettingMapperParams&& param) -> Setting {
  return {std::move(param.key), std::move(param.value)};
}

auto SettingService::Get(const std::string& key) -> std::optional<std::string> {
  auto rows = GetByPredicate("key = ?", {key});
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front().second);
}

void SettingService::Put(const std::string& key, const std::string& json_value) {
  Setting setting{key, json_value};
  if (Update(setting, key) == 0) {
    Insert(setting);
  }
}
};  // namespace imxup
