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

#include <string>
#include <vector>

#include "queue/gallery_item.hpp"
#include "storage/mapper/queue/gallery_image_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace imxup {
class GalleryImageService
    : public ServiceInterface<GalleryImageService, ImageRecord, GalleryImageMapperParams,
                              GalleryImageMapper, gallery_key_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const ImageRecord& source) -> GalleryImageMapperParams;
  static auto FromParams(GalleryImageMapperParams&& param) -> ImageRecord;

  auto        GetByGallery(const gallery_key_t& path) -> std::vector<ImageRecord>;
  auto        GetUploadedNames(const gallery_key_t& path) -> std::vector<std::string>;
  auto MarkUploaded(const gallery_key_t& path, const std::string& file_name,
                    const std::string& remote_id, const std::string& image_url,
                    const std::string& thumb_url) -> size_t;
};
};  // namespace imxup
