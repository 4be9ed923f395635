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

#include "storage/service/queue/gallery_image_service.hpp"

#include <utility>

namespace imxup {
auto GalleryImageService::ToParams(const ImageRecord& source) -> GalleryImageMapperParams {
  return {source.gallery_path_,
          source.file_name_,
          static_cast<int64_t>(source.size_bytes_),
          static_cast<int32_t>(source.width_),
          static_cast<int32_t>(source.height_),
          source.order_index_,
          source.uploaded_,
          source.remote_id_,
          source.image_url_,
          source.thumb_url_};
}

auto GalleryImageService::FromParams(GalleryImageMapperParams&& param) -> ImageRecord {
  ImageRecord record;
  record.gallery_path_ = std::move(param.gallery_path);
  record.file_name_    = std::move(param.file_name);
  record.size_bytes_   = static_cast<uint64_t>(param.size_bytes);
  record.width_        = static_cast<uint32_t>(param.width);
  record.height_       = static_cast<uint32_t>(param.height);
  record.order_index_  = param.order_index;
  record.uploaded_     = param.uploaded;
  record.remote_id_    = std::move(param.remote_id);
  record.image_url_    = std::move(param.image_url);
  record.thumb_url_    = std::move(param.thumb_url);
  return record;
}

auto GalleryImageService::GetByGallery(const gallery_key_t& path) -> std::vector<ImageRecord> {
  return GetByPredicate("gallery_path = ?", {path}, "order_index, file_name");
}

auto GalleryImageService::GetUploadedNames(const gallery_key_t& path)
    -> std::vector<std::string> {
  std::vector<std::string> names;
  for (auto& record : GetByPredicate("gallery_path = ? AND uploaded", {path})) {
    names.push_back(std::move(record.file_name_));
  }
  return names;
}

auto GalleryImageService::MarkUploaded(const gallery_key_t& path, const std::string& file_name,
                                       const std::string& remote_id,
                                       const std::string& image_url,
                                       const std::string& thumb_url) -> size_t {
  return duckorm::execute(
      _conn,
      "UPDATE GalleryImage SET uploaded = TRUE, remote_id = ?, image_url = ?, thumb_url = ? "
      "WHERE gallery_path = ? AND file_name = ?;",
      {remote_id, image_url, thumb_url, path, file_name});
}
};  // namespace imxup
