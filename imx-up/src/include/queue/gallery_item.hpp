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
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace imxup {
enum class GalleryStatus : uint8_t {
  VALIDATING = 0,
  SCANNING,
  READY,
  QUEUED,
  UPLOADING,
  PAUSED,
  INCOMPLETE,
  COMPLETED,
  FAILED
};

auto GalleryStatusToString(GalleryStatus status) -> std::string;
auto GalleryStatusFromString(const std::string& value) -> GalleryStatus;

/**
 * @brief Whether the lifecycle allows moving from `from` to `to`.
 */
auto IsValidGalleryTransition(GalleryStatus from, GalleryStatus to) -> bool;

// Statuses that a worker may pick up or that may be re-queued for resume
auto IsResumable(GalleryStatus status) -> bool;

struct DimensionStats {
  uint32_t min_width_  = 0;
  uint32_t max_width_  = 0;
  double   avg_width_  = 0.0;
  uint32_t min_height_ = 0;
  uint32_t max_height_ = 0;
  double   avg_height_ = 0.0;
  uint32_t sampled_    = 0;
};

struct FailedImage {
  std::string file_name_;
  std::string reason_;
  uint32_t    attempts_ = 0;
};

/**
 * @brief One queued folder. The Queue Store owns the persistent copy; everybody else holds a
 * snapshot.
 */
struct GalleryItem {
  gallery_key_t              path_;
  std::string                name_;
  GalleryStatus              status_          = GalleryStatus::VALIDATING;
  std::string                tab_name_        = "Main";
  std::string                image_host_id_   = "imx";
  std::string                template_name_   = "default";

  uint32_t                   total_images_    = 0;
  uint32_t                   uploaded_images_ = 0;
  uint32_t                   failed_images_   = 0;
  uint64_t                   total_size_      = 0;
  uint64_t                   uploaded_size_   = 0;
  bool                       scan_complete_   = false;

  insertion_order_t          insertion_order_ = 0;
  unix_ts_t                  added_ts_        = 0;
  unix_ts_t                  finished_ts_     = 0;

  std::string                gallery_id_;
  std::string                gallery_url_;
  std::string                error_message_;
  std::vector<FailedImage>   failed_files_;

  std::array<std::string, 4> custom_fields_{};
  std::array<std::string, 4> ext_fields_{};
  DimensionStats             dimensions_{};
};

struct ImageRecord {
  gallery_key_t gallery_path_;
  std::string   file_name_;
  uint64_t      size_bytes_  = 0;
  uint32_t      width_       = 0;
  uint32_t      height_      = 0;
  int32_t       order_index_ = 0;
  bool          uploaded_    = false;
  std::string   remote_id_;
  std::string   image_url_;
  std::string   thumb_url_;
};

struct Tab {
  tab_id_t    id_            = 0;
  std::string name_;
  int32_t     display_order_ = 0;
  bool        is_default_    = false;
  unix_ts_t   created_ts_    = 0;
};

inline constexpr const char* kDefaultTabName = "Main";

struct UnnamedGallery {
  std::string   gallery_id_;
  std::string   intended_name_;
  gallery_key_t gallery_path_;
  unix_ts_t     queued_ts_ = 0;
  int32_t       attempts_  = 0;
};

struct QueueStats {
  std::map<GalleryStatus, uint32_t> by_status_;
  uint32_t                          total_galleries_ = 0;
  uint64_t                          total_images_    = 0;
  uint64_t                          total_bytes_     = 0;
  uint64_t                          uploaded_bytes_  = 0;
};
};  // namespace imxup
