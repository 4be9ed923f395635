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

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "queue/gallery_item.hpp"
#include "type/type.hpp"

namespace imxup {
class QueueStore;

struct ScannedImage {
  std::string file_name_;
  uint64_t    size_bytes_ = 0;
  uint32_t    width_      = 0;
  uint32_t    height_     = 0;
};

struct ScanResult {
  // Natural filename order
  std::vector<ScannedImage> images_;
  // Files over the host size limit, left out of images_
  std::vector<std::string>  oversized_;
  uint64_t                  total_size_ = 0;
  DimensionStats            dimensions_{};
};

/**
 * @brief Finds the uploadable images of a folder (.jpg .jpeg .png .gif) and samples their pixel
 * size with Exiv2.
 */
class GalleryScanner {
 public:
  explicit GalleryScanner(std::optional<uint64_t> max_file_size_mb = std::nullopt,
                          bool                    sample_dimensions = true);

  static auto IsEligible(const file_path_t& file) -> bool;

  /**
   * @brief Eligible file names directly inside folder, in natural order. A missing folder throws
   * ValidationError.
   */
  static auto ListImages(const folder_path_t& folder) -> std::vector<std::string>;

  // (0, 0) when the file cannot be read
  static auto ReadDimensions(const image_path_t& path) -> std::pair<uint32_t, uint32_t>;

  // Images with unknown (0x0) dimensions are left out
  static auto ComputeStats(const std::vector<ScannedImage>& images) -> DimensionStats;

  /**
   * @brief Scan folder. A missing folder, or one without eligible images, throws
   * ValidationError.
   */
  auto        Scan(const folder_path_t& folder) const -> ScanResult;

  /**
   * @brief Scan a queued gallery and persist the outcome: validating/ready -> scanning -> ready
   * with its image rows, or failed with the reason.
   */
  auto        ScanIntoStore(QueueStore& store, const gallery_key_t& path) const -> GalleryItem;

 private:
  std::optional<uint64_t> max_file_size_mb_;
  bool                    sample_dimensions_;
};
};  // namespace imxup
