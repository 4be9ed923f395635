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


#include "app/gallery_scanner.hpp"

#include <exiv2/exiv2.hpp>

#include <algorithm>
#include <filesystem>
#include <format>
#include <limits>
#include <tuple>

#include "storage/controller/queue/queue_store.hpp"
#include "type/errors.hpp"
#include "utils/log/logger.hpp"
#include "utils/string/string_utils.hpp"

namespace imxup {
GalleryScanner::GalleryScanner(std::optional<uint64_t> max_file_size_mb, bool sample_dimensions)
    : max_file_size_mb_(max_file_size_mb), sample_dimensions_(sample_dimensions) {}

auto GalleryScanner::IsEligible(const file_path_t& file) -> bool {
  auto ext = strutil::ToLower(file.extension().string());
  return ext == ".jpg" || ext == ".jpeg" || ext == ".png" || ext == ".gif";
}

auto GalleryScanner::ListImages(const folder_path_t& folder) -> std::vector<std::string> {
  std::error_code ec;
  if (!std::filesystem::is_directory(folder, ec)) {
    throw ValidationError(std::format("Folder not found: {}", folder.string()));
  }

  std::vector<std::string> names;
  for (const auto& entry : std::filesystem::directory_iterator(folder, ec)) {
    if (!entry.is_regular_file(ec) || !IsEligible(entry.path())) continue;
    names.push_back(entry.path().filename().string());
  }
  if (ec) {
    throw ValidationError(std::format("Cannot list {}", folder.string()), ec.message());
  }
  std::sort(names.begin(), names.end(),
            [](const std::string& lhs, const std::string& rhs) {
              return strutil::NaturalLess(lhs, rhs);
            });
  return names;
}

auto GalleryScanner::ReadDimensions(const image_path_t& path) -> std::pair<uint32_t, uint32_t> {
  try {
    Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(path.string());
    image->readMetadata();
    return {image->pixelWidth(), image->pixelHeight()};
  } catch (const Exiv2::Error& e) {
    Logger::Get(LogCategory::QUEUE)
        ->debug("No dimensions for {}: {}", path.filename().string(), e.what());
    return {0, 0};
  }
}

auto GalleryScanner::ComputeStats(const std::vector<ScannedImage>& images) -> DimensionStats {
  DimensionStats stats;
  uint64_t       width_sum  = 0;
  uint64_t       height_sum = 0;
  stats.min_width_          = std::numeric_limits<uint32_t>::max();
  stats.min_height_         = std::numeric_limits<uint32_t>::max();
  for (const auto& image : images) {
    if (image.width_ == 0 || image.height_ == 0) continue;
    ++stats.sampled_;
    width_sum += image.width_;
    height_sum += image.height_;
    stats.min_width_  = std::min(stats.min_width_, image.width_);
    stats.min_height_ = std::min(stats.min_height_, image.height_);
    stats.max_width_  = std::max(stats.max_width_, image.width_);
    stats.max_height_ = std::max(stats.max_height_, image.height_);
  }
  if (stats.sampled_ == 0) return DimensionStats{};
  stats.avg_width_  = static_cast<double>(width_sum) / stats.sampled_;
  stats.avg_height_ = static_cast<double>(height_sum) / stats.sampled_;
  return stats;
}

auto GalleryScanner::Scan(const folder_path_t& folder) const -> ScanResult {
  ScanResult result;
  auto       names = ListImages(folder);
  for (const auto& name : names) {
    auto            path = folder / name;
    std::error_code ec;
    auto            size = std::filesystem::file_size(path, ec);
    if (ec) {
      Logger::Get(LogCategory::QUEUE)->warn("Skipping unreadable {}: {}", name, ec.message());
      continue;
    }
    if (max_file_size_mb_.has_value() && size > *max_file_size_mb_ * 1024ULL * 1024ULL) {
      result.oversized_.push_back(name);
      continue;
    }

    ScannedImage image{name, size, 0, 0};
    if (sample_dimensions_) {
      std::tie(image.width_, image.height_) = ReadDimensions(path);
    }
    result.total_size_ += size;
    result.images_.push_back(std::move(image));
  }

  if (!result.oversized_.empty()) {
    Logger::Get(LogCategory::QUEUE)
        ->warn("{}: {} file(s) over the {} MiB limit left out", folder.filename().string(),
               result.oversized_.size(), *max_file_size_mb_);
  }
  if (result.images_.empty()) {
    throw ValidationError(std::format("No uploadable images in {}", folder.string()));
  }
  result.dimensions_ = ComputeStats(result.images_);
  return result;
}

auto GalleryScanner::ScanIntoStore(QueueStore& store, const gallery_key_t& path) const
    -> GalleryItem {
  auto item = store.Get(path);
  if (!item.has_value()) {
    throw ValidationError(std::format("Gallery {} is not queued", path));
  }
  if (item->status_ == GalleryStatus::VALIDATING && !std::filesystem::is_directory(path)) {
    store.UpdateStatus(path, GalleryStatus::FAILED, "Folder not found");
    return *store.Get(path);
  }
  store.UpdateStatus(path, GalleryStatus::SCANNING);

  ScanResult result;
  try {
    result = Scan(folder_path_t{path});
  } catch (const ValidationError& e) {
    Logger::Get(LogCategory::QUEUE)->warn("Scan of {} failed: {}", path, e.Reason());
    store.UpdateStatus(path, GalleryStatus::FAILED, e.Reason());
    return *store.Get(path);
  }

  std::vector<ImageRecord> records;
  records.reserve(result.images_.size());
  for (size_t i = 0; i < result.images_.size(); ++i) {
    const auto& image = result.images_[i];
    ImageRecord record;
    record.gallery_path_ = path;
    record.file_name_    = image.file_name_;
    record.size_bytes_   = image.size_bytes_;
    record.width_        = image.width_;
    record.height_       = image.height_;
    record.order_index_  = static_cast<int32_t>(i);
    records.push_back(std::move(record));
  }
  store.ReplaceImages(path, records);

  auto current             = *store.Get(path);
  current.total_images_    = static_cast<uint32_t>(result.images_.size());
  current.total_size_      = result.total_size_;
  current.dimensions_      = result.dimensions_;
  current.scan_complete_   = true;
  current.uploaded_images_ = 0;
  current.uploaded_size_   = 0;
  current.failed_images_   = 0;
  current.failed_files_.clear();
  current.error_message_.clear();
  store.UpdateGallery(current);
  store.UpdateStatus(path, GalleryStatus::READY);

  Logger::Get(LogCategory::QUEUE)
      ->info("Scanned {}: {} images, {} bytes", path, current.total_images_, current.total_size_);
  return *store.Get(path);
}
};  // namespace imxup
