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

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "concurrency/atomic_counter.hpp"
#include "concurrency/cancellation_token.hpp"
#include "host/image_host_client.hpp"
#include "queue/gallery_item.hpp"
#include "type/errors.hpp"
#include "type/type.hpp"

namespace imxup {
struct UploadedImage {
  std::string file_name_;
  std::string image_id_;
  std::string image_url_;
  std::string thumb_url_;
  uint64_t    size_bytes_ = 0;
  uint32_t    width_      = 0;
  uint32_t    height_     = 0;
};

struct ImageAttempt {
  std::string file_name_;
  // 1 for the first try
  uint32_t    attempt_ = 0;
  bool        success_ = false;
  std::string error_;
};

struct EngineError {
  ErrorKind   kind_ = ErrorKind::UPLOAD;
  std::string reason_;
  std::string details_;
};

struct EngineOptions {
  using ProgressCallback =
      std::function<void(uint32_t completed, uint32_t total, uint32_t percent,
                         const std::string& current_file)>;
  using ImageUploadedCallback = std::function<void(
      const std::string& file_name, const UploadedImage& image, uint64_t size_bytes)>;

  folder_path_t                  folder_path_;
  // Folder name when unset
  std::optional<std::string>     gallery_name_;
  int                            thumbnail_size_      = 3;
  int                            thumbnail_format_    = 2;
  uint32_t                       max_retries_         = 3;
  uint32_t                       parallel_batch_size_ = 4;
  std::string                    template_name_       = "default";
  std::chrono::milliseconds      retry_delay_{1000};
  // Host limit; larger files are left out of the gallery
  std::optional<uint64_t>        max_file_size_mb_;

  // Resume: names listed here are never sent again
  std::set<std::string>          already_uploaded_;
  std::optional<std::string>     existing_gallery_id_;
  std::optional<std::string>     existing_gallery_url_;
  std::optional<DimensionStats>  precalculated_dimensions_;
  // Per-file (width, height) known from scanning
  std::map<std::string, std::pair<uint32_t, uint32_t>> image_dimensions_;

  ProgressCallback               on_progress_;
  ImageUploadedCallback          on_image_uploaded_;
  // Soft stop: no new image or retry starts once set, running transfers finish
  std::shared_ptr<const CancellationToken> soft_stop_;
};

/**
 * @brief Everything a run produced. Always fully populated, also when the run failed early.
 */
struct UploadResult {
  std::optional<EngineError> fatal_error_;
  // Soft stop seen before every image was attempted
  bool                       stopped_ = false;
  // Gallery was created without its name; a rename has to follow
  bool                       needs_rename_ = false;

  std::string                gallery_id_;
  std::string                gallery_url_;
  std::string                gallery_name_;

  uint32_t                   total_images_     = 0;
  uint32_t                   successful_count_ = 0;
  uint32_t                   failed_count_     = 0;
  std::vector<FailedImage>   failed_details_;
  // Over the host size limit, never sent
  std::vector<std::string>   skipped_oversized_;
  // Images sent by this run, in file order
  std::vector<UploadedImage> images_;
  std::vector<ImageAttempt>  attempt_log_;

  std::string                started_at_;
  double                     upload_time_s_    = 0.0;
  uint64_t                   total_size_       = 0;
  uint64_t                   uploaded_size_    = 0;
  double                     transfer_speed_   = 0.0;
  DimensionStats             dimensions_{};

  int                        thumbnail_size_      = 0;
  int                        thumbnail_format_    = 0;
  uint32_t                   parallel_batch_size_ = 0;
  std::string                template_name_;

  auto Succeeded() const -> bool {
    return !fatal_error_.has_value() && !stopped_ && failed_count_ == 0;
  }
  auto AttemptsFor(const std::string& file_name) const -> uint32_t;
};

/**
 * @brief Uploads one gallery to an image host. The host, and the two byte counters the run
 * feeds, are handed in by the owner; the engine keeps no global state.
 */
class UploadEngine {
 public:
  UploadEngine(std::shared_ptr<ImageHostClient> host, std::shared_ptr<AtomicCounter> global_bytes,
               std::shared_ptr<AtomicCounter> gallery_bytes);

  /**
   * @brief Run one gallery end to end. Never throws: failures are reported in the result.
   */
  auto Run(const EngineOptions& options) -> UploadResult;

 private:
  std::shared_ptr<ImageHostClient> host_;
  std::shared_ptr<AtomicCounter>   global_bytes_;
  std::shared_ptr<AtomicCounter>   gallery_bytes_;
};
};  // namespace imxup
