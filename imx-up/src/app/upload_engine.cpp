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


#include "app/upload_engine.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <format>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include "app/gallery_scanner.hpp"
#include "concurrency/thread_pool.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/log/logger.hpp"

namespace imxup {
namespace {
enum class ImageOutcome : uint8_t { UPLOADED = 0, FAILED, STOPPED, ABORTED };

auto FileSize(const file_path_t& path) -> uint64_t {
  std::error_code ec;
  auto            size = std::filesystem::file_size(path, ec);
  return ec ? 0 : size;
}

/**
 * @brief State of one Run. Worker tasks write into it under mtx_; callbacks are serialized by
 * callback_mtx_ so observers see one event at a time.
 */
class GalleryRun {
 public:
  GalleryRun(ImageHostClient& host, const EngineOptions& options,
             std::vector<std::shared_ptr<AtomicCounter>> counters)
      : host_(host), options_(options), counters_(std::move(counters)) {}

  void Execute(UploadResult& result);
  // Move per-image outcomes into result, in file order
  void Collect(UploadResult& result);

 private:
  auto UploadOne(size_t index, const std::string& file_name, const std::string& gallery_id,
                 std::string* opened_gallery_id, std::string* opened_gallery_url)
      -> ImageOutcome;
  auto CreateGallery(const std::string& name) -> std::optional<GalleryHandle>;
  void RecordAttempt(const std::string& file_name, uint32_t attempt, bool success,
                     const std::string& error);
  void Abort(const ImxupError& error);
  void NotifyProgress(const std::string& file_name);
  void NotifyUploaded(const UploadedImage& image);
  auto Dimensions(const std::string& file_name) const -> std::pair<uint32_t, uint32_t>;

  ImageHostClient&                                   host_;
  const EngineOptions&                               options_;
  std::vector<std::shared_ptr<AtomicCounter>>        counters_;

  std::string                                        gallery_name_;
  uint32_t                                           total_images_      = 0;
  uint32_t                                           initial_completed_ = 0;

  std::mutex                                         mtx_;
  std::vector<std::pair<size_t, UploadedImage>>      uploaded_;
  std::vector<std::pair<size_t, FailedImage>>        failed_;
  std::vector<ImageAttempt>                          attempts_;
  std::optional<EngineError>                         fatal_;
  bool                                               stopped_ = false;

  std::atomic<bool>                                  aborted_{false};
  std::mutex                                         callback_mtx_;
};

void GalleryRun::RecordAttempt(const std::string& file_name, uint32_t attempt, bool success,
                               const std::string& error) {
  std::lock_guard<std::mutex> lock(mtx_);
  attempts_.push_back(ImageAttempt{file_name, attempt, success, error});
}

void GalleryRun::Abort(const ImxupError& error) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!fatal_.has_value()) fatal_ = EngineError{error.Kind(), error.Reason(), error.Details()};
  aborted_.store(true);
}

void GalleryRun::NotifyProgress(const std::string& file_name) {
  if (!options_.on_progress_) return;
  uint32_t completed = 0;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    completed = initial_completed_ + static_cast<uint32_t>(uploaded_.size());
  }
  uint32_t                    percent = total_images_ == 0 ? 0 : completed * 100 / total_images_;
  std::lock_guard<std::mutex> lock(callback_mtx_);
  try {
    options_.on_progress_(completed, total_images_, percent, file_name);
  } catch (const std::exception& e) {
    Logger::Get(LogCategory::ENGINE)->error("Progress callback failed: {}", e.what());
  }
}

void GalleryRun::NotifyUploaded(const UploadedImage& image) {
  if (!options_.on_image_uploaded_) return;
  std::lock_guard<std::mutex> lock(callback_mtx_);
  try {
    options_.on_image_uploaded_(image.file_name_, image, image.size_bytes_);
  } catch (const std::exception& e) {
    Logger::Get(LogCategory::ENGINE)
        ->error("Image callback failed for {}: {}", image.file_name_, e.what());
  }
}

auto GalleryRun::Dimensions(const std::string& file_name) const -> std::pair<uint32_t, uint32_t> {
  auto it = options_.image_dimensions_.find(file_name);
  if (it != options_.image_dimensions_.end()) return it->second;
  return GalleryScanner::ReadDimensions(options_.folder_path_ / file_name);
}

/**
 * @brief Up to max_retries + 1 attempts for one image. The soft stop is checked before every
 * attempt; an authentication failure stops the whole run.
 */
auto GalleryRun::UploadOne(size_t index, const std::string& file_name,
                           const std::string& gallery_id, std::string* opened_gallery_id,
                           std::string* opened_gallery_url) -> ImageOutcome {
  auto             log  = Logger::Get(LogCategory::UPLOADS);
  const auto       path = options_.folder_path_ / file_name;
  ByteCountingSink sink(counters_);

  ImageUploadOptions upload_options;
  upload_options.gallery_id_       = gallery_id;
  upload_options.gallery_name_     = gallery_name_;
  upload_options.thumbnail_size_   = options_.thumbnail_size_;
  upload_options.thumbnail_format_ = options_.thumbnail_format_;

  const uint32_t max_attempts = options_.max_retries_ + 1;
  std::string    last_error;
  for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    if (aborted_.load()) return ImageOutcome::ABORTED;
    if (options_.soft_stop_ && options_.soft_stop_->IsCancelled()) {
      std::lock_guard<std::mutex> lock(mtx_);
      stopped_ = true;
      return ImageOutcome::STOPPED;
    }

    sink.Restart();
    auto started = std::chrono::steady_clock::now();
    std::optional<ImageUploadResponse> response;
    try {
      response = host_.UploadImage(
          path, upload_options, [&sink](uint64_t uploaded, uint64_t) { sink.Update(uploaded); },
          nullptr);
    } catch (const AuthenticationError& e) {
      RecordAttempt(file_name, attempt, false, e.Reason());
      log->error("Authentication failed while uploading {}: {}", file_name, e.Reason());
      Abort(e);
      return ImageOutcome::ABORTED;
    } catch (const ImxupError& e) {
      last_error = e.Reason();
    } catch (const std::exception& e) {
      last_error = e.what();
    }

    if (response.has_value()) {
      // Accepted by the host; nothing below may send the image again
      RecordAttempt(file_name, attempt, true, {});
      UploadedImage image;
      image.file_name_  = file_name;
      image.image_id_   = response->image_id_;
      image.image_url_  = response->image_url_;
      image.thumb_url_  = response->thumb_url_;
      image.size_bytes_ = FileSize(path);
      try {
        std::tie(image.width_, image.height_) = Dimensions(file_name);
      } catch (const std::exception& e) {
        log->debug("No dimensions for {}: {}", file_name, e.what());
      }
      if (opened_gallery_id != nullptr) *opened_gallery_id = response->gallery_id_;
      if (opened_gallery_url != nullptr) *opened_gallery_url = response->gallery_url_;

      double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started)
                           .count();
      log->info("Uploaded (in {:.3f}s): {} ({})", seconds, path.string(), image.image_url_);
      {
        std::lock_guard<std::mutex> lock(mtx_);
        uploaded_.emplace_back(index, image);
      }
      NotifyUploaded(image);
      NotifyProgress(file_name);
      return ImageOutcome::UPLOADED;
    }

    RecordAttempt(file_name, attempt, false, last_error);
    log->warn("Upload of {} failed (attempt {}/{}): {}", file_name, attempt, max_attempts,
              last_error);
    if (attempt < max_attempts && options_.retry_delay_.count() > 0) {
      std::this_thread::sleep_for(options_.retry_delay_);
    }
  }

  {
    std::lock_guard<std::mutex> lock(mtx_);
    failed_.emplace_back(index, FailedImage{file_name, last_error, max_attempts});
  }
  NotifyProgress(file_name);
  return ImageOutcome::FAILED;
}

auto GalleryRun::CreateGallery(const std::string& name) -> std::optional<GalleryHandle> {
  const uint32_t max_attempts = options_.max_retries_ + 1;
  for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    if (options_.soft_stop_ && options_.soft_stop_->IsCancelled()) {
      stopped_ = true;
      return std::nullopt;
    }
    try {
      return host_.CreateGalleryWithName(name);
    } catch (const AuthenticationError& e) {
      Abort(e);
      return std::nullopt;
    } catch (const ImxupError& e) {
      Logger::Get(LogCategory::UPLOADS)
          ->warn("Gallery creation failed (attempt {}/{}): {}", attempt, max_attempts,
                 e.Reason());
      if (attempt == max_attempts) {
        Abort(UploadError("Failed to create gallery: " + e.Reason(), e.Details()));
        return std::nullopt;
      }
    }
    if (options_.retry_delay_.count() > 0) std::this_thread::sleep_for(options_.retry_delay_);
  }
  return std::nullopt;
}

void GalleryRun::Execute(UploadResult& result) {
  auto log   = Logger::Get(LogCategory::ENGINE);
  auto files = GalleryScanner::ListImages(options_.folder_path_);
  if (options_.max_file_size_mb_.has_value()) {
    const uint64_t limit = *options_.max_file_size_mb_ * 1024ULL * 1024ULL;
    std::erase_if(files, [&](const std::string& name) {
      if (FileSize(options_.folder_path_ / name) <= limit) return false;
      result.skipped_oversized_.push_back(name);
      return true;
    });
    if (!result.skipped_oversized_.empty()) {
      log->warn("{} file(s) over the {} MiB limit left out", result.skipped_oversized_.size(),
                *options_.max_file_size_mb_);
    }
  }
  if (files.empty()) {
    throw ValidationError(
        std::format("No uploadable images in {}", options_.folder_path_.string()));
  }

  gallery_name_ = options_.gallery_name_.value_or(options_.folder_path_.filename().string());
  if (gallery_name_.empty()) gallery_name_ = options_.folder_path_.filename().string();
  result.gallery_name_ = gallery_name_;
  total_images_        = static_cast<uint32_t>(files.size());
  result.total_images_ = total_images_;

  std::vector<std::pair<size_t, std::string>> pending;
  for (size_t i = 0; i < files.size(); ++i) {
    result.total_size_ += FileSize(options_.folder_path_ / files[i]);
    if (options_.already_uploaded_.contains(files[i])) {
      ++initial_completed_;
    } else {
      pending.emplace_back(i, files[i]);
    }
  }
  log->info("Gallery '{}': {} images, {} already uploaded", gallery_name_, total_images_,
            initial_completed_);

  std::string gallery_id;
  if (options_.existing_gallery_id_.has_value() && !options_.existing_gallery_id_->empty()) {
    gallery_id          = *options_.existing_gallery_id_;
    result.gallery_url_ = options_.existing_gallery_url_.value_or("");
    log->info("Appending to existing gallery {}", gallery_id);
  } else if (!pending.empty()) {
    auto handle = CreateGallery(gallery_name_);
    if (!handle.has_value()) return;
    gallery_id          = handle->gallery_id_;
    result.gallery_url_ = handle->gallery_url_;

    if (gallery_id.empty()) {
      // The host opens the gallery with its first image
      auto [index, first] = pending.front();
      log->info("Uploading first image to open the gallery: {}", first);
      std::string opened_url;
      auto        outcome = UploadOne(index, first, {}, &gallery_id, &opened_url);
      if (outcome != ImageOutcome::UPLOADED) {
        if (outcome == ImageOutcome::FAILED) {
          std::lock_guard<std::mutex> lock(mtx_);
          fatal_ = EngineError{ErrorKind::UPLOAD, "Failed to create gallery",
                               failed_.empty() ? std::string{} : failed_.back().second.reason_};
        }
        return;
      }
      if (gallery_id.empty()) {
        std::lock_guard<std::mutex> lock(mtx_);
        fatal_ = EngineError{ErrorKind::UPLOAD, "Host did not report a gallery id", {}};
        return;
      }
      result.gallery_url_ = opened_url;
      pending.erase(pending.begin());
    }
    result.needs_rename_ = !handle->named_;
  }
  result.gallery_id_ = gallery_id;

  NotifyProgress(pending.empty() ? files.front() : pending.front().second);

  if (!pending.empty()) {
    size_t     workers = std::clamp<size_t>(options_.parallel_batch_size_, 1, pending.size());
    ThreadPool pool(workers);
    for (const auto& [index, file_name] : pending) {
      pool.Submit([this, index = index, file_name = file_name, &gallery_id] {
        UploadOne(index, file_name, gallery_id, nullptr, nullptr);
      });
    }
    pool.WaitIdle();
  }
}

void GalleryRun::Collect(UploadResult& result) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto by_index = [](const auto& a, const auto& b) { return a.first < b.first; };
  std::sort(uploaded_.begin(), uploaded_.end(), by_index);
  std::sort(failed_.begin(), failed_.end(), by_index);

  std::vector<ScannedImage> sampled;
  for (auto& [index, image] : uploaded_) {
    result.uploaded_size_ += image.size_bytes_;
    sampled.push_back(ScannedImage{image.file_name_, image.size_bytes_, image.width_,
                                   image.height_});
    result.images_.push_back(std::move(image));
  }
  for (auto& [index, failure] : failed_) result.failed_details_.push_back(std::move(failure));

  result.successful_count_ = initial_completed_ + static_cast<uint32_t>(result.images_.size());
  result.failed_count_     = static_cast<uint32_t>(result.failed_details_.size());
  result.attempt_log_      = std::move(attempts_);
  result.stopped_          = stopped_ && !fatal_.has_value();
  if (fatal_.has_value() && !result.fatal_error_.has_value()) result.fatal_error_ = fatal_;
  result.dimensions_ = options_.precalculated_dimensions_.value_or(
      GalleryScanner::ComputeStats(sampled));
}
}  // namespace

auto UploadResult::AttemptsFor(const std::string& file_name) const -> uint32_t {
  return static_cast<uint32_t>(std::count_if(
      attempt_log_.begin(), attempt_log_.end(),
      [&file_name](const ImageAttempt& attempt) { return attempt.file_name_ == file_name; }));
}

UploadEngine::UploadEngine(std::shared_ptr<ImageHostClient> host,
                           std::shared_ptr<AtomicCounter>   global_bytes,
                           std::shared_ptr<AtomicCounter>   gallery_bytes)
    : host_(std::move(host)),
      global_bytes_(std::move(global_bytes)),
      gallery_bytes_(std::move(gallery_bytes)) {}

auto UploadEngine::Run(const EngineOptions& options) -> UploadResult {
  auto         log = Logger::Get(LogCategory::ENGINE);
  UploadResult result;
  result.thumbnail_size_      = options.thumbnail_size_;
  result.thumbnail_format_    = options.thumbnail_format_;
  result.parallel_batch_size_ = options.parallel_batch_size_;
  result.template_name_       = options.template_name_;
  result.started_at_          = TimeProvider::TimePointToString(TimeProvider::Now());
  result.gallery_name_ =
      options.gallery_name_.value_or(options.folder_path_.filename().string());
  auto start = std::chrono::steady_clock::now();

  if (gallery_bytes_) gallery_bytes_->Reset();
  std::vector<std::shared_ptr<AtomicCounter>> counters;
  if (global_bytes_) counters.push_back(global_bytes_);
  if (gallery_bytes_) counters.push_back(gallery_bytes_);

  if (!host_) {
    result.fatal_error_ = EngineError{ErrorKind::VALIDATION, "No image host configured", {}};
    return result;
  }

  GalleryRun run(*host_, options, counters);
  try {
    run.Execute(result);
  } catch (const ValidationError& e) {
    log->error("Gallery {} rejected: {}", options.folder_path_.string(), e.Reason());
    result.fatal_error_ = EngineError{e.Kind(), e.Reason(), e.Details()};
  } catch (const ImxupError& e) {
    log->error("Gallery {} failed: {}", options.folder_path_.string(), e.Reason());
    result.fatal_error_ = EngineError{e.Kind(), e.Reason(), e.Details()};
  } catch (const std::exception& e) {
    log->error("Gallery {} failed unexpectedly: {}", options.folder_path_.string(), e.what());
    result.fatal_error_ = EngineError{ErrorKind::UPLOAD, "Unexpected upload failure", e.what()};
  }
  run.Collect(result);

  result.upload_time_s_ =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
  result.transfer_speed_ = result.upload_time_s_ > 0.0
                               ? static_cast<double>(result.uploaded_size_) / result.upload_time_s_
                               : 0.0;

  if (result.fatal_error_.has_value()) {
    log->error("Gallery '{}' aborted: {}", result.gallery_name_, result.fatal_error_->reason_);
  } else if (result.stopped_) {
    log->info("Gallery '{}' paused after {}/{} images", result.gallery_name_,
              result.successful_count_, result.total_images_);
  } else if (result.failed_count_ > 0) {
    log->warn("Gallery '{}' finished with failures in {:.1f}s ({}/{} images)",
              result.gallery_name_, result.upload_time_s_, result.successful_count_,
              result.total_images_);
    for (const auto& failure : result.failed_details_) {
      log->warn("  {}: {}", failure.file_name_, failure.reason_);
    }
  } else {
    log->info("Gallery '{}' uploaded in {:.3f}s ({} images, {} bytes, {:.0f} B/s)",
              result.gallery_name_, result.upload_time_s_, result.successful_count_,
              result.uploaded_size_, result.transfer_speed_);
  }
  return result;
}
};  // namespace imxup
