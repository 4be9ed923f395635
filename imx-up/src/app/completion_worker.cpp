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


#include "app/completion_worker.hpp"

#include <filesystem>
#include <fstream>
#include <string_view>
#include <utility>

#include "type/errors.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/log/logger.hpp"

namespace imxup {
namespace {
auto SafeFileStem(const std::string& name) -> std::string {
  std::string stem;
  for (char c : name) {
    bool bad = static_cast<unsigned char>(c) < 0x20 || std::string_view("<>:\"/\\|?*").find(c) !=
                                                          std::string_view::npos;
    stem += bad ? '_' : c;
  }
  return stem.empty() ? std::string("gallery") : stem;
}
}  // namespace

ArtifactWriter::ArtifactWriter(folder_path_t output_dir) : output_dir_(std::move(output_dir)) {}

auto ArtifactWriter::BuildSummary(const CompletionJob& job) -> nlohmann::json {
  const auto&    gallery = job.gallery_;
  const auto&    result  = job.result_;

  nlohmann::json images  = nlohmann::json::array();
  for (const auto& image : result.images_) {
    images.push_back({{"file_name", image.file_name_},
                      {"image_id", image.image_id_},
                      {"image_url", image.image_url_},
                      {"thumb_url", image.thumb_url_},
                      {"size_bytes", image.size_bytes_},
                      {"width", image.width_},
                      {"height", image.height_}});
  }
  nlohmann::json failures = nlohmann::json::array();
  for (const auto& failure : result.failed_details_) {
    failures.push_back({{"file_name", failure.file_name_},
                        {"reason", failure.reason_},
                        {"attempts", failure.attempts_}});
  }

  nlohmann::json summary;
  summary["gallery_name"]     = result.gallery_name_.empty() ? gallery.name_ : result.gallery_name_;
  summary["gallery_id"]       = result.gallery_id_;
  summary["gallery_url"]      = result.gallery_url_;
  summary["folder_path"]      = gallery.path_;
  summary["status"]           = GalleryStatusToString(gallery.status_);
  summary["tab"]              = gallery.tab_name_;
  summary["template"]         = result.template_name_;
  summary["total_images"]     = result.total_images_;
  summary["successful_count"] = result.successful_count_;
  summary["failed_count"]     = result.failed_count_;
  summary["started_at"]       = result.started_at_;
  summary["upload_time"]      = result.upload_time_s_;
  summary["total_size"]       = result.total_size_;
  summary["uploaded_size"]    = result.uploaded_size_;
  summary["transfer_speed"]   = result.transfer_speed_;
  summary["thumbnail_size"]   = result.thumbnail_size_;
  summary["thumbnail_format"] = result.thumbnail_format_;
  summary["parallel_batch_size"] = result.parallel_batch_size_;
  summary["dimensions"]       = {{"min_width", result.dimensions_.min_width_},
                                 {"max_width", result.dimensions_.max_width_},
                                 {"avg_width", result.dimensions_.avg_width_},
                                 {"min_height", result.dimensions_.min_height_},
                                 {"max_height", result.dimensions_.max_height_},
                                 {"avg_height", result.dimensions_.avg_height_}};
  summary["custom_fields"]    = gallery.custom_fields_;
  summary["images"]           = std::move(images);
  summary["failed_details"]   = std::move(failures);
  return summary;
}

auto ArtifactWriter::ArtifactPath(const CompletionJob& job) const -> file_path_t {
  const auto& name = job.result_.gallery_name_.empty() ? job.gallery_.name_
                                                       : job.result_.gallery_name_;
  auto        id   = job.result_.gallery_id_.empty() ? std::string("local") : job.result_.gallery_id_;
  return output_dir_ / (SafeFileStem(name) + "_" + id + ".json");
}

void ArtifactWriter::Process(const CompletionJob& job) {
  std::error_code ec;
  std::filesystem::create_directories(output_dir_, ec);
  if (ec) {
    throw StorageError("Cannot create artifact directory", ec.message());
  }

  auto          path = ArtifactPath(job);
  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open()) {
    throw StorageError("Failed to open artifact file for writing", path.string());
  }
  file << BuildSummary(job).dump(4);
  file.close();
  Logger::Get(LogCategory::APP)->info("Wrote gallery summary {}", path.string());
}

RenamePostProcessor::RenamePostProcessor(std::shared_ptr<QueueStore>     store,
                                         std::shared_ptr<GalleryRenamer> renamer,
                                         int32_t                         max_attempts)
    : store_(std::move(store)), renamer_(std::move(renamer)), max_attempts_(max_attempts) {}

void RenamePostProcessor::Process(const CompletionJob&) { RetryPending(); }

auto RenamePostProcessor::RetryPending() -> size_t {
  auto   log     = Logger::Get(LogCategory::UPLOADS);
  size_t renamed = 0;
  for (const auto& entry : store_->LoadUnnamedGalleries()) {
    if (entry.attempts_ >= max_attempts_) continue;
    try {
      renamer_->RenameGallery(entry.gallery_id_, entry.intended_name_);
      store_->RemoveUnnamedGallery(entry.gallery_id_);
      ++renamed;
      log->info("Renamed gallery {} to '{}'", entry.gallery_id_, entry.intended_name_);
    } catch (const StorageError&) {
      throw;
    } catch (const ImxupError& e) {
      store_->BumpUnnamedAttempts(entry.gallery_id_);
      log->warn("Rename of gallery {} failed (attempt {}): {}", entry.gallery_id_,
                entry.attempts_ + 1, e.Reason());
    }
  }
  return renamed;
}

CompletionWorker::CompletionWorker() = default;

CompletionWorker::~CompletionWorker() { Stop(); }

void CompletionWorker::AddProcessor(std::shared_ptr<PostProcessor> processor) {
  std::lock_guard<std::mutex> lock(mtx_);
  processors_.push_back(std::move(processor));
}

void CompletionWorker::Start() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (worker_.joinable()) return;
  worker_ = std::thread([this] { Loop(); });
}

void CompletionWorker::Stop() {
  jobs_.close();
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    worker.swap(worker_);
  }
  if (worker.joinable()) {
    worker.join();
    return;
  }
  // Never started: drain on the caller
  while (auto job = jobs_.try_pop()) ProcessNow(*job);
}

void CompletionWorker::Submit(CompletionJob job) {
  jobs_.push(std::move(job));
}

void CompletionWorker::ProcessNow(const CompletionJob& job) {
  std::vector<std::shared_ptr<PostProcessor>> processors;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    processors = processors_;
  }
  for (const auto& processor : processors) {
    try {
      processor->Process(job);
    } catch (const ImxupError& e) {
      Logger::Get(LogCategory::APP)
          ->error("Post-processor {} failed for {}: {}", processor->Name(), job.gallery_.path_,
                  e.Reason());
    } catch (const std::exception& e) {
      Logger::Get(LogCategory::APP)
          ->error("Post-processor {} failed for {}: {}", processor->Name(), job.gallery_.path_,
                  e.what());
    }
  }
  processed_.fetch_add(1);
}

void CompletionWorker::Loop() {
  while (auto job = jobs_.pop()) {
    ProcessNow(*job);
  }
}
};  // namespace imxup
