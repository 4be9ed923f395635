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


#include "app/queue_manager.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <set>
#include <utility>

#include "app/gallery_scanner.hpp"
#include "type/errors.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/log/logger.hpp"

namespace imxup {
namespace {
auto FolderName(const gallery_key_t& path) -> std::string {
  return std::filesystem::path(path).filename().string();
}
}  // namespace

auto QueueManager::NormalizePath(const folder_path_t& folder) -> gallery_key_t {
  std::error_code ec;
  auto            absolute = std::filesystem::absolute(folder, ec);
  auto            normal   = (ec ? folder : absolute).lexically_normal();
  // "a/b/" and "a/b" are the same gallery
  if (!normal.has_filename() && normal.has_parent_path()) normal = normal.parent_path();
  return normal.string();
}

QueueManager::QueueManager(std::shared_ptr<QueueStore> store, ImageHostProvider image_hosts,
                           const HostConfigRegistry* registry, std::shared_ptr<EventBus> bus,
                           std::shared_ptr<CompletionWorker>     completion,
                           std::shared_ptr<FileHostUploadWorker> file_hosts,
                           std::shared_ptr<AtomicCounter>        global_bytes,
                           QueueManagerOptions                   options)
    : store_(std::move(store)),
      image_hosts_(std::move(image_hosts)),
      registry_(registry),
      bus_(std::move(bus)),
      completion_(std::move(completion)),
      file_hosts_(std::move(file_hosts)),
      options_(std::move(options)),
      global_bytes_(global_bytes ? std::move(global_bytes) : std::make_shared<AtomicCounter>()) {}

QueueManager::~QueueManager() { Stop(); }

auto QueueManager::ImageHostConfig(const std::string& host_id) const -> const HostConfig* {
  return registry_ != nullptr ? registry_->Get(host_id) : nullptr;
}

auto QueueManager::AddFolders(const std::vector<folder_path_t>& folders,
                              const std::string&                tab_name,
                              const std::optional<std::string>& name) -> std::vector<GalleryItem> {
  auto                       log = Logger::Get(LogCategory::QUEUE);
  std::vector<GalleryItem>   fresh;
  std::set<gallery_key_t>    seen;
  for (const auto& folder : folders) {
    auto path = NormalizePath(folder);
    if (!seen.insert(path).second) continue;
    if (store_->Get(path).has_value()) {
      log->info("Already queued: {}", path);
      continue;
    }
    GalleryItem item;
    item.path_          = path;
    item.name_          = (name.has_value() && folders.size() == 1) ? *name : FolderName(path);
    item.status_        = GalleryStatus::VALIDATING;
    item.tab_name_      = tab_name.empty() ? std::string(kDefaultTabName) : tab_name;
    item.image_host_id_ = options_.image_host_id_;
    item.template_name_ = options_.template_name_;
    item.added_ts_      = TimeProvider::NowUnix();
    fresh.push_back(std::move(item));
  }
  store_->BulkUpsert(fresh);

  std::optional<uint64_t> max_file_size_mb;
  if (const auto* host = ImageHostConfig(options_.image_host_id_)) {
    max_file_size_mb = host->max_file_size_mb_;
  }
  GalleryScanner           scanner(max_file_size_mb);
  std::vector<GalleryItem> added;
  for (const auto& item : fresh) {
    added.push_back(scanner.ScanIntoStore(*store_, item.path_));
    log->info("Added {} to tab '{}' ({})", added.back().name_, added.back().tab_name_,
              GalleryStatusToString(added.back().status_));
    FireTriggers(TriggerEvent::ADDED, item.path_);
  }
  PublishStats();
  return added;
}

auto QueueManager::Enqueue(const gallery_key_t& path) -> GalleryItem {
  auto item = store_->Get(path);
  if (!item.has_value()) {
    throw ValidationError("Not in the queue: " + path);
  }
  if (item->status_ == GalleryStatus::QUEUED) return *item;

  if (!item->scan_complete_ && item->status_ != GalleryStatus::READY) {
    std::optional<uint64_t> max_file_size_mb;
    if (const auto* host = ImageHostConfig(item->image_host_id_)) {
      max_file_size_mb = host->max_file_size_mb_;
    }
    item = GalleryScanner(max_file_size_mb).ScanIntoStore(*store_, path);
    if (item->status_ != GalleryStatus::READY) {
      throw ValidationError("Cannot queue " + item->name_, item->error_message_);
    }
  }
  store_->UpdateStatus(path, GalleryStatus::QUEUED);
  {
    std::lock_guard<std::mutex> lock(running_mtx_);
    pause_requests_.erase(path);
  }
  WakeWorkers();
  PublishStats();
  return *store_->Get(path);
}

auto QueueManager::StartAll() -> size_t {
  size_t queued = 0;
  for (const auto& item : store_->LoadAll()) {
    if (item.status_ != GalleryStatus::READY) continue;
    store_->UpdateStatus(item.path_, GalleryStatus::QUEUED);
    ++queued;
  }
  if (queued > 0) {
    WakeWorkers();
    PublishStats();
  }
  return queued;
}

auto QueueManager::Retry(const gallery_key_t& path) -> GalleryItem {
  auto item = store_->Get(path);
  if (!item.has_value()) {
    throw ValidationError("Not in the queue: " + path);
  }
  if (!IsResumable(item->status_) || item->status_ == GalleryStatus::READY ||
      item->status_ == GalleryStatus::QUEUED) {
    throw ValidationError(std::format("Cannot retry a {} gallery",
                                      GalleryStatusToString(item->status_)),
                          path);
  }
  Logger::Get(LogCategory::QUEUE)
      ->info("Retrying {} ({} of {} images already uploaded)", item->name_,
             item->uploaded_images_, item->total_images_);
  return Enqueue(path);
}

void QueueManager::Pause(const gallery_key_t& path) {
  {
    std::lock_guard<std::mutex> lock(running_mtx_);
    auto                        it = running_.find(path);
    if (it != running_.end()) {
      it->second->Cancel();
      return;
    }
  }
  if (store_->SetStatusIf(path, GalleryStatus::QUEUED, GalleryStatus::PAUSED)) {
    PublishStats();
    return;
  }

  // A worker may have claimed it without having registered its stop token yet
  auto item = store_->Get(path);
  if (!item.has_value() || item->status_ != GalleryStatus::UPLOADING) return;
  std::lock_guard<std::mutex> lock(running_mtx_);
  auto                        it = running_.find(path);
  if (it != running_.end()) {
    it->second->Cancel();
  } else {
    pause_requests_.insert(path);
  }
}

auto QueueManager::Remove(const std::vector<gallery_key_t>& paths) -> size_t {
  std::vector<gallery_key_t> removable;
  {
    std::lock_guard<std::mutex> lock(running_mtx_);
    for (const auto& path : paths) {
      if (running_.contains(path)) {
        Logger::Get(LogCategory::QUEUE)->warn("Not removing {} while it uploads", path);
        continue;
      }
      removable.push_back(path);
    }
  }
  auto removed = store_->DeleteByPaths(removable);
  PublishStats();
  return removed;
}

void QueueManager::Recover() {
  auto log         = Logger::Get(LogCategory::QUEUE);
  auto galleries   = store_->RecoverInterrupted();
  auto host_upload = store_->RecoverInterruptedHostUploads();
  if (galleries > 0 || host_upload > 0) {
    log->warn("Recovered {} interrupted galleries and {} interrupted host uploads", galleries,
              host_upload);
  }
}

void QueueManager::StartTracker() {
  if (tracker_) return;
  tracker_ = std::make_unique<BandwidthTracker>(
      std::vector<std::shared_ptr<AtomicCounter>>{global_bytes_}, options_.bandwidth_,
      [this](const BandwidthSnapshot& snapshot) {
        if (bus_) bus_->Publish(BandwidthUpdated{snapshot});
      });
  tracker_->Start();
}

void QueueManager::StopTracker() {
  if (!tracker_) return;
  tracker_->Stop();
  tracker_.reset();
}

void QueueManager::Start() {
  std::lock_guard<std::mutex> lock(worker_mtx_);
  if (!workers_.empty()) return;
  Recover();
  stopping_ = false;
  StartTracker();
  uint32_t count = std::max<uint32_t>(options_.worker_count_, 1);
  for (uint32_t i = 0; i < count; ++i) workers_.emplace_back([this] { WorkerLoop(); });
  Logger::Get(LogCategory::QUEUE)->info("Started {} queue worker(s)", count);
}

void QueueManager::Stop(bool pause_running) {
  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(worker_mtx_);
    stopping_ = true;
    workers.swap(workers_);
  }
  if (pause_running) {
    std::lock_guard<std::mutex> lock(running_mtx_);
    for (auto& [path, token] : running_) token->Cancel();
  }
  worker_cv_.notify_all();
  for (auto& worker : workers) worker.join();
  StopTracker();
}

void QueueManager::WakeWorkers() { worker_cv_.notify_all(); }

void QueueManager::WorkerLoop() {
  auto log = Logger::Get(LogCategory::QUEUE);
  while (true) {
    {
      std::lock_guard<std::mutex> lock(worker_mtx_);
      if (stopping_) return;
    }
    bool worked = false;
    try {
      worked = ProcessNext();
    } catch (const ImxupError& e) {
      log->error("Queue worker: {}", e.Reason());
    }
    if (worked) continue;

    std::unique_lock<std::mutex> lock(worker_mtx_);
    if (stopping_) return;
    // Enqueue wakes us early
    worker_cv_.wait_for(lock, options_.idle_poll_);
  }
}

auto QueueManager::RunUntilEmpty() -> size_t {
  Recover();
  StartTracker();
  size_t processed = 0;
  while (ProcessNext()) ++processed;
  StopTracker();
  return processed;
}

auto QueueManager::ProcessNext() -> bool {
  auto item = store_->ClaimNextQueued();
  if (!item.has_value()) return false;
  ProcessGallery(*item);
  return true;
}

auto QueueManager::Stats() -> QueueStats { return store_->GetStats(); }

void QueueManager::PublishStats() {
  if (!bus_) return;
  try {
    bus_->Publish(QueueStatsChanged{store_->GetStats()});
  } catch (const ImxupError& e) {
    Logger::Get(LogCategory::QUEUE)->warn("Queue statistics unavailable: {}", e.Reason());
  }
}

/**
 * @brief Create a pending host upload for every file host listening to event, unless that host
 * already has a live or finished record for the gallery.
 */
void QueueManager::FireTriggers(TriggerEvent event, const gallery_key_t& path) {
  if (registry_ == nullptr) return;
  auto hosts = registry_->ByTrigger(event);
  if (hosts.empty()) return;

  auto log      = Logger::Get(LogCategory::FILE_HOSTS);
  auto existing = store_->GetHostUploads(path);
  bool added    = false;
  for (const auto* host : hosts) {
    if (!host->enabled_) continue;
    bool covered = std::any_of(existing.begin(), existing.end(), [host](const auto& record) {
      return record.host_name_ == host->id_ && record.status_ != HostUploadStatus::FAILED &&
             record.status_ != HostUploadStatus::CANCELLED;
    });
    if (covered) continue;

    auto record = store_->AddHostUpload(path, host->id_);
    log->info("Queued {} upload for {}", host->name_, path);
    if (bus_) bus_->Publish(HostUploadChanged{record});
    added = true;
  }
  if (added && file_hosts_ && options_.auto_start_file_hosts_) file_hosts_->Notify();
}

auto QueueManager::ResultStatus(const UploadResult& result) -> GalleryStatus {
  if (result.fatal_error_.has_value()) return GalleryStatus::FAILED;
  if (result.stopped_) return GalleryStatus::PAUSED;
  if (result.failed_count_ > 0) {
    return result.successful_count_ > 0 ? GalleryStatus::INCOMPLETE : GalleryStatus::FAILED;
  }
  return GalleryStatus::COMPLETED;
}

auto QueueManager::BuildOptions(const GalleryItem& item, const HostConfig* host)
    -> EngineOptions {
  EngineOptions options;
  options.folder_path_         = item.path_;
  options.gallery_name_        = host != nullptr ? host->SanitizeGalleryName(item.name_,
                                                                             FolderName(item.path_))
                                                 : item.name_;
  options.thumbnail_size_      = options_.thumbnail_size_;
  options.thumbnail_format_    = options_.thumbnail_format_;
  options.max_retries_         = options_.max_retries_;
  options.parallel_batch_size_ = options_.parallel_batch_size_;
  options.retry_delay_         = options_.retry_delay_;
  if (host != nullptr) options.max_file_size_mb_ = host->max_file_size_mb_;
  options.template_name_ =
      item.template_name_.empty() ? options_.template_name_ : item.template_name_;

  for (auto& name : store_->LoadUploadedFileNames(item.path_)) {
    options.already_uploaded_.insert(std::move(name));
  }
  if (!item.gallery_id_.empty()) {
    options.existing_gallery_id_  = item.gallery_id_;
    options.existing_gallery_url_ = item.gallery_url_;
  }
  if (item.dimensions_.sampled_ > 0) options.precalculated_dimensions_ = item.dimensions_;
  for (const auto& image : store_->LoadImages(item.path_)) {
    if (image.width_ > 0 && image.height_ > 0) {
      options.image_dimensions_[image.file_name_] = {image.width_, image.height_};
    }
  }

  const auto path      = item.path_;
  options.on_progress_ = [this, path](uint32_t completed, uint32_t total, uint32_t percent,
                                      const std::string& current_file) {
    if (bus_) bus_->Publish(ProgressUpdated{path, completed, total, percent, current_file});
  };
  options.on_image_uploaded_ = [this, path](const std::string& file_name,
                                            const UploadedImage& image, uint64_t size_bytes) {
    store_->MarkImageUploaded(path, file_name, image.image_id_, image.image_url_,
                              image.thumb_url_);
    if (bus_) bus_->Publish(ImageUploaded{path, file_name, image.image_url_, size_bytes});
  };
  return options;
}

void QueueManager::ProcessGallery(const GalleryItem& item) {
  auto log = Logger::Get(LogCategory::QUEUE);
  log->info("Uploading {} ({} images)", item.name_, item.total_images_);
  if (bus_) bus_->Publish(GalleryStarted{item.path_, item.name_, item.total_images_});
  PublishStats();
  FireTriggers(TriggerEvent::STARTED, item.path_);

  std::shared_ptr<ImageHostClient> client;
  try {
    client = image_hosts_(item.image_host_id_);
    if (!client) {
      throw ValidationError("Image host not configured: " + item.image_host_id_);
    }
  } catch (const ImxupError& e) {
    log->error("Cannot upload {}: {}", item.name_, e.Reason());
    store_->UpdateStatus(item.path_, GalleryStatus::FAILED, e.Reason());
    if (bus_) bus_->Publish(GalleryFailed{item.path_, e.Reason()});
    PublishStats();
    return;
  }

  auto token = std::make_shared<CancellationToken>();
  {
    std::lock_guard<std::mutex> lock(running_mtx_);
    running_[item.path_] = token;
    if (pause_requests_.erase(item.path_) > 0) token->Cancel();
  }
  UploadResult result;
  try {
    auto options       = BuildOptions(item, ImageHostConfig(item.image_host_id_));
    options.soft_stop_ = token;
    UploadEngine engine(client, global_bytes_, std::make_shared<AtomicCounter>());
    result = engine.Run(options);
  } catch (const ImxupError& e) {
    result.fatal_error_ = EngineError{e.Kind(), e.Reason(), e.Details()};
  }
  {
    std::lock_guard<std::mutex> lock(running_mtx_);
    running_.erase(item.path_);
    pause_requests_.erase(item.path_);
  }

  try {
    PersistResult(item, result);
  } catch (const ImxupError& e) {
    log->error("Cannot record the outcome of {}: {}", item.name_, e.Reason());
    try {
      store_->UpdateStatus(item.path_, GalleryStatus::FAILED, e.Reason());
    } catch (const ImxupError& inner) {
      log->error("{} stays uploading until the next start: {}", item.name_, inner.Reason());
    }
  }
  PublishStats();
}

void QueueManager::PersistResult(const GalleryItem& item, const UploadResult& result) {
  auto log     = Logger::Get(LogCategory::QUEUE);
  auto current = store_->Get(item.path_);
  if (!current.has_value()) {
    log->warn("{} was removed while uploading", item.path_);
    return;
  }

  auto status               = ResultStatus(result);
  current->uploaded_images_ = result.successful_count_;
  current->failed_images_   = result.failed_count_;
  current->failed_files_    = result.failed_details_;
  uint64_t uploaded_size    = 0;
  for (const auto& image : store_->LoadImages(item.path_)) {
    if (image.uploaded_) uploaded_size += image.size_bytes_;
  }
  current->uploaded_size_ = uploaded_size;
  if (!result.gallery_id_.empty()) current->gallery_id_ = result.gallery_id_;
  if (!result.gallery_url_.empty()) current->gallery_url_ = result.gallery_url_;
  if (result.dimensions_.sampled_ > 0) current->dimensions_ = result.dimensions_;
  store_->UpdateGallery(*current);

  std::string message;
  if (result.fatal_error_.has_value()) {
    message = result.fatal_error_->reason_;
  } else if (status == GalleryStatus::INCOMPLETE || status == GalleryStatus::FAILED) {
    message = std::format("{} of {} images failed", result.failed_count_, result.total_images_);
  }
  store_->UpdateStatus(item.path_, status, message);
  current->status_        = status;
  current->error_message_ = message;

  if (result.needs_rename_ && !result.gallery_id_.empty()) {
    UnnamedGallery entry;
    entry.gallery_id_    = result.gallery_id_;
    entry.intended_name_ = result.gallery_name_;
    entry.gallery_path_  = item.path_;
    store_->AddUnnamedGallery(entry);
  }

  switch (status) {
    case GalleryStatus::COMPLETED:
    case GalleryStatus::INCOMPLETE:
      if (bus_) {
        bus_->Publish(GalleryCompleted{item.path_, current->gallery_url_, result.successful_count_,
                                       result.failed_count_, status});
      }
      break;
    case GalleryStatus::PAUSED:
      if (bus_) {
        bus_->Publish(GalleryPaused{item.path_, result.successful_count_, result.total_images_});
      }
      break;
    default:
      if (bus_) bus_->Publish(GalleryFailed{item.path_, message});
      break;
  }

  if (status == GalleryStatus::COMPLETED) FireTriggers(TriggerEvent::COMPLETED, item.path_);
  if (completion_ && (status == GalleryStatus::COMPLETED || status == GalleryStatus::INCOMPLETE ||
                      result.needs_rename_)) {
    completion_->Submit(CompletionJob{*current, result});
  }
}
};  // namespace imxup
