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

#include "storage/controller/queue/queue_store.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <set>
#include <string>
#include <utility>

#include "type/errors.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/log/logger.hpp"
#include "utils/string/string_utils.hpp"

namespace imxup {
namespace {
/**
 * @brief Run a storage operation and turn any lower level failure into a StorageError. Errors
 * of the imxup hierarchy pass through untouched.
 */
template <typename Fn>
auto RunStorage(const std::string& operation, const std::vector<std::string>& keys, Fn&& fn)
    -> decltype(fn()) {
  try {
    return fn();
  } catch (const ImxupError&) {
    throw;
  } catch (const std::exception& e) {
    Logger::Get(LogCategory::STORAGE)->error("{} failed: {}", operation, e.what());
    throw StorageError(operation + " failed", e.what(), keys);
  }
}

auto IsTerminal(GalleryStatus status) -> bool {
  return status == GalleryStatus::COMPLETED || status == GalleryStatus::FAILED;
}

auto IsTerminal(HostUploadStatus status) -> bool {
  return status == HostUploadStatus::COMPLETED || status == HostUploadStatus::FAILED ||
         status == HostUploadStatus::CANCELLED;
}

/**
 * @brief Apply update to record in memory. Status changes must follow the host upload
 * lifecycle; a move from failed back to pending counts as a retry.
 */
void ApplyHostUploadUpdate(HostUploadRecord& record, const HostUploadUpdate& update) {
  if (update.status_.has_value() && *update.status_ != record.status_) {
    auto from = record.status_;
    auto to   = *update.status_;
    if (!IsValidHostUploadTransition(from, to)) {
      throw ValidationError(std::format("Host upload cannot move from {} to {}",
                                        HostUploadStatusToString(from),
                                        HostUploadStatusToString(to)));
    }
    record.status_ = to;
    if (to == HostUploadStatus::UPLOADING) {
      record.started_ts_ = TimeProvider::NowUnix();
    } else if (IsTerminal(to)) {
      record.finished_ts_ = TimeProvider::NowUnix();
    } else if (from == HostUploadStatus::FAILED && to == HostUploadStatus::PENDING) {
      ++record.retry_count_;
      record.uploaded_bytes_ = 0;
      record.error_message_.clear();
      record.finished_ts_ = 0;
    }
  }
  if (update.uploaded_bytes_) record.uploaded_bytes_ = *update.uploaded_bytes_;
  if (update.total_bytes_) record.total_bytes_ = *update.total_bytes_;
  if (update.download_url_) record.download_url_ = *update.download_url_;
  if (update.file_id_) record.file_id_ = *update.file_id_;
  if (update.orphaned_file_id_) record.orphaned_file_id_ = *update.orphaned_file_id_;
  if (update.error_message_) record.error_message_ = *update.error_message_;
  if (update.retry_count_) record.retry_count_ = *update.retry_count_;
}
}  // namespace

/**
 * @brief Construct a new QueueStore object. The default tab is created on first use of a
 * database.
 *
 * @param db
 */
QueueStore::QueueStore(std::shared_ptr<DBController> db)
    : _db(std::move(db)),
      _writer(_db->GetConnectionGuard()),
      _galleries(_writer._conn),
      _images(_writer._conn),
      _tabs(_writer._conn),
      _host_uploads(_writer._conn),
      _unnamed(_writer._conn),
      _settings(_writer._conn) {
  EnsureDefaultTab();
  std::lock_guard<std::mutex> lock(_write_mutex);
  RunStorage("Seed host upload ids", {},
             [&] { _host_upload_ids.Observe(_host_uploads.MaxId()); });
}

auto QueueStore::ReaderGuard() -> ConnectionGuard { return _db->GetConnectionGuard(); }

void QueueStore::EnsureDefaultTab() {
  std::lock_guard<std::mutex> lock(_write_mutex);
  RunStorage("Create default tab", {kDefaultTabName}, [&] {
    if (_tabs.GetByName(kDefaultTabName).has_value()) return;
    _tabs.Insert(Tab{_tabs.MaxId() + 1, kDefaultTabName, 0, true, TimeProvider::NowUnix()});
    Logger::Get(LogCategory::STORAGE)->info("Created default tab '{}'", kDefaultTabName);
  });
}

/**
 * @brief Insert or update galleries by path. Existing rows keep their insertion order, new rows
 * are appended after the current maximum. Either every item is applied or none is.
 *
 * @param items
 */
void QueueStore::BulkUpsert(const std::vector<GalleryItem>& items) {
  if (items.empty()) return;

  std::vector<std::string> keys;
  keys.reserve(items.size());
  for (const auto& item : items) keys.push_back(item.path_);

  std::lock_guard<std::mutex> lock(_write_mutex);
  RunStorage("Bulk upsert", keys, [&] {
    std::set<std::string> known_tabs;
    for (const auto& tab : _tabs.GetAllOrdered()) known_tabs.insert(tab.name_);

    TransactionGuard  tx(_writer._conn);
    insertion_order_t next_order = _galleries.MaxInsertionOrder();
    for (const auto& source : items) {
      if (source.path_.empty()) {
        throw ValidationError("Gallery path must not be empty");
      }
      GalleryItem item = source;
      if (item.tab_name_.empty()) item.tab_name_ = kDefaultTabName;
      if (!known_tabs.contains(item.tab_name_)) {
        throw ValidationError(std::format("Unknown tab '{}'", item.tab_name_), item.path_);
      }

      auto existing = _galleries.GetByPath(item.path_);
      if (existing.has_value()) {
        item.insertion_order_ = existing->insertion_order_;
        if (item.added_ts_ == 0) item.added_ts_ = existing->added_ts_;
        _galleries.Update(item, item.path_);
      } else {
        item.insertion_order_ = ++next_order;
        if (item.added_ts_ == 0) item.added_ts_ = TimeProvider::NowUnix();
        _galleries.Insert(item);
      }
    }
    tx.Commit();
  });
  Logger::Get(LogCategory::STORAGE)->debug("Upserted {} galleries", items.size());
}

auto QueueStore::LoadAll() -> std::vector<GalleryItem> {
  return RunStorage("Load galleries", {}, [&] {
    auto           guard = ReaderGuard();
    GalleryService service{guard._conn};
    return service.GetAllOrdered();
  });
}

auto QueueStore::LoadByTab(const std::string& tab_name) -> std::vector<GalleryItem> {
  return RunStorage("Load tab galleries", {}, [&] {
    auto           guard = ReaderGuard();
    GalleryService service{guard._conn};
    return service.GetByTab(tab_name);
  });
}

auto QueueStore::Get(const gallery_key_t& path) -> std::optional<GalleryItem> {
  return RunStorage("Load gallery", {path}, [&] {
    auto           guard = ReaderGuard();
    GalleryService service{guard._conn};
    return service.GetByPath(path);
  });
}

/**
 * @brief Delete galleries and their image rows. File host upload rows are kept. A gallery that
 * a worker holds (uploading) is left alone.
 *
 * @param paths
 * @return number of galleries removed
 */
auto QueueStore::DeleteByPaths(const std::vector<gallery_key_t>& paths) -> size_t {
  if (paths.empty()) return 0;
  std::lock_guard<std::mutex> lock(_write_mutex);
  return RunStorage("Delete galleries", paths, [&] {
    TransactionGuard tx(_writer._conn);
    size_t           removed = 0;
    for (const auto& path : paths) {
      auto item = _galleries.GetByPath(path);
      if (!item.has_value()) continue;
      if (item->status_ == GalleryStatus::UPLOADING) {
        Logger::Get(LogCategory::STORAGE)->warn("Not deleting {} while it uploads", path);
        continue;
      }
      _images.RemoveById(path);
      removed += _galleries.RemoveById(path);
    }
    tx.Commit();
    return removed;
  });
}

/**
 * @brief Give every listed gallery the insertion order of its position (1-based). An unknown
 * path aborts the whole reorder and the previous order stays in place.
 *
 * @param ordered_paths
 */
void QueueStore::UpdateInsertionOrders(const std::vector<gallery_key_t>& ordered_paths) {
  std::lock_guard<std::mutex> lock(_write_mutex);
  RunStorage("Reorder galleries", ordered_paths, [&] {
    TransactionGuard tx(_writer._conn);
    for (size_t i = 0; i < ordered_paths.size(); ++i) {
      if (_galleries.SetInsertionOrder(ordered_paths[i], static_cast<insertion_order_t>(i + 1)) !=
          1) {
        throw StorageError("Reorder galleries failed", "unknown gallery " + ordered_paths[i],
                           ordered_paths);
      }
    }
    tx.Commit();
  });
}

void QueueStore::UpdateGallery(const GalleryItem& item) {
  std::lock_guard<std::mutex> lock(_write_mutex);
  RunStorage("Update gallery", {item.path_}, [&] {
    auto existing = _galleries.GetByPath(item.path_);
    if (!existing.has_value()) {
      throw StorageError("Update gallery failed", "unknown gallery " + item.path_, {item.path_});
    }
    GalleryItem merged      = item;
    merged.insertion_order_ = existing->insertion_order_;
    merged.added_ts_        = existing->added_ts_;
    _galleries.Update(merged, merged.path_);
  });
}

void QueueStore::UpdateStatus(const gallery_key_t& path, GalleryStatus status,
                              const std::string& error_message) {
  std::lock_guard<std::mutex> lock(_write_mutex);
  RunStorage("Update gallery status", {path}, [&] {
    auto item = _galleries.GetByPath(path);
    if (!item.has_value()) {
      throw StorageError("Update gallery status failed", "unknown gallery " + path, {path});
    }
    if (!IsValidGalleryTransition(item->status_, status)) {
      throw ValidationError(std::format("Gallery cannot move from {} to {}",
                                        GalleryStatusToString(item->status_),
                                        GalleryStatusToString(status)),
                            path);
    }
    item->status_        = status;
    item->error_message_ = error_message;
    item->finished_ts_   = IsTerminal(status) ? TimeProvider::NowUnix() : 0;
    _galleries.Update(*item, path);
  });
}

auto QueueStore::SetStatusIf(const gallery_key_t& path, GalleryStatus expected,
                             GalleryStatus status) -> bool {
  if (!IsValidGalleryTransition(expected, status)) {
    throw ValidationError(std::format("Gallery cannot move from {} to {}",
                                      GalleryStatusToString(expected),
                                      GalleryStatusToString(status)),
                          path);
  }
  std::lock_guard<std::mutex> lock(_write_mutex);
  return RunStorage("Update gallery status", {path}, [&] {
    auto item = _galleries.GetByPath(path);
    if (!item.has_value() || item->status_ != expected) return false;
    item->status_ = status;
    item->error_message_.clear();
    item->finished_ts_ = IsTerminal(status) ? TimeProvider::NowUnix() : 0;
    _galleries.Update(*item, path);
    return true;
  });
}

auto QueueStore::ClaimNextQueued() -> std::optional<GalleryItem> {
  std::lock_guard<std::mutex> lock(_write_mutex);
  return RunStorage("Claim gallery", {}, [&]() -> std::optional<GalleryItem> {
    for (auto& item : _galleries.GetByStatus(GalleryStatus::QUEUED)) {
      if (_galleries.SetStatusIf(item.path_, GalleryStatus::QUEUED, GalleryStatus::UPLOADING)) {
        item.status_ = GalleryStatus::UPLOADING;
        return std::move(item);
      }
    }
    return std::nullopt;
  });
}

auto QueueStore::ClaimGallery(const gallery_key_t& path) -> bool {
  std::lock_guard<std::mutex> lock(_write_mutex);
  return RunStorage("Claim gallery", {path}, [&] {
    return _galleries.SetStatusIf(path, GalleryStatus::QUEUED, GalleryStatus::UPLOADING);
  });
}

auto QueueStore::RecoverInterrupted() -> size_t {
  std::lock_guard<std::mutex> lock(_write_mutex);
  return RunStorage("Recover interrupted galleries", {}, [&] {
    size_t recovered = 0;
    for (const auto& item : _galleries.GetByStatus(GalleryStatus::UPLOADING)) {
      if (_galleries.SetStatusIf(item.path_, GalleryStatus::UPLOADING,
                                 GalleryStatus::INCOMPLETE)) {
        ++recovered;
      }
    }
    if (recovered > 0) {
      Logger::Get(LogCategory::STORAGE)
          ->warn("{} galleries were left uploading and are now incomplete", recovered);
    }
    return recovered;
  });
}

auto QueueStore::ClearByStatus(const std::vector<GalleryStatus>& statuses) -> size_t {
  std::vector<gallery_key_t> paths;
  for (const auto& item : LoadAll()) {
    if (std::find(statuses.begin(), statuses.end(), item.status_) != statuses.end()) {
      paths.push_back(item.path_);
    }
  }
  return DeleteByPaths(paths);
}

auto QueueStore::GetStats() -> QueueStats {
  QueueStats stats;
  for (const auto& item : LoadAll()) {
    ++stats.by_status_[item.status_];
    ++stats.total_galleries_;
    stats.total_images_ += item.total_images_;
    stats.total_bytes_ += item.total_size_;
    stats.uploaded_bytes_ += item.uploaded_size_;
  }
  return stats;
}

/**
 * @brief Replace the image rows of a gallery, used after every scan.
 *
 * @param path
 * @param images
 */
void QueueStore::ReplaceImages(const gallery_key_t& path, const std::vector<ImageRecord>& images) {
  std::lock_guard<std::mutex> lock(_write_mutex);
  RunStorage("Replace images", {path}, [&] {
    TransactionGuard tx(_writer._conn);
    _images.RemoveById(path);
    for (const auto& image : images) {
      ImageRecord record   = image;
      record.gallery_path_ = path;
      _images.Insert(record);
    }
    tx.Commit();
  });
}

auto QueueStore::LoadImages(const gallery_key_t& path) -> std::vector<ImageRecord> {
  return RunStorage("Load images", {path}, [&] {
    auto                guard = ReaderGuard();
    GalleryImageService service{guard._conn};
    return service.GetByGallery(path);
  });
}

void QueueStore::MarkImageUploaded(const gallery_key_t& path, const std::string& file_name,
                                   const std::string& remote_id, const std::string& image_url,
                                   const std::string& thumb_url) {
  std::lock_guard<std::mutex> lock(_write_mutex);
  RunStorage("Mark image uploaded", {path}, [&] {
    _images.MarkUploaded(path, file_name, remote_id, image_url, thumb_url);
  });
}

auto QueueStore::LoadUploadedFileNames(const gallery_key_t& path) -> std::vector<std::string> {
  return RunStorage("Load uploaded images", {path}, [&] {
    auto                guard = ReaderGuard();
    GalleryImageService service{guard._conn};
    return service.GetUploadedNames(path);
  });
}

auto QueueStore::LoadTabs() -> std::vector<Tab> {
  return RunStorage("Load tabs", {}, [&] {
    auto       guard = ReaderGuard();
    TabService service{guard._conn};
    return service.GetAllOrdered();
  });
}

auto QueueStore::CreateTab(const std::string& name) -> Tab {
  auto trimmed = strutil::Trim(name);
  if (trimmed.empty()) {
    throw ValidationError("Tab name must not be empty");
  }

  std::lock_guard<std::mutex> lock(_write_mutex);
  return RunStorage("Create tab", {trimmed}, [&] {
    if (_tabs.GetByName(trimmed).has_value()) {
      throw StorageError(std::format("Tab '{}' already exists", trimmed), "uniqueness violation",
                         {trimmed});
    }
    auto tabs = _tabs.GetAllOrdered();
    Tab  tab{_tabs.MaxId() + 1, trimmed, tabs.empty() ? 0 : tabs.back().display_order_ + 1, false,
            TimeProvider::NowUnix()};
    _tabs.Insert(tab);
    Logger::Get(LogCategory::STORAGE)->info("Created tab '{}'", trimmed);
    return tab;
  });
}

void QueueStore::RenameTab(const std::string& old_name, const std::string& new_name) {
  auto trimmed = strutil::Trim(new_name);
  if (trimmed.empty()) {
    throw ValidationError("Tab name must not be empty");
  }

  std::lock_guard<std::mutex> lock(_write_mutex);
  RunStorage("Rename tab", {old_name}, [&] {
    auto tab = _tabs.GetByName(old_name);
    if (!tab.has_value()) {
      throw ValidationError(std::format("Unknown tab '{}'", old_name));
    }
    if (tab->is_default_) {
      throw ValidationError(std::format("The default tab '{}' cannot be renamed", old_name));
    }
    if (trimmed == old_name) return;
    if (_tabs.GetByName(trimmed).has_value()) {
      throw StorageError(std::format("Tab '{}' already exists", trimmed), "uniqueness violation",
                         {trimmed});
    }

    TransactionGuard tx(_writer._conn);
    duckorm::execute(_writer._conn, "UPDATE Tab SET name = ? WHERE id = ?;",
                     {trimmed, static_cast<int64_t>(tab->id_)});
    _galleries.ReassignTab(old_name, trimmed);
    tx.Commit();
  });
}

/**
 * @brief Delete a tab and move its galleries to target.
 *
 * @param name
 * @param target
 * @return number of galleries reassigned
 */
auto QueueStore::DeleteTab(const std::string& name, const std::string& target) -> size_t {
  std::lock_guard<std::mutex> lock(_write_mutex);
  return RunStorage("Delete tab", {name}, [&] {
    auto tab = _tabs.GetByName(name);
    if (!tab.has_value()) {
      throw ValidationError(std::format("Unknown tab '{}'", name));
    }
    if (tab->is_default_) {
      throw ValidationError(std::format("The default tab '{}' cannot be deleted", name));
    }
    if (target == name || !_tabs.GetByName(target).has_value()) {
      throw ValidationError(std::format("Invalid target tab '{}'", target));
    }

    TransactionGuard tx(_writer._conn);
    size_t           reassigned = _galleries.ReassignTab(name, target);
    _tabs.RemoveById(tab->id_);
    tx.Commit();
    Logger::Get(LogCategory::STORAGE)
        ->info("Deleted tab '{}', {} galleries moved to '{}'", name, reassigned, target);
    return reassigned;
  });
}

auto QueueStore::MoveToTab(const std::vector<gallery_key_t>& paths, const std::string& tab_name)
    -> size_t {
  std::lock_guard<std::mutex> lock(_write_mutex);
  return RunStorage("Move galleries", paths, [&] {
    if (!_tabs.GetByName(tab_name).has_value()) {
      throw ValidationError(std::format("Unknown tab '{}'", tab_name));
    }
    TransactionGuard tx(_writer._conn);
    size_t           moved = 0;
    for (const auto& path : paths) {
      moved += duckorm::execute(_writer._conn, "UPDATE Gallery SET tab_name = ? WHERE path = ?;",
                                {tab_name, path});
    }
    tx.Commit();
    return moved;
  });
}

/**
 * @brief Create the pending upload record of a gallery for one file host. A gallery keeps one
 * record per host; an existing record is returned as is.
 */
auto QueueStore::AddHostUpload(const gallery_key_t& path, const std::string& host_name)
    -> HostUploadRecord {
  std::lock_guard<std::mutex> lock(_write_mutex);
  return RunStorage("Add host upload", {path}, [&] {
    for (auto& record : _host_uploads.GetByGallery(path)) {
      if (record.host_name_ == host_name) return record;
    }
    HostUploadRecord record;
    record.id_           = _host_upload_ids.GenerateID();
    record.gallery_path_ = path;
    record.host_name_    = host_name;
    record.status_       = HostUploadStatus::PENDING;
    record.created_ts_   = TimeProvider::NowUnix();
    _host_uploads.Insert(record);
    Logger::Get(LogCategory::FILE_HOSTS)
        ->info("Queued {} upload #{} for {}", host_name, record.id_, path);
    return record;
  });
}

auto QueueStore::GetHostUploads(const gallery_key_t& path) -> std::vector<HostUploadRecord> {
  return RunStorage("Load host uploads", {path}, [&] {
    auto              guard = ReaderGuard();
    HostUploadService service{guard._conn};
    return service.GetByGallery(path);
  });
}

auto QueueStore::GetHostUpload(host_upload_id_t id) -> std::optional<HostUploadRecord> {
  return RunStorage("Load host upload", {std::to_string(id)}, [&] {
    auto              guard = ReaderGuard();
    HostUploadService service{guard._conn};
    return service.GetById(id);
  });
}

auto QueueStore::GetAllHostUploadsBatch()
    -> std::map<gallery_key_t, std::vector<HostUploadRecord>> {
  return RunStorage("Load host uploads", {}, [&] {
    auto                                                   guard = ReaderGuard();
    HostUploadService                                      service{guard._conn};
    std::map<gallery_key_t, std::vector<HostUploadRecord>> batch;
    for (auto& record : service.GetAllOrdered()) {
      batch[record.gallery_path_].push_back(std::move(record));
    }
    return batch;
  });
}

auto QueueStore::GetPendingHostUploads() -> std::vector<HostUploadRecord> {
  return RunStorage("Load pending host uploads", {}, [&] {
    auto              guard = ReaderGuard();
    HostUploadService service{guard._conn};
    return service.GetByStatus(HostUploadStatus::PENDING);
  });
}

/**
 * @brief Apply a partial update.
 *
 * @return the stored record after the update
 */
auto QueueStore::UpdateHostUpload(host_upload_id_t id, const HostUploadUpdate& update)
    -> HostUploadRecord {
  std::lock_guard<std::mutex> lock(_write_mutex);
  return RunStorage("Update host upload", {std::to_string(id)}, [&] {
    auto record = _host_uploads.GetById(id);
    if (!record.has_value()) {
      throw StorageError("Update host upload failed", std::format("unknown host upload #{}", id),
                         {std::to_string(id)});
    }

    ApplyHostUploadUpdate(*record, update);
    _host_uploads.Update(*record, id);
    return *record;
  });
}

auto QueueStore::UpdateHostUploadIf(host_upload_id_t id, HostUploadStatus expected,
                                    const HostUploadUpdate& update)
    -> std::optional<HostUploadRecord> {
  std::lock_guard<std::mutex> lock(_write_mutex);
  return RunStorage("Update host upload", {std::to_string(id)},
                    [&]() -> std::optional<HostUploadRecord> {
                      auto record = _host_uploads.GetById(id);
                      if (!record.has_value() || record->status_ != expected) return std::nullopt;
                      ApplyHostUploadUpdate(*record, update);
                      _host_uploads.Update(*record, id);
                      return record;
                    });
}

auto QueueStore::DeleteHostUpload(host_upload_id_t id) -> bool {
  std::lock_guard<std::mutex> lock(_write_mutex);
  return RunStorage("Delete host upload", {std::to_string(id)},
                    [&] { return _host_uploads.RemoveById(id) == 1; });
}

auto QueueStore::RecoverInterruptedHostUploads() -> size_t {
  std::lock_guard<std::mutex> lock(_write_mutex);
  return RunStorage("Recover interrupted host uploads", {}, [&] {
    size_t recovered = 0;
    for (auto& record : _host_uploads.GetByStatus(HostUploadStatus::UPLOADING)) {
      record.status_        = HostUploadStatus::FAILED;
      record.error_message_ = "Interrupted before completion";
      record.finished_ts_   = TimeProvider::NowUnix();
      recovered += _host_uploads.Update(record, record.id_);
    }
    return recovered;
  });
}

void QueueStore::AddUnnamedGallery(const UnnamedGallery& entry) {
  std::lock_guard<std::mutex> lock(_write_mutex);
  RunStorage("Add unnamed gallery", {entry.gallery_id_}, [&] {
    UnnamedGallery stored = entry;
    if (stored.queued_ts_ == 0) stored.queued_ts_ = TimeProvider::NowUnix();
    if (_unnamed.Update(stored, stored.gallery_id_) == 0) {
      _unnamed.Insert(stored);
    }
  });
}

auto QueueStore::LoadUnnamedGalleries() -> std::vector<UnnamedGallery> {
  return RunStorage("Load unnamed galleries", {}, [&] {
    auto                  guard = ReaderGuard();
    UnnamedGalleryService service{guard._conn};
    return service.GetAllOrdered();
  });
}

void QueueStore::RemoveUnnamedGallery(const std::string& gallery_id) {
  std::lock_guard<std::mutex> lock(_write_mutex);
  RunStorage("Remove unnamed gallery", {gallery_id}, [&] { _unnamed.RemoveById(gallery_id); });
}

void QueueStore::BumpUnnamedAttempts(const std::string& gallery_id) {
  std::lock_guard<std::mutex> lock(_write_mutex);
  RunStorage("Update unnamed gallery", {gallery_id}, [&] {
    duckorm::execute(_writer._conn,
                     "UPDATE UnnamedGallery SET attempts = attempts + 1 WHERE gallery_id = ?;",
                     {gallery_id});
  });
}

auto QueueStore::GetSetting(const std::string& key) -> std::optional<nlohmann::json> {
  auto raw = RunStorage("Load setting", {key}, [&] {
    auto           guard = ReaderGuard();
    SettingService service{guard._conn};
    return service.Get(key);
  });
  if (!raw.has_value()) return std::nullopt;
  try {
    return nlohmann::json::parse(*raw);
  } catch (const nlohmann::json::parse_error& e) {
    throw StorageError(std::format("Setting '{}' holds invalid JSON", key), e.what(), {key});
  }
}

void QueueStore::SetSetting(const std::string& key, const nlohmann::json& value) {
  std::lock_guard<std::mutex> lock(_write_mutex);
  RunStorage("Store setting", {key}, [&] { _settings.Put(key, value.dump()); });
}
};  // namespace imxup
