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

#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "queue/gallery_item.hpp"
#include "queue/host_upload.hpp"
#include "storage/controller/controller_types.hpp"
#include "storage/controller/db_controller.hpp"
#include "storage/service/queue/auxiliary_service.hpp"
#include "storage/service/queue/gallery_image_service.hpp"
#include "storage/service/queue/gallery_service.hpp"
#include "storage/service/queue/host_upload_service.hpp"
#include "storage/service/queue/tab_service.hpp"
#include "type/type.hpp"
#include "utils/id/id_generator.hpp"

namespace imxup {
/**
 * @brief The durable source of truth for galleries, their images, tabs, file host uploads,
 * unnamed galleries and settings.
 *
 * All mutations go through one writer connection guarded by a mutex. Reads open their own
 * short-lived connection, so listing the queue never waits for the worker pool. Every multi-row
 * mutation runs in a single transaction.
 */
class QueueStore {
 public:
  explicit QueueStore(std::shared_ptr<DBController> db);

  QueueStore(const QueueStore&)            = delete;
  QueueStore& operator=(const QueueStore&) = delete;

  // Galleries
  void BulkUpsert(const std::vector<GalleryItem>& items);
  auto LoadAll() -> std::vector<GalleryItem>;
  auto LoadByTab(const std::string& tab_name) -> std::vector<GalleryItem>;
  auto Get(const gallery_key_t& path) -> std::optional<GalleryItem>;
  auto DeleteByPaths(const std::vector<gallery_key_t>& paths) -> size_t;
  void UpdateInsertionOrders(const std::vector<gallery_key_t>& ordered_paths);

  /**
   * @brief Overwrite every column of an existing gallery. The insertion order and added
   * timestamp stored in the database win over the ones in item.
   */
  void UpdateGallery(const GalleryItem& item);

  /**
   * @brief Move a gallery to a new status. Invalid lifecycle transitions throw ValidationError.
   */
  void UpdateStatus(const gallery_key_t& path, GalleryStatus status,
                    const std::string& error_message = {});

  /**
   * @brief Compare-and-set from queued to uploading on the first queued gallery in insertion
   * order. A gallery is handed to one caller only.
   */
  auto ClaimNextQueued() -> std::optional<GalleryItem>;
  // Move path from expected to status; false when it is gone or no longer in expected
  auto SetStatusIf(const gallery_key_t& path, GalleryStatus expected, GalleryStatus status)
      -> bool;
  auto ClaimGallery(const gallery_key_t& path) -> bool;

  // Galleries left uploading by a previous process become incomplete; returns their count
  auto RecoverInterrupted() -> size_t;
  auto ClearByStatus(const std::vector<GalleryStatus>& statuses) -> size_t;
  auto GetStats() -> QueueStats;

  // Images
  void ReplaceImages(const gallery_key_t& path, const std::vector<ImageRecord>& images);
  auto LoadImages(const gallery_key_t& path) -> std::vector<ImageRecord>;
  void MarkImageUploaded(const gallery_key_t& path, const std::string& file_name,
                         const std::string& remote_id, const std::string& image_url,
                         const std::string& thumb_url);
  auto LoadUploadedFileNames(const gallery_key_t& path) -> std::vector<std::string>;

  // Tabs
  auto LoadTabs() -> std::vector<Tab>;
  auto CreateTab(const std::string& name) -> Tab;
  void RenameTab(const std::string& old_name, const std::string& new_name);
  auto DeleteTab(const std::string& name, const std::string& target = kDefaultTabName) -> size_t;
  auto MoveToTab(const std::vector<gallery_key_t>& paths, const std::string& tab_name) -> size_t;

  // File host uploads
  auto AddHostUpload(const gallery_key_t& path, const std::string& host_name)
      -> HostUploadRecord;
  auto GetHostUploads(const gallery_key_t& path) -> std::vector<HostUploadRecord>;
  auto GetHostUpload(host_upload_id_t id) -> std::optional<HostUploadRecord>;
  auto GetAllHostUploadsBatch() -> std::map<gallery_key_t, std::vector<HostUploadRecord>>;
  auto GetPendingHostUploads() -> std::vector<HostUploadRecord>;
  auto UpdateHostUpload(host_upload_id_t id, const HostUploadUpdate& update) -> HostUploadRecord;
  /**
   * @brief Apply update only while the record is still in expected. Returns nullopt when the
   * record is missing or has moved on.
   */
  auto UpdateHostUploadIf(host_upload_id_t id, HostUploadStatus expected,
                          const HostUploadUpdate& update) -> std::optional<HostUploadRecord>;
  auto DeleteHostUpload(host_upload_id_t id) -> bool;
  auto RecoverInterruptedHostUploads() -> size_t;

  // Unnamed galleries
  void AddUnnamedGallery(const UnnamedGallery& entry);
  auto LoadUnnamedGalleries() -> std::vector<UnnamedGallery>;
  void RemoveUnnamedGallery(const std::string& gallery_id);
  void BumpUnnamedAttempts(const std::string& gallery_id);

  // Settings
  auto GetSetting(const std::string& key) -> std::optional<nlohmann::json>;
  void SetSetting(const std::string& key, const nlohmann::json& value);

 private:
  void                          EnsureDefaultTab();
  auto                          ReaderGuard() -> ConnectionGuard;

  std::shared_ptr<DBController> _db;

  std::mutex                    _write_mutex;
  ConnectionGuard               _writer;
  GalleryService                _galleries;
  GalleryImageService           _images;
  TabService                    _tabs;
  HostUploadService             _host_uploads;
  UnnamedGalleryService         _unnamed;
  SettingService                _settings;

  IncrID::IDGenerator<host_upload_id_t> _host_upload_ids{0};
};
};  // namespace imxup
