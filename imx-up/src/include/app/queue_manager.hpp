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
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "app/completion_worker.hpp"
#include "app/event_bus.hpp"
#include "app/file_host_upload_worker.hpp"
#include "app/upload_engine.hpp"
#include "concurrency/atomic_counter.hpp"
#include "concurrency/bandwidth_tracker.hpp"
#include "concurrency/cancellation_token.hpp"
#include "host/host_config.hpp"
#include "host/image_host_client.hpp"
#include "queue/gallery_item.hpp"
#include "storage/controller/queue/queue_store.hpp"
#include "type/type.hpp"

namespace imxup {
struct QueueManagerOptions {
  uint32_t                  worker_count_          = 1;
  std::string               image_host_id_         = "imx";
  std::string               template_name_         = "default";
  int                       thumbnail_size_        = 3;
  int                       thumbnail_format_      = 2;
  uint32_t                  max_retries_           = 3;
  uint32_t                  parallel_batch_size_   = 4;
  std::chrono::milliseconds retry_delay_{1000};
  bool                      auto_start_file_hosts_ = true;
  BandwidthOptions          bandwidth_{};
  // How long an idle worker sleeps before looking at the queue again
  std::chrono::milliseconds idle_poll_{500};
};

/**
 * @brief The worker pool. Claims queued galleries from the store, runs the engine on each, and
 * persists the outcome. Every transition is reported on the event bus.
 */
class QueueManager {
 public:
  using ImageHostProvider =
      std::function<std::shared_ptr<ImageHostClient>(const std::string& host_id)>;

  QueueManager(std::shared_ptr<QueueStore> store, ImageHostProvider image_hosts,
               const HostConfigRegistry* registry, std::shared_ptr<EventBus> bus,
               std::shared_ptr<CompletionWorker>     completion,
               std::shared_ptr<FileHostUploadWorker> file_hosts,
               std::shared_ptr<AtomicCounter>        global_bytes,
               QueueManagerOptions                   options = {});
  ~QueueManager();

  QueueManager(const QueueManager&)            = delete;
  QueueManager& operator=(const QueueManager&) = delete;

  /**
   * @brief Add folders to tab and scan them. Folders already in the queue are left alone.
   * name only applies when a single folder is added.
   */
  auto AddFolders(const std::vector<folder_path_t>& folders,
                  const std::string&                tab_name = kDefaultTabName,
                  const std::optional<std::string>& name = std::nullopt) -> std::vector<GalleryItem>;

  // Ready, paused, incomplete or failed -> queued. Unscanned galleries are scanned first.
  auto Enqueue(const gallery_key_t& path) -> GalleryItem;
  // Queue every ready gallery
  auto StartAll() -> size_t;
  // Explicit retry of a failed, incomplete or paused gallery
  auto Retry(const gallery_key_t& path) -> GalleryItem;
  // Soft-stop a running gallery, or pause a queued one
  void Pause(const gallery_key_t& path);
  // Running galleries are skipped
  auto Remove(const std::vector<gallery_key_t>& paths) -> size_t;

  void Start();
  /**
   * @brief Hard stop: workers take no new gallery. With pause_running the galleries in flight
   * are soft-stopped as well; otherwise they run to the end first.
   */
  void Stop(bool pause_running = false);

  // Process queued galleries on the calling thread until none is left
  auto RunUntilEmpty() -> size_t;
  auto ProcessNext() -> bool;

  auto GlobalBytes() const -> std::shared_ptr<AtomicCounter> { return global_bytes_; }
  auto Stats() -> QueueStats;

  static auto ResultStatus(const UploadResult& result) -> GalleryStatus;
  // Absolute, normalized, without a trailing separator
  static auto NormalizePath(const folder_path_t& folder) -> gallery_key_t;

 private:
  void                                  WorkerLoop();
  void                                  ProcessGallery(const GalleryItem& item);
  void                                  PersistResult(const GalleryItem& item,
                                                      const UploadResult& result);
  auto                                  BuildOptions(const GalleryItem& item,
                                                     const HostConfig* host) -> EngineOptions;
  void                                  FireTriggers(TriggerEvent event, const gallery_key_t& path);
  void                                  Recover();
  void                                  StartTracker();
  void                                  StopTracker();
  void                                  PublishStats();
  void                                  WakeWorkers();
  auto                                  ImageHostConfig(const std::string& host_id) const
      -> const HostConfig*;

  std::shared_ptr<QueueStore>           store_;
  ImageHostProvider                     image_hosts_;
  const HostConfigRegistry*             registry_;
  std::shared_ptr<EventBus>             bus_;
  std::shared_ptr<CompletionWorker>     completion_;
  std::shared_ptr<FileHostUploadWorker> file_hosts_;
  QueueManagerOptions                   options_;

  std::shared_ptr<AtomicCounter>        global_bytes_;
  std::unique_ptr<BandwidthTracker>     tracker_;

  std::mutex                            running_mtx_;
  std::map<gallery_key_t, std::shared_ptr<CancellationToken>> running_;
  // Pauses that arrived between a claim and its token registration
  std::set<gallery_key_t>               pause_requests_;

  std::mutex                            worker_mtx_;
  std::condition_variable               worker_cv_;
  bool                                  stopping_ = false;
  std::vector<std::thread>              workers_;
};
};  // namespace imxup
