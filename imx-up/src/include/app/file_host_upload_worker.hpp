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
#include <string>
#include <thread>

#include "app/event_bus.hpp"
#include "concurrency/atomic_counter.hpp"
#include "concurrency/cancellation_token.hpp"
#include "host/host_client.hpp"
#include "queue/host_upload.hpp"
#include "storage/controller/queue/queue_store.hpp"
#include "type/type.hpp"

namespace imxup {
/**
 * @brief Supplies the archive of a gallery for one file host. Building archives happens
 * elsewhere; the worker only needs a file to stream.
 */
class ArchiveProvider {
 public:
  virtual ~ArchiveProvider() = default;
  virtual auto PrepareArchive(const gallery_key_t& gallery_path, const std::string& host_id)
      -> file_path_t                                  = 0;
  // Called once the upload of path finished, whatever the outcome
  virtual void ReleaseArchive(const file_path_t&) {}
};

/**
 * @brief Uses an archive that already sits next to the gallery folder: "<folder>.zip", then
 * "<folder>.7z".
 */
class SiblingArchiveProvider final : public ArchiveProvider {
 public:
  auto PrepareArchive(const gallery_key_t& gallery_path, const std::string& host_id)
      -> file_path_t override;
};

struct FileHostWorkerOptions {
  std::chrono::milliseconds retry_delay_{1000};
  std::chrono::milliseconds poll_interval_{1000};
  // Minimum gap between two persisted progress updates of one record
  std::chrono::milliseconds progress_interval_{500};
};

/**
 * @brief Drives pending host upload records to a terminal status. Records of one host run at
 * most max_connections at a time; different hosts proceed independently.
 */
class FileHostUploadWorker {
 public:
  using ClientProvider = std::function<std::shared_ptr<HostClient>(const std::string& host_id)>;

  FileHostUploadWorker(std::shared_ptr<QueueStore> store, ClientProvider clients,
                       std::shared_ptr<ArchiveProvider> archives, std::shared_ptr<EventBus> bus,
                       std::shared_ptr<AtomicCounter> global_bytes,
                       FileHostWorkerOptions          options = {});
  ~FileHostUploadWorker();

  FileHostUploadWorker(const FileHostUploadWorker&)            = delete;
  FileHostUploadWorker& operator=(const FileHostUploadWorker&) = delete;

  void Start();
  void Stop();
  // Wake the background thread; new records were added
  void Notify();

  /**
   * @brief Process pending records on the calling thread until none is left.
   *
   * @return number of records taken out of pending
   */
  auto ProcessPending() -> size_t;

  /**
   * @brief Cancel a record. A pending one is cancelled right away; a running one stops at its
   * next chunk.
   */
  auto Cancel(host_upload_id_t id) -> bool;

  // Manual retry: failed back to pending
  auto Retry(host_upload_id_t id) -> HostUploadRecord;

 private:
  void                                  Loop();
  void                                  ProcessRecord(const HostUploadRecord& record,
                                                      HostClient&             client);
  void                                  UploadArchive(const HostUploadRecord& record,
                                                      HostClient& client, const file_path_t& archive,
                                                      const CancellationToken& cancel);
  void                                  Publish(const HostUploadRecord& record);
  void                                  FailRecord(host_upload_id_t id, const std::string& reason);

  std::shared_ptr<QueueStore>           store_;
  ClientProvider                        clients_;
  std::shared_ptr<ArchiveProvider>      archives_;
  std::shared_ptr<EventBus>             bus_;
  std::shared_ptr<AtomicCounter>        global_bytes_;
  FileHostWorkerOptions                 options_;

  std::mutex                            process_mtx_;

  std::mutex                            active_mtx_;
  std::map<host_upload_id_t, std::shared_ptr<CancellationToken>> active_;

  std::mutex                            loop_mtx_;
  std::condition_variable               loop_cv_;
  bool                                  stop_     = false;
  bool                                  notified_ = false;
  std::thread                           thread_;
};
};  // namespace imxup
