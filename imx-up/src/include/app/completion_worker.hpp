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

#include <atomic>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

#include "app/upload_engine.hpp"
#include "host/image_host_client.hpp"
#include "queue/gallery_item.hpp"
#include "storage/controller/queue/queue_store.hpp"
#include "type/type.hpp"
#include "utils/queue/queue.hpp"

namespace imxup {
/**
 * @brief What a finished gallery hands to the post-processors: the stored gallery after its
 * terminal update, and the engine result that produced it.
 */
struct CompletionJob {
  GalleryItem  gallery_;
  UploadResult result_;
};

class PostProcessor {
 public:
  virtual ~PostProcessor()                              = default;
  virtual auto Name() const -> std::string              = 0;
  virtual void Process(const CompletionJob& job)        = 0;
};

/**
 * @brief Writes a JSON summary of every finished gallery into one directory.
 */
class ArtifactWriter final : public PostProcessor {
 public:
  explicit ArtifactWriter(folder_path_t output_dir);

  auto        Name() const -> std::string override { return "artifact_writer"; }
  void        Process(const CompletionJob& job) override;

  static auto BuildSummary(const CompletionJob& job) -> nlohmann::json;
  auto        ArtifactPath(const CompletionJob& job) const -> file_path_t;

 private:
  folder_path_t output_dir_;
};

/**
 * @brief Gives anonymous galleries their intended names. Entries that fail stay in the store
 * with their attempt count bumped and are retried on the next completion.
 */
class RenamePostProcessor final : public PostProcessor {
 public:
  RenamePostProcessor(std::shared_ptr<QueueStore> store, std::shared_ptr<GalleryRenamer> renamer,
                      int32_t max_attempts = 5);

  auto Name() const -> std::string override { return "rename"; }
  void Process(const CompletionJob& job) override;

  // Returns how many galleries were renamed
  auto RetryPending() -> size_t;

 private:
  std::shared_ptr<QueueStore>     store_;
  std::shared_ptr<GalleryRenamer> renamer_;
  int32_t                         max_attempts_;
};

/**
 * @brief Runs the registered post-processors on one background thread, jobs in submission order.
 * A failing processor is logged and never affects the gallery.
 */
class CompletionWorker {
 public:
  CompletionWorker();
  ~CompletionWorker();

  CompletionWorker(const CompletionWorker&)            = delete;
  CompletionWorker& operator=(const CompletionWorker&) = delete;

  void AddProcessor(std::shared_ptr<PostProcessor> processor);

  void Start();
  // Finish every submitted job, then join
  void Stop();

  void Submit(CompletionJob job);

  // Runs the processors on the calling thread
  void ProcessNow(const CompletionJob& job);

  auto Processed() const -> uint64_t { return processed_.load(); }

 private:
  void                                        Loop();

  std::mutex                                  mtx_;
  std::vector<std::shared_ptr<PostProcessor>> processors_;
  ConcurrentBlockingQueue<CompletionJob>      jobs_;
  std::thread                                 worker_;
  std::atomic<uint64_t>                       processed_{0};
};
};  // namespace imxup
