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


#include "app/file_host_upload_worker.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "concurrency/thread_pool.hpp"
#include "type/errors.hpp"
#include "utils/log/logger.hpp"

namespace imxup {
namespace {
// Returns false when cancel fired before delay elapsed
auto SleepUnlessCancelled(std::chrono::milliseconds delay, const CancellationToken& cancel)
    -> bool {
  constexpr std::chrono::milliseconds kStep{50};
  auto deadline = std::chrono::steady_clock::now() + delay;
  while (std::chrono::steady_clock::now() < deadline) {
    if (cancel.IsCancelled()) return false;
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
        kStep, deadline - std::chrono::steady_clock::now()));
  }
  return !cancel.IsCancelled();
}
}  // namespace

auto SiblingArchiveProvider::PrepareArchive(const gallery_key_t& gallery_path,
                                            const std::string&   host_id) -> file_path_t {
  std::filesystem::path folder(gallery_path);
  for (const char* ext : {".zip", ".7z"}) {
    auto candidate = folder;
    candidate += ext;
    if (std::filesystem::is_regular_file(candidate)) return candidate;
  }
  throw ValidationError("No archive found for " + folder.filename().string(),
                        "expected " + folder.string() + ".zip for " + host_id);
}

FileHostUploadWorker::FileHostUploadWorker(std::shared_ptr<QueueStore>      store,
                                           ClientProvider                   clients,
                                           std::shared_ptr<ArchiveProvider> archives,
                                           std::shared_ptr<EventBus>        bus,
                                           std::shared_ptr<AtomicCounter>   global_bytes,
                                           FileHostWorkerOptions            options)
    : store_(std::move(store)),
      clients_(std::move(clients)),
      archives_(std::move(archives)),
      bus_(std::move(bus)),
      global_bytes_(std::move(global_bytes)),
      options_(options) {}

FileHostUploadWorker::~FileHostUploadWorker() { Stop(); }

void FileHostUploadWorker::Start() {
  std::lock_guard<std::mutex> lock(loop_mtx_);
  if (thread_.joinable()) return;
  stop_   = false;
  thread_ = std::thread([this] { Loop(); });
}

void FileHostUploadWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(loop_mtx_);
    stop_ = true;
  }
  loop_cv_.notify_all();
  {
    std::lock_guard<std::mutex> lock(active_mtx_);
    for (auto& [id, token] : active_) token->Cancel();
  }
  if (thread_.joinable()) thread_.join();
}

void FileHostUploadWorker::Notify() {
  {
    std::lock_guard<std::mutex> lock(loop_mtx_);
    notified_ = true;
  }
  loop_cv_.notify_all();
}

void FileHostUploadWorker::Loop() {
  auto log = Logger::Get(LogCategory::FILE_HOSTS);
  while (true) {
    {
      std::unique_lock<std::mutex> lock(loop_mtx_);
      loop_cv_.wait_for(lock, options_.poll_interval_, [this] { return stop_ || notified_; });
      if (stop_) return;
      notified_ = false;
    }
    try {
      ProcessPending();
    } catch (const ImxupError& e) {
      log->error("File host pass failed: {}", e.Reason());
    }
  }
}

auto FileHostUploadWorker::ProcessPending() -> size_t {
  std::lock_guard<std::mutex> process_lock(process_mtx_);
  auto                        log = Logger::Get(LogCategory::FILE_HOSTS);

  std::set<host_upload_id_t>  seen;
  size_t                      processed = 0;
  while (true) {
    std::map<std::string, std::vector<HostUploadRecord>> by_host;
    for (auto& record : store_->GetPendingHostUploads()) {
      if (seen.insert(record.id_).second) by_host[record.host_name_].push_back(std::move(record));
    }
    if (by_host.empty()) break;

    std::vector<std::shared_ptr<HostClient>> clients;
    std::vector<std::unique_ptr<ThreadPool>> pools;
    for (auto& [host_id, records] : by_host) {
      std::shared_ptr<HostClient> client;
      try {
        client = clients_(host_id);
      } catch (const ImxupError& e) {
        log->error("No client for {}: {}", host_id, e.Reason());
        for (const auto& record : records) FailRecord(record.id_, e.Reason());
        processed += records.size();
        continue;
      }
      if (!client) {
        for (const auto& record : records) FailRecord(record.id_, "Host not configured");
        processed += records.size();
        continue;
      }

      auto pool = std::make_unique<ThreadPool>(
          std::max<uint32_t>(client->Config().max_connections_, 1));
      for (const auto& record : records) {
        pool->Submit([this, record, client] { ProcessRecord(record, *client); });
      }
      processed += records.size();
      clients.push_back(std::move(client));
      pools.push_back(std::move(pool));
    }
    for (auto& pool : pools) pool->WaitIdle();
  }
  return processed;
}

auto FileHostUploadWorker::Cancel(host_upload_id_t id) -> bool {
  {
    std::lock_guard<std::mutex> lock(active_mtx_);
    auto                        it = active_.find(id);
    if (it != active_.end()) {
      it->second->Cancel();
      return true;
    }
  }
  HostUploadUpdate update;
  update.status_ = HostUploadStatus::CANCELLED;
  if (auto cancelled = store_->UpdateHostUploadIf(id, HostUploadStatus::PENDING, update)) {
    Publish(*cancelled);
    return true;
  }

  // Claimed since the first look; workers register before they claim
  std::lock_guard<std::mutex> lock(active_mtx_);
  auto                        it = active_.find(id);
  if (it == active_.end()) return false;
  it->second->Cancel();
  return true;
}

auto FileHostUploadWorker::Retry(host_upload_id_t id) -> HostUploadRecord {
  HostUploadUpdate update;
  update.status_ = HostUploadStatus::PENDING;
  auto record    = store_->UpdateHostUpload(id, update);
  Logger::Get(LogCategory::FILE_HOSTS)
      ->info("Retrying {} upload of {} (retry #{})", record.host_name_, record.gallery_path_,
             record.retry_count_);
  Publish(record);
  Notify();
  return record;
}

void FileHostUploadWorker::Publish(const HostUploadRecord& record) {
  if (bus_) bus_->Publish(HostUploadChanged{record});
}

void FileHostUploadWorker::FailRecord(host_upload_id_t id, const std::string& reason) {
  try {
    HostUploadUpdate update;
    update.status_        = HostUploadStatus::FAILED;
    update.error_message_ = reason;
    Publish(store_->UpdateHostUpload(id, update));
  } catch (const ImxupError& e) {
    Logger::Get(LogCategory::FILE_HOSTS)
        ->error("Cannot mark host upload #{} failed: {}", id, e.Reason());
  }
}

void FileHostUploadWorker::ProcessRecord(const HostUploadRecord& record, HostClient& client) {
  auto log   = Logger::Get(LogCategory::FILE_HOSTS);
  auto token = std::make_shared<CancellationToken>();
  {
    std::lock_guard<std::mutex> lock(active_mtx_);
    active_[record.id_] = token;
  }

  try {
    HostUploadUpdate start;
    start.status_         = HostUploadStatus::UPLOADING;
    start.uploaded_bytes_ = 0;
    start.error_message_  = std::string{};
    auto claimed = store_->UpdateHostUploadIf(record.id_, HostUploadStatus::PENDING, start);
    if (!claimed.has_value()) {
      log->debug("Skipping host upload #{}: no longer pending", record.id_);
      std::lock_guard<std::mutex> lock(active_mtx_);
      active_.erase(record.id_);
      return;
    }
    Publish(*claimed);

    file_path_t archive;
    try {
      archive = archives_->PrepareArchive(record.gallery_path_, record.host_name_);
    } catch (const ImxupError& e) {
      log->error("{}: archive for {} unavailable: {}", record.host_name_, record.gallery_path_,
                 e.Reason());
      FailRecord(record.id_, e.Reason());
    }

    if (!archive.empty()) {
      UploadArchive(record, client, archive, *token);
      try {
        archives_->ReleaseArchive(archive);
      } catch (const std::exception& e) {
        log->warn("Releasing {} failed: {}", archive.string(), e.what());
      }
    }
  } catch (const ValidationError& e) {
    // Moved on by someone else while it ran
    log->debug("Skipping host upload #{}: {}", record.id_, e.Reason());
  } catch (const ImxupError& e) {
    log->error("Host upload #{} aborted: {}", record.id_, e.Reason());
  } catch (const std::exception& e) {
    log->error("Host upload #{} aborted: {}", record.id_, e.what());
  }

  std::lock_guard<std::mutex> lock(active_mtx_);
  active_.erase(record.id_);
}

void FileHostUploadWorker::UploadArchive(const HostUploadRecord& record, HostClient& client,
                                         const file_path_t&       archive,
                                         const CancellationToken& cancel) {
  auto            log    = Logger::Get(LogCategory::FILE_HOSTS);
  const auto&     config = client.Config();

  std::error_code ec;
  uint64_t        total = std::filesystem::file_size(archive, ec);
  if (ec) {
    FailRecord(record.id_, "Cannot read " + archive.filename().string());
    return;
  }
  HostUploadUpdate sized;
  sized.total_bytes_ = total;
  Publish(store_->UpdateHostUpload(record.id_, sized));

  std::vector<std::shared_ptr<AtomicCounter>> counters;
  if (global_bytes_) counters.push_back(global_bytes_);
  ByteCountingSink sink(counters);

  auto             last_persist = std::chrono::steady_clock::time_point{};
  auto             on_progress  = [&](uint64_t uploaded, uint64_t, double) {
    sink.Update(uploaded);
    auto now = std::chrono::steady_clock::now();
    if (now - last_persist < options_.progress_interval_) return;
    last_persist = now;
    try {
      HostUploadUpdate progress;
      progress.uploaded_bytes_ = uploaded;
      Publish(store_->UpdateHostUpload(record.id_, progress));
    } catch (const std::exception& e) {
      log->warn("Progress update for #{} failed: {}", record.id_, e.what());
    }
  };

  const uint32_t max_attempts = config.auto_retry_ ? config.max_retries_ + 1 : 1;
  std::string    last_error;
  for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    auto                            delay = options_.retry_delay_;
    std::optional<FileUploadResult> result;
    try {
      sink.Restart();
      result = client.UploadFile(archive, on_progress, &cancel);
    } catch (const CancelledError& e) {
      HostUploadUpdate cancelled;
      cancelled.status_ = HostUploadStatus::CANCELLED;
      if (!e.OrphanedRemoteId().empty()) {
        cancelled.orphaned_file_id_ = e.OrphanedRemoteId();
        log->warn("{}: cancelled upload left remote file {}", config.name_, e.OrphanedRemoteId());
      }
      Publish(store_->UpdateHostUpload(record.id_, cancelled));
      return;
    } catch (const AuthenticationError& e) {
      FailRecord(record.id_, e.Reason());
      return;
    } catch (const SecurityError& e) {
      FailRecord(record.id_, e.Reason());
      return;
    } catch (const ValidationError& e) {
      // Rejected locally, a retry cannot change the outcome
      FailRecord(record.id_, e.Reason());
      return;
    } catch (const RateLimitError& e) {
      last_error = e.Reason();
      if (e.RetryAfterSeconds().has_value()) delay = std::chrono::seconds(*e.RetryAfterSeconds());
    } catch (const StorageError&) {
      throw;
    } catch (const ImxupError& e) {
      last_error = e.Reason();
    } catch (const std::exception& e) {
      last_error = e.what();
    }

    if (result.has_value()) {
      HostUploadUpdate done;
      done.status_         = HostUploadStatus::COMPLETED;
      done.uploaded_bytes_ = total;
      done.download_url_   = result->url_;
      done.file_id_        = result->file_id_;
      Publish(store_->UpdateHostUpload(record.id_, done));
      log->info("{}: uploaded {} -> {}", config.name_, archive.filename().string(), result->url_);
      return;
    }

    log->warn("{}: upload of {} failed (attempt {}/{}): {}", config.name_,
              archive.filename().string(), attempt, max_attempts, last_error);
    if (attempt < max_attempts && !SleepUnlessCancelled(delay, cancel)) {
      HostUploadUpdate cancelled;
      cancelled.status_ = HostUploadStatus::CANCELLED;
      Publish(store_->UpdateHostUpload(record.id_, cancelled));
      return;
    }
  }
  FailRecord(record.id_, last_error);
}
};  // namespace imxup
