#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "app/file_host_upload_worker.hpp"
#include "app/host_client_factory.hpp"
#include "concurrency/cancellation_token.hpp"
#include "host/host_client.hpp"
#include "host/image_host_client.hpp"
#include "type/errors.hpp"

namespace imxup {
/**
 * @brief Scriptable image host. Files fail a fixed number of times, a stop token can be
 * cancelled after a number of uploads, and the peak concurrency is recorded.
 */
class FakeImageHost : public ImageHostClient, public GalleryRenamer {
 public:
  // Returned by CreateGalleryWithName; an empty id makes the first upload open the gallery
  GalleryHandle                      create_handle_{"G1", "https://imx.test/g/G1", true};
  std::chrono::milliseconds          upload_delay_{0};
  // Runs once the host has accepted a file, before the response goes back
  std::function<void(const image_path_t&)> after_upload_;

  void FailTimes(const std::string& file_name, int times, bool auth = false) {
    std::lock_guard<std::mutex> lock(mtx_);
    failures_[file_name] = Failure{times, auth};
  }

  void CancelAfter(std::shared_ptr<CancellationToken> token, int uploads) {
    std::lock_guard<std::mutex> lock(mtx_);
    stop_token_   = std::move(token);
    stop_after_   = uploads;
  }

  void FailCreate(int times, bool auth = false) {
    std::lock_guard<std::mutex> lock(mtx_);
    create_failures_ = Failure{times, auth};
  }

  void FailRename(int times) {
    std::lock_guard<std::mutex> lock(mtx_);
    rename_failures_ = times;
  }

  auto UploadImage(const image_path_t& path, const ImageUploadOptions& options,
                   const ByteProgressCallback& on_progress, const CancellationToken* cancel)
      -> ImageUploadResponse override {
    const auto file_name = path.filename().string();
    auto       running   = ++running_;
    for (auto peak = max_concurrent_.load(); running > peak;) {
      if (max_concurrent_.compare_exchange_weak(peak, running)) break;
    }
    struct Leave {
      std::atomic<int>& running;
      ~Leave() { --running; }
    } leave{running_};

    {
      std::lock_guard<std::mutex> lock(mtx_);
      ++calls_[file_name];
      auto it = failures_.find(file_name);
      if (it != failures_.end() && it->second.remaining_ > 0) {
        --it->second.remaining_;
        if (it->second.auth_) throw AuthenticationError("Session rejected");
        throw UploadError("Server error", "HTTP 500", 500);
      }
    }
    if (IsCancelled(cancel)) throw CancelledError("Transfer aborted");
    if (upload_delay_.count() > 0) std::this_thread::sleep_for(upload_delay_);

    std::error_code ec;
    auto            size = std::filesystem::file_size(path, ec);
    if (ec) size = 0;
    if (on_progress) {
      on_progress(size / 2, size);
      on_progress(size, size);
    }

    ImageUploadResponse response;
    response.image_id_  = path.stem().string();
    response.image_url_ = "https://imx.test/i/" + response.image_id_;
    response.thumb_url_ = "https://imx.test/t/" + response.image_id_ + ".jpg";
    if (options.gallery_id_.empty()) {
      response.gallery_id_  = "G1";
      response.gallery_url_ = "https://imx.test/g/G1";
    } else {
      response.gallery_id_ = options.gallery_id_;
    }

    std::lock_guard<std::mutex> lock(mtx_);
    gallery_ids_seen_.push_back(options.gallery_id_);
    ++uploads_;
    if (stop_token_ && uploads_ >= stop_after_) stop_token_->Cancel();
    if (after_upload_) after_upload_(path);
    return response;
  }

  auto CreateGalleryWithName(const std::string& name) -> GalleryHandle override {
    std::lock_guard<std::mutex> lock(mtx_);
    ++create_calls_;
    created_names_.push_back(name);
    if (create_failures_.remaining_ > 0) {
      --create_failures_.remaining_;
      if (create_failures_.auth_) throw AuthenticationError("Login expired");
      throw NetworkError("Connection reset");
    }
    return create_handle_;
  }

  void RenameGallery(const std::string& gallery_id, const std::string& name) override {
    std::lock_guard<std::mutex> lock(mtx_);
    if (rename_failures_ > 0) {
      --rename_failures_;
      throw UploadError("Rename failed with status 500", {}, 500);
    }
    renames_[gallery_id] = name;
  }

  auto Calls(const std::string& file_name) -> int {
    std::lock_guard<std::mutex> lock(mtx_);
    auto                        it = calls_.find(file_name);
    return it == calls_.end() ? 0 : it->second;
  }

  auto TotalCalls() -> int {
    std::lock_guard<std::mutex> lock(mtx_);
    int                         total = 0;
    for (const auto& [name, count] : calls_) total += count;
    return total;
  }

  auto CreateCalls() -> int {
    std::lock_guard<std::mutex> lock(mtx_);
    return create_calls_;
  }

  auto CreatedNames() -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mtx_);
    return created_names_;
  }

  auto GalleryIdsSeen() -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mtx_);
    return gallery_ids_seen_;
  }

  auto Renames() -> std::map<std::string, std::string> {
    std::lock_guard<std::mutex> lock(mtx_);
    return renames_;
  }

  auto MaxConcurrent() const -> int { return max_concurrent_.load(); }

 private:
  struct Failure {
    int  remaining_ = 0;
    bool auth_      = false;
  };

  std::mutex                         mtx_;
  std::map<std::string, Failure>     failures_;
  std::map<std::string, int>         calls_;
  Failure                            create_failures_;
  int                                rename_failures_ = 0;
  int                                create_calls_    = 0;
  int                                uploads_         = 0;
  std::vector<std::string>           created_names_;
  std::vector<std::string>           gallery_ids_seen_;
  std::map<std::string, std::string> renames_;
  std::shared_ptr<CancellationToken> stop_token_;
  int                                stop_after_ = 0;

  std::atomic<int>                   running_{0};
  std::atomic<int>                   max_concurrent_{0};
};

/**
 * @brief File host whose upload behavior is a function. Everything else succeeds.
 */
class FakeFileHost : public HostClient {
 public:
  using UploadFn = std::function<FileUploadResult(const file_path_t&, const UploadProgressCallback&,
                                                  const CancellationToken*)>;

  explicit FakeFileHost(HostConfig config, UploadFn on_upload = {})
      : config_(std::move(config)), on_upload_(std::move(on_upload)) {}

  auto UploadFile(const file_path_t& path, const UploadProgressCallback& on_progress,
                  const CancellationToken* cancel) -> FileUploadResult override {
    ++uploads_;
    if (on_upload_) return on_upload_(path, on_progress, cancel);
    std::error_code ec;
    auto            size = std::filesystem::file_size(path, ec);
    if (ec) size = 0;
    if (on_progress) on_progress(size, size, 0.0);
    FileUploadResult result;
    result.status_  = FileUploadStatus::SUCCESS;
    result.url_     = "https://" + config_.id_ + ".test/d/" + path.filename().string();
    result.file_id_ = "F" + std::to_string(uploads_.load());
    return result;
  }

  void DeleteFile(const std::string& file_id) override {
    std::lock_guard<std::mutex> lock(mtx_);
    deleted_.push_back(file_id);
  }

  auto GetUserInfo() -> StorageInfo override { return {}; }
  auto TestCredentials() -> CredentialTestResult override { return {true, "ok", std::nullopt}; }
  auto TestUpload(bool) -> UploadTestResult override { return {true, "ok", {}, {}}; }
  auto GetSessionState() const -> SessionState override { return {}; }
  auto Config() const -> const HostConfig& override { return config_; }

  auto Uploads() const -> int { return uploads_.load(); }
  auto Deleted() -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mtx_);
    return deleted_;
  }

 private:
  HostConfig               config_;
  UploadFn                 on_upload_;
  std::atomic<int>         uploads_{0};
  std::mutex               mtx_;
  std::vector<std::string> deleted_;
};

inline auto FileHostConfig(const std::string& id, uint32_t max_connections = 2,
                           bool auto_retry = true, uint32_t max_retries = 2) -> HostConfig {
  HostConfig config;
  config.id_               = id;
  config.name_             = id;
  config.kind_             = HostKind::FILE_HOST;
  config.upload_.endpoint_ = "https://" + id + ".test/upload";
  config.max_connections_  = max_connections;
  config.auto_retry_       = auto_retry;
  config.max_retries_      = max_retries;
  return config;
}

/**
 * @brief Hands out one fixed archive file for every gallery, or throws when none is set.
 */
class FakeArchiveProvider : public ArchiveProvider {
 public:
  explicit FakeArchiveProvider(file_path_t archive) : archive_(std::move(archive)) {}

  auto PrepareArchive(const gallery_key_t& gallery_path, const std::string&)
      -> file_path_t override {
    if (archive_.empty()) throw ValidationError("No archive for " + gallery_path);
    return archive_;
  }

  void ReleaseArchive(const file_path_t&) override { ++released_; }

  auto Released() const -> int { return released_.load(); }

 private:
  file_path_t      archive_;
  std::atomic<int> released_{0};
};

class FakeCredentialVault : public CredentialVault {
 public:
  std::map<std::string, std::string> entries_;

  auto Lookup(const std::string& host_id) -> std::optional<std::string> override {
    auto it = entries_.find(host_id);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
  }
};
}  // namespace imxup
