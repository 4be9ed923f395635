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

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "concurrency/cancellation_token.hpp"
#include "host/host_config.hpp"
#include "host/host_session.hpp"
#include "host/http_transport.hpp"
#include "host/token_cache.hpp"
#include "type/type.hpp"

namespace imxup {
// Cumulative bytes sent for one image
using ByteProgressCallback = std::function<void(uint64_t uploaded, uint64_t total)>;

struct ImageUploadOptions {
  // Empty asks the host to open a new gallery with this image
  std::string gallery_id_;
  std::string gallery_name_;
  int         thumbnail_size_   = 3;
  int         thumbnail_format_ = 2;
};

struct ImageUploadResponse {
  std::string image_id_;
  std::string image_url_;
  std::string thumb_url_;
  // Gallery the image landed in, set when the upload opened it
  std::string gallery_id_;
  std::string gallery_url_;
  std::string raw_;
};

struct GalleryHandle {
  // Empty when the host opens galleries with the first upload instead
  std::string gallery_id_;
  std::string gallery_url_;
  // False when the host created it anonymously and a rename has to follow
  bool        named_ = true;
};

/**
 * @brief What the upload engine needs from an image host, and nothing more.
 */
class ImageHostClient {
 public:
  virtual ~ImageHostClient() = default;

  virtual auto UploadImage(const image_path_t& path, const ImageUploadOptions& options,
                           const ByteProgressCallback& on_progress,
                           const CancellationToken*    cancel) -> ImageUploadResponse = 0;

  virtual auto CreateGalleryWithName(const std::string& name) -> GalleryHandle   = 0;
};

/**
 * @brief Renames galleries that were created without a name. Kept apart from ImageHostClient
 * because it runs after the upload, from the rename post-processor.
 */
class GalleryRenamer {
 public:
  virtual ~GalleryRenamer()                                                       = default;
  virtual void RenameGallery(const std::string& gallery_id, const std::string& name) = 0;
};

/**
 * @brief Image host described by HostConfig::image_. Requests are authorized through the same
 * HostSession as file hosts.
 */
class HttpImageHostClient final : public ImageHostClient, public GalleryRenamer {
 public:
  HttpImageHostClient(HostConfig config, std::shared_ptr<HttpTransport> transport,
                      const std::string& credentials, std::shared_ptr<TokenCache> cache,
                      std::optional<SessionState> session_state = std::nullopt);

  auto UploadImage(const image_path_t& path, const ImageUploadOptions& options,
                   const ByteProgressCallback& on_progress, const CancellationToken* cancel)
      -> ImageUploadResponse override;
  auto CreateGalleryWithName(const std::string& name) -> GalleryHandle override;
  void RenameGallery(const std::string& gallery_id, const std::string& name) override;

  auto GalleryUrl(const std::string& gallery_id) const -> std::string;
  auto ThumbnailUrl(const std::string& image_id, const std::string& ext) const -> std::string;

  /**
   * @brief Turn an upload response into an ImageUploadResponse. A missing image URL or a status
   * other than the host's success value throws UploadError.
   */
  auto ParseUploadResponse(const HttpResponse& response, const image_path_t& path) const
      -> ImageUploadResponse;

  auto Config() const -> const HostConfig& { return config_; }
  auto Session() -> HostSession& { return *session_; }

 private:
  auto                           Spec() const -> const ImageHostSpec& { return *config_.image_; }

  HostConfig                     config_;
  std::shared_ptr<HttpTransport> transport_;
  std::unique_ptr<HostSession>   session_;
};
};  // namespace imxup
