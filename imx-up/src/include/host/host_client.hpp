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

#include <memory>
#include <optional>
#include <string>

#include "concurrency/cancellation_token.hpp"
#include "host/host_config.hpp"
#include "host/host_session.hpp"
#include "host/host_types.hpp"
#include "host/http_transport.hpp"
#include "host/token_cache.hpp"
#include "type/type.hpp"

namespace imxup {
/**
 * @brief The contract every file host is driven through, whatever its auth model. Callers never
 * branch on the host kind.
 */
class HostClient {
 public:
  virtual ~HostClient() = default;

  /**
   * @brief Stream path to the host.
   *
   * @param path local file
   * @param on_progress (uploaded, total, instantaneous speed), may be empty
   * @param cancel polled between chunks; a cancelled upload throws CancelledError
   * @return FileUploadResult with the download URL and the remote file id
   */
  virtual auto UploadFile(const file_path_t& path, const UploadProgressCallback& on_progress,
                          const CancellationToken* cancel) -> FileUploadResult = 0;

  /**
   * @brief Idempotent. A file the host no longer knows counts as deleted.
   */
  virtual void DeleteFile(const std::string& file_id)                        = 0;

  virtual auto GetUserInfo() -> StorageInfo                                  = 0;

  /**
   * @brief Minimal authenticated call. Never throws and never mutates remote state.
   */
  virtual auto TestCredentials() -> CredentialTestResult                     = 0;

  /**
   * @brief Upload a small synthetic file, deleted afterwards unless cleanup is false. Never
   * throws.
   */
  virtual auto TestUpload(bool cleanup = true) -> UploadTestResult           = 0;

  virtual auto GetSessionState() const -> SessionState                       = 0;

  virtual auto Config() const -> const HostConfig&                           = 0;
};

/**
 * @brief HostClient driven entirely by a HostConfig: optional upload-server lookup, PUT or
 * multipart POST, and response parsing by JSON path or regex.
 */
class FileHostClient final : public HostClient {
 public:
  FileHostClient(HostConfig config, std::shared_ptr<HttpTransport> transport,
                 const std::string& credentials, std::shared_ptr<TokenCache> cache,
                 std::optional<SessionState> session_state = std::nullopt);

  auto UploadFile(const file_path_t& path, const UploadProgressCallback& on_progress,
                  const CancellationToken* cancel) -> FileUploadResult override;
  void DeleteFile(const std::string& file_id) override;
  auto GetUserInfo() -> StorageInfo override;
  auto TestCredentials() -> CredentialTestResult override;
  auto TestUpload(bool cleanup = true) -> UploadTestResult override;
  auto GetSessionState() const -> SessionState override;
  auto Config() const -> const HostConfig& override { return config_; }

  auto Session() -> HostSession& { return *session_; }

  /**
   * @brief Turn an upload response into a result, following the host's response rules.
   */
  auto ParseUploadResponse(const HttpResponse& response) const -> FileUploadResult;

 private:
  auto                           UploadOnce(const file_path_t& path, uint64_t file_size,
                                            const UploadProgressCallback& on_progress,
                                            const CancellationToken*      cancel) -> FileUploadResult;
  auto                           ResolveUploadUrl(const file_path_t& path) -> std::string;
  auto                           BaseRequest(HttpMethod method, std::string url) const -> HttpRequest;

  HostConfig                     config_;
  std::shared_ptr<HttpTransport> transport_;
  std::unique_ptr<HostSession>   session_;
};

/**
 * @brief Map auth rejections (401, 403) to AuthenticationError and 429 to RateLimitError.
 */
void ThrowOnAuthOrRateLimit(const HttpResponse& response, const std::string& host_name);
};  // namespace imxup
