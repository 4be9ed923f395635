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
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace imxup {
enum class ErrorKind : uint8_t {
  AUTHENTICATION = 0,
  UPLOAD,
  NETWORK,
  VALIDATION,
  STORAGE,
  SECURITY,
  CANCELLED
};

auto ErrorKindName(ErrorKind kind) -> const char*;

/**
 * @brief Root of the exception hierarchy. Reason() is the short text shown to the user,
 * Details() keeps the raw protocol or SQL payload for inspection.
 */
class ImxupError : public std::runtime_error {
 public:
  ImxupError(ErrorKind kind, std::string reason, std::string details = {});

  auto Kind() const -> ErrorKind { return kind_; }
  auto Reason() const -> const std::string& { return reason_; }
  auto Details() const -> const std::string& { return details_; }

 private:
  ErrorKind   kind_;
  std::string reason_;
  std::string details_;
};

class AuthenticationError : public ImxupError {
 public:
  explicit AuthenticationError(std::string reason, std::string details = {})
      : ImxupError(ErrorKind::AUTHENTICATION, std::move(reason), std::move(details)) {}
};

class UploadError : public ImxupError {
 public:
  explicit UploadError(std::string reason, std::string details = {}, int http_status = 0)
      : ImxupError(ErrorKind::UPLOAD, std::move(reason), std::move(details)),
        http_status_(http_status) {}

  auto HttpStatus() const -> int { return http_status_; }

 private:
  int http_status_;
};

class NetworkError : public ImxupError {
 public:
  explicit NetworkError(std::string reason, std::string details = {})
      : ImxupError(ErrorKind::NETWORK, std::move(reason), std::move(details)) {}
};

class RateLimitError : public NetworkError {
 public:
  RateLimitError(std::string reason, std::optional<int64_t> retry_after_seconds,
                 std::string details = {})
      : NetworkError(std::move(reason), std::move(details)),
        retry_after_seconds_(retry_after_seconds) {}

  auto RetryAfterSeconds() const -> std::optional<int64_t> { return retry_after_seconds_; }

 private:
  std::optional<int64_t> retry_after_seconds_;
};

class ValidationError : public ImxupError {
 public:
  explicit ValidationError(std::string reason, std::string details = {})
      : ImxupError(ErrorKind::VALIDATION, std::move(reason), std::move(details)) {}
};

/**
 * @brief Persistence failure. Bulk operations are atomic, so every key listed in
 * UnappliedKeys() still holds its previous state.
 */
class StorageError : public ImxupError {
 public:
  explicit StorageError(std::string reason, std::string details = {},
                        std::vector<std::string> unapplied_keys = {})
      : ImxupError(ErrorKind::STORAGE, std::move(reason), std::move(details)),
        unapplied_keys_(std::move(unapplied_keys)) {}

  auto UnappliedKeys() const -> const std::vector<std::string>& { return unapplied_keys_; }

 private:
  std::vector<std::string> unapplied_keys_;
};

class SecurityError : public ImxupError {
 public:
  explicit SecurityError(std::string reason, std::string details = {})
      : ImxupError(ErrorKind::SECURITY, std::move(reason), std::move(details)) {}
};

// A transfer aborted through its cancellation token. When the host kept a copy that could not be
// removed, OrphanedRemoteId() names it for later cleanup.
class CancelledError : public ImxupError {
 public:
  explicit CancelledError(std::string reason, std::string orphaned_remote_id = {})
      : ImxupError(ErrorKind::CANCELLED, std::move(reason)),
        orphaned_remote_id_(std::move(orphaned_remote_id)) {}

  auto OrphanedRemoteId() const -> const std::string& { return orphaned_remote_id_; }

 private:
  std::string orphaned_remote_id_;
};
};  // namespace imxup
