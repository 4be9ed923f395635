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
#include <string>

#include "type/type.hpp"

namespace imxup {
enum class HostUploadStatus : uint8_t { PENDING = 0, UPLOADING, COMPLETED, FAILED, CANCELLED };

auto HostUploadStatusToString(HostUploadStatus status) -> std::string;
auto HostUploadStatusFromString(const std::string& value) -> HostUploadStatus;

/**
 * @brief Status only moves forward (pending -> uploading -> terminal). The single way back is
 * failed -> pending, a manual retry. Staying in the same status is allowed for progress updates.
 */
auto IsValidHostUploadTransition(HostUploadStatus from, HostUploadStatus to) -> bool;

struct HostUploadRecord {
  host_upload_id_t id_ = 0;
  gallery_key_t    gallery_path_;
  std::string      host_name_;
  HostUploadStatus status_         = HostUploadStatus::PENDING;
  uint64_t         uploaded_bytes_ = 0;
  uint64_t         total_bytes_    = 0;
  std::string      download_url_;
  std::string      file_id_;
  std::string      orphaned_file_id_;
  std::string      error_message_;
  int32_t          retry_count_ = 0;
  unix_ts_t        created_ts_  = 0;
  unix_ts_t        started_ts_  = 0;
  unix_ts_t        finished_ts_ = 0;
};

// Partial update; unset fields keep their stored value
struct HostUploadUpdate {
  std::optional<HostUploadStatus> status_;
  std::optional<uint64_t>         uploaded_bytes_;
  std::optional<uint64_t>         total_bytes_;
  std::optional<std::string>      download_url_;
  std::optional<std::string>      file_id_;
  std::optional<std::string>      orphaned_file_id_;
  std::optional<std::string>      error_message_;
  std::optional<int32_t>          retry_count_;
};
};  // namespace imxup
