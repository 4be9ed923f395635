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
#include <optional>
#include <string>

namespace imxup {
/**
 * @brief Reported while a file goes out: bytes sent, file size and the instantaneous speed in
 * bytes per second.
 */
using UploadProgressCallback =
    std::function<void(uint64_t uploaded, uint64_t total, double speed_bps)>;

struct StorageInfo {
  std::optional<uint64_t> total_bytes_;
  std::optional<uint64_t> used_bytes_;
  std::optional<uint64_t> left_bytes_;
  std::optional<bool>     premium_;
};

enum class FileUploadStatus : uint8_t { SUCCESS = 0, FAILED };

struct FileUploadResult {
  FileUploadStatus status_ = FileUploadStatus::FAILED;
  std::string      url_;
  std::string      file_id_;
  // Host response body, kept for inspection
  std::string      raw_;
};

struct UploadTestResult {
  bool        success_ = false;
  std::string message_;
  std::string url_;
  std::string file_id_;
};

struct CredentialTestResult {
  bool                       success_ = false;
  std::string                message_;
  std::optional<StorageInfo> storage_;
};
};  // namespace imxup
