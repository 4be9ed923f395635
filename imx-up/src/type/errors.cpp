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

#include "type/errors.hpp"

#include <format>

namespace imxup {
auto ErrorKindName(ErrorKind kind) -> const char* {
  switch (kind) {
    case ErrorKind::AUTHENTICATION:
      return "AuthenticationError";
    case ErrorKind::UPLOAD:
      return "UploadError";
    case ErrorKind::NETWORK:
      return "NetworkError";
    case ErrorKind::VALIDATION:
      return "ValidationError";
    case ErrorKind::STORAGE:
      return "StorageError";
    case ErrorKind::SECURITY:
      return "SecurityError";
    case ErrorKind::CANCELLED:
      return "CancelledError";
  }
  return "ImxupError";
}

ImxupError::ImxupError(ErrorKind kind, std::string reason, std::string details)
    : std::runtime_error(std::format("[{}] {}", ErrorKindName(kind), reason)),
      kind_(kind),
      reason_(std::move(reason)),
      details_(std::move(details)) {}
};  // namespace imxup
