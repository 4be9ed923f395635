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

#include "queue/gallery_item.hpp"

#include "queue/host_upload.hpp"
#include "type/errors.hpp"

namespace imxup {
auto GalleryStatusToString(GalleryStatus status) -> std::string {
  switch (status) {
    case GalleryStatus::VALIDATING:
      return "validating";
    case GalleryStatus::SCANNING:
      return "scanning";
    case GalleryStatus::READY:
      return "ready";
    case GalleryStatus::QUEUED:
      return "queued";
    case GalleryStatus::UPLOADING:
      return "uploading";
    case GalleryStatus::PAUSED:
      return "paused";
    case GalleryStatus::INCOMPLETE:
      return "incomplete";
    case GalleryStatus::COMPLETED:
      return "completed";
    case GalleryStatus::FAILED:
      return "failed";
  }
  return "failed";
}

auto GalleryStatusFromString(const std::string& value) -> GalleryStatus {
  static const std::map<std::string, GalleryStatus> kStatuses = {
      {"validating", GalleryStatus::VALIDATING}, {"scanning", GalleryStatus::SCANNING},
      {"ready", GalleryStatus::READY},           {"queued", GalleryStatus::QUEUED},
      {"uploading", GalleryStatus::UPLOADING},   {"paused", GalleryStatus::PAUSED},
      {"incomplete", GalleryStatus::INCOMPLETE}, {"completed", GalleryStatus::COMPLETED},
      {"failed", GalleryStatus::FAILED}};
  auto it = kStatuses.find(value);
  if (it == kStatuses.end()) {
    throw ValidationError("Unknown gallery status: " + value);
  }
  return it->second;
}

auto IsValidGalleryTransition(GalleryStatus from, GalleryStatus to) -> bool {
  using S = GalleryStatus;
  if (from == to) return true;
  switch (from) {
    case S::VALIDATING:
      return to == S::SCANNING || to == S::FAILED;
    case S::SCANNING:
      return to == S::READY || to == S::FAILED;
    case S::READY:
      return to == S::QUEUED || to == S::SCANNING;
    case S::QUEUED:
      return to == S::UPLOADING || to == S::READY || to == S::PAUSED;
    case S::UPLOADING:
      return to == S::PAUSED || to == S::INCOMPLETE || to == S::COMPLETED || to == S::FAILED;
    case S::PAUSED:
    case S::INCOMPLETE:
    case S::FAILED:
      return to == S::QUEUED || to == S::SCANNING;
    case S::COMPLETED:
      // Only a full rescan reopens a completed gallery
      return to == S::SCANNING;
  }
  return false;
}

auto IsResumable(GalleryStatus status) -> bool {
  return status == GalleryStatus::READY || status == GalleryStatus::PAUSED ||
         status == GalleryStatus::INCOMPLETE || status == GalleryStatus::FAILED;
}

auto HostUploadStatusToString(HostUploadStatus status) -> std::string {
  switch (status) {
    case HostUploadStatus::PENDING:
      return "pending";
    case HostUploadStatus::UPLOADING:
      return "uploading";
    case HostUploadStatus::COMPLETED:
      return "completed";
    case HostUploadStatus::FAILED:
      return "failed";
    case HostUploadStatus::CANCELLED:
      return "cancelled";
  }
  return "failed";
}

auto HostUploadStatusFromString(const std::string& value) -> HostUploadStatus {
  if (value == "pending") return HostUploadStatus::PENDING;
  if (value == "uploading") return HostUploadStatus::UPLOADING;
  if (value == "completed") return HostUploadStatus::COMPLETED;
  if (value == "failed") return HostUploadStatus::FAILED;
  if (value == "cancelled") return HostUploadStatus::CANCELLED;
  throw ValidationError("Unknown host upload status: " + value);
}

auto IsValidHostUploadTransition(HostUploadStatus from, HostUploadStatus to) -> bool {
  using S = HostUploadStatus;
  if (from == to) return true;
  switch (from) {
    case S::PENDING:
      return to == S::UPLOADING || to == S::CANCELLED || to == S::FAILED;
    case S::UPLOADING:
      return to == S::COMPLETED || to == S::FAILED || to == S::CANCELLED;
    case S::FAILED:
      return to == S::PENDING;
    case S::COMPLETED:
    case S::CANCELLED:
      return false;
  }
  return false;
}
};  // namespace imxup
