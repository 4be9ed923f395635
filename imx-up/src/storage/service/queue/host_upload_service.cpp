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

#include "storage/service/queue/host_upload_service.hpp"

#include <utility>

namespace imxup {
auto HostUploadService::ToParams(const HostUploadRecord& source) -> HostUploadMapperParams {
  HostUploadMapperParams params;
  params.id               = source.id_;
  params.gallery_path     = source.gallery_path_;
  params.host_name        = source.host_name_;
  params.status           = HostUploadStatusToString(source.status_);
  params.uploaded_bytes   = static_cast<int64_t>(source.uploaded_bytes_);
  params.total_bytes      = static_cast<int64_t>(source.total_bytes_);
  params.download_url     = source.download_url_;
  params.file_id          = source.file_id_;
  params.orphaned_file_id = source.orphaned_file_id_;
  params.error_message    = source.error_message_;
  params.retry_count      = source.retry_count_;
  params.created_ts       = source.created_ts_;
  params.started_ts       = source.started_ts_;
  params.finished_ts      = source.finished_ts_;
  return params;
}

auto HostUploadService::FromParams(HostUploadMapperParams&& param) -> HostUploadRecord {
  HostUploadRecord record;
  record.id_               = param.id;
  record.gallery_path_     = std::move(param.gallery_path);
  record.host_name_        = std::move(param.host_name);
  record.status_           = HostUploadStatusFromString(param.status);
  record.uploaded_bytes_   = static_cast<uint64_t>(param.uploaded_bytes);
  record.total_bytes_      = static_cast<uint64_t>(param.total_bytes);
  record.download_url_     = std::move(param.download_url);
  record.file_id_          = std::move(param.file_id);
  record.orphaned_file_id_ = std::move(param.orphaned_file_id);
  record.error_message_    = std::move(param.error_message);
  record.retry_count_      = param.retry_count;
  record.created_ts_       = param.created_ts;
  record.started_ts_       = param.started_ts;
  record.finished_ts_      = param.finished_ts;
  return record;
}

auto HostUploadService::GetById(host_upload_id_t id) -> std::optional<HostUploadRecord> {
  auto rows = GetByPredicate("id = ?", {static_cast<int64_t>(id)});
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

auto HostUploadService::GetByGallery(const gallery_key_t& path) -> std::vector<HostUploadRecord> {
  return GetByPredicate("gallery_path = ?", {path}, "id");
}

auto HostUploadService::GetAllOrdered() -> std::vector<HostUploadRecord> {
  return GetByPredicate("TRUE", {}, "gallery_path, id");
}

auto HostUploadService::GetByStatus(HostUploadStatus status) -> std::vector<HostUploadRecord> {
  return GetByPredicate("status = ?", {HostUploadStatusToString(status)}, "id");
}

auto HostUploadService::MaxId() -> host_upload_id_t {
  return duckorm::query_int64(_conn, "SELECT MAX(id) FROM FileHostUpload;").value_or(0);
}
};  // namespace imxup
