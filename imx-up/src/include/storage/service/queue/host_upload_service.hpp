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

#include <duckdb.h>

#include <optional>
#include <string>
#include <vector>

#include "queue/host_upload.hpp"
#include "storage/mapper/queue/host_upload_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace imxup {
class HostUploadService
    : public ServiceInterface<HostUploadService, HostUploadRecord, HostUploadMapperParams,
                              HostUploadMapper, host_upload_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const HostUploadRecord& source) -> HostUploadMapperParams;
  static auto FromParams(HostUploadMapperParams&& param) -> HostUploadRecord;

  auto        GetById(host_upload_id_t id) -> std::optional<HostUploadRecord>;
  auto        GetByGallery(const gallery_key_t& path) -> std::vector<HostUploadRecord>;
  auto        GetAllOrdered() -> std::vector<HostUploadRecord>;
  auto        GetByStatus(HostUploadStatus status) -> std::vector<HostUploadRecord>;
  auto        MaxId() -> host_upload_id_t;
};
};  // namespace imxup
