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

#include "queue/gallery_item.hpp"
#include "storage/mapper/queue/gallery_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace imxup {
class GalleryService : public ServiceInterface<GalleryService, GalleryItem, GalleryMapperParams,
                                               GalleryMapper, gallery_key_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const GalleryItem& source) -> GalleryMapperParams;
  static auto FromParams(GalleryMapperParams&& param) -> GalleryItem;

  auto        GetByPath(const gallery_key_t& path) -> std::optional<GalleryItem>;
  auto        GetAllOrdered() -> std::vector<GalleryItem>;
  auto        GetByTab(const std::string& tab_name) -> std::vector<GalleryItem>;
  auto        GetByStatus(GalleryStatus status) -> std::vector<GalleryItem>;
  auto        MaxInsertionOrder() -> insertion_order_t;

  /**
   * @brief Compare-and-set on the status column.
   *
   * @return true if the row was in `from` and is now in `to`
   */
  auto        SetStatusIf(const gallery_key_t& path, GalleryStatus from, GalleryStatus to) -> bool;
  auto        SetInsertionOrder(const gallery_key_t& path, insertion_order_t order) -> size_t;
  auto        ReassignTab(const std::string& from_tab, const std::string& to_tab) -> size_t;
};
};  // namespace imxup
