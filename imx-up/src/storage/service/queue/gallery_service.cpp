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

#include "storage/service/queue/gallery_service.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

namespace imxup {
namespace {
auto FieldsToJson(const std::array<std::string, 4>& fields) -> std::string {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& f : fields) arr.push_back(f);
  return arr.dump();
}

auto FieldsFromJson(const std::string& text) -> std::array<std::string, 4> {
  std::array<std::string, 4> fields{};
  if (text.empty()) return fields;
  auto arr = nlohmann::json::parse(text, nullptr, false);
  if (!arr.is_array()) return fields;
  for (size_t i = 0; i < fields.size() && i < arr.size(); ++i) {
    if (arr[i].is_string()) fields[i] = arr[i].get<std::string>();
  }
  return fields;
}

auto FailedToJson(const std::vector<FailedImage>& failed) -> std::string {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& f : failed) {
    arr.push_back({{"file", f.file_name_}, {"reason", f.reason_}, {"attempts", f.attempts_}});
  }
  return arr.dump();
}

auto FailedFromJson(const std::string& text) -> std::vector<FailedImage> {
  std::vector<FailedImage> failed;
  if (text.empty()) return failed;
  auto arr = nlohmann::json::parse(text, nullptr, false);
  if (!arr.is_array()) return failed;
  for (const auto& entry : arr) {
    failed.push_back({entry.value("file", std::string{}), entry.value("reason", std::string{}),
                      entry.value("attempts", 0u)});
  }
  return failed;
}

auto DimensionsToJson(const DimensionStats& d) -> std::string {
  return nlohmann::json{{"min_w", d.min_width_},   {"max_w", d.max_width_},
                        {"avg_w", d.avg_width_},   {"min_h", d.min_height_},
                        {"max_h", d.max_height_},  {"avg_h", d.avg_height_},
                        {"sampled", d.sampled_}}
      .dump();
}

auto DimensionsFromJson(const std::string& text) -> DimensionStats {
  DimensionStats d;
  if (text.empty()) return d;
  auto obj = nlohmann::json::parse(text, nullptr, false);
  if (!obj.is_object()) return d;
  d.min_width_  = obj.value("min_w", 0u);
  d.max_width_  = obj.value("max_w", 0u);
  d.avg_width_  = obj.value("avg_w", 0.0);
  d.min_height_ = obj.value("min_h", 0u);
  d.max_height_ = obj.value("max_h", 0u);
  d.avg_height_ = obj.value("avg_h", 0.0);
  d.sampled_    = obj.value("sampled", 0u);
  return d;
}
}  // namespace

auto GalleryService::ToParams(const GalleryItem& source) -> GalleryMapperParams {
  GalleryMapperParams params;
  params.path            = source.path_;
  params.name            = source.name_;
  params.status          = GalleryStatusToString(source.status_);
  params.tab_name        = source.tab_name_;
  params.image_host_id   = source.image_host_id_;
  params.template_name   = source.template_name_;
  params.total_images    = static_cast<int32_t>(source.total_images_);
  params.uploaded_images = static_cast<int32_t>(source.uploaded_images_);
  params.failed_images   = static_cast<int32_t>(source.failed_images_);
  params.total_size      = static_cast<int64_t>(source.total_size_);
  params.uploaded_size   = static_cast<int64_t>(source.uploaded_size_);
  params.scan_complete   = source.scan_complete_;
  params.insertion_order = source.insertion_order_;
  params.added_ts        = source.added_ts_;
  params.finished_ts     = source.finished_ts_;
  params.gallery_id      = source.gallery_id_;
  params.gallery_url     = source.gallery_url_;
  params.error_message   = source.error_message_;
  params.failed_files    = FailedToJson(source.failed_files_);
  params.custom_fields   = FieldsToJson(source.custom_fields_);
  params.ext_fields      = FieldsToJson(source.ext_fields_);
  params.dimensions      = DimensionsToJson(source.dimensions_);
  return params;
}

auto GalleryService::FromParams(GalleryMapperParams&& param) -> GalleryItem {
  GalleryItem item;
  item.path_            = std::move(param.path);
  item.name_            = std::move(param.name);
  item.status_          = GalleryStatusFromString(param.status);
  item.tab_name_        = std::move(param.tab_name);
  item.image_host_id_   = std::move(param.image_host_id);
  item.template_name_   = std::move(param.template_name);
  item.total_images_    = static_cast<uint32_t>(param.total_images);
  item.uploaded_images_ = static_cast<uint32_t>(param.uploaded_images);
  item.failed_images_   = static_cast<uint32_t>(param.failed_images);
  item.total_size_      = static_cast<uint64_t>(param.total_size);
  item.uploaded_size_   = static_cast<uint64_t>(param.uploaded_size);
  item.scan_complete_   = param.scan_complete;
  item.insertion_order_ = param.insertion_order;
  item.added_ts_        = param.added_ts;
  item.finished_ts_     = param.finished_ts;
  item.gallery_id_      = std::move(param.gallery_id);
  item.gallery_url_     = std::move(param.gallery_url);
  item.error_message_   = std::move(param.error_message);
  item.failed_files_    = FailedFromJson(param.failed_files);
  item.custom_fields_   = FieldsFromJson(param.custom_fields);
  item.ext_fields_      = FieldsFromJson(param.ext_fields);
  item.dimensions_      = DimensionsFromJson(param.dimensions);
  return item;
}

auto GalleryService::GetByPath(const gallery_key_t& path) -> std::optional<GalleryItem> {
  auto rows = GetByPredicate("path = ?", {path});
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

auto GalleryService::GetAllOrdered() -> std::vector<GalleryItem> {
  return GetByPredicate("TRUE", {}, "insertion_order, path");
}

auto GalleryService::GetByTab(const std::string& tab_name) -> std::vector<GalleryItem> {
  return GetByPredicate("tab_name = ?", {tab_name}, "insertion_order, path");
}

auto GalleryService::GetByStatus(GalleryStatus status) -> std::vector<GalleryItem> {
  return GetByPredicate("status = ?", {GalleryStatusToString(status)}, "insertion_order, path");
}

auto GalleryService::MaxInsertionOrder() -> insertion_order_t {
  return duckorm::query_int64(_conn, "SELECT MAX(insertion_order) FROM Gallery;").value_or(0);
}

auto GalleryService::SetStatusIf(const gallery_key_t& path, GalleryStatus from, GalleryStatus to)
    -> bool {
  return duckorm::execute(_conn, "UPDATE Gallery SET status = ? WHERE path = ? AND status = ?;",
                          {GalleryStatusToString(to), path, GalleryStatusToString(from)}) == 1;
}

auto GalleryService::SetInsertionOrder(const gallery_key_t& path, insertion_order_t order)
    -> size_t {
  return duckorm::execute(_conn, "UPDATE Gallery SET insertion_order = ? WHERE path = ?;",
                          {static_cast<int64_t>(order), path});
}

auto GalleryService::ReassignTab(const std::string& from_tab, const std::string& to_tab)
    -> size_t {
  return duckorm::execute(_conn, "UPDATE Gallery SET tab_name = ? WHERE tab_name = ?;",
                          {to_tab, from_tab});
}
};  // namespace imxup
