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

#include <filesystem>
#include <string>

#include "controller_types.hpp"
#include "type/type.hpp"

namespace imxup {
/**
 * @brief Owns the queue database. DuckDB keeps a write-ahead log next to the file, so a crash
 * in the middle of a transaction leaves the last committed state on disk.
 */
class DBController {
 private:
  duckdb_database              _db = nullptr;

  file_path_t                  _db_path;

  bool                         _initialized;

  // GalleryImage has no key constraint: rescans delete and re-insert the same keys inside one
  // transaction, uniqueness is kept by the image service instead.
  constexpr static const char* init_table_query =
      "CREATE TABLE IF NOT EXISTS Gallery (path TEXT PRIMARY KEY, name TEXT, status TEXT, "
      "tab_name TEXT, image_host_id TEXT, template_name TEXT, total_images INTEGER, "
      "uploaded_images INTEGER, failed_images INTEGER, total_size BIGINT, uploaded_size BIGINT, "
      "scan_complete BOOLEAN, insertion_order BIGINT, added_ts BIGINT, finished_ts BIGINT, "
      "gallery_id TEXT, gallery_url TEXT, error_message TEXT, failed_files JSON, "
      "custom_fields JSON, ext_fields JSON, dimensions JSON);"
      "CREATE TABLE IF NOT EXISTS GalleryImage (gallery_path TEXT, file_name TEXT, size_bytes "
      "BIGINT, width INTEGER, height INTEGER, order_index INTEGER, uploaded BOOLEAN, remote_id "
      "TEXT, image_url TEXT, thumb_url TEXT);"
      "CREATE TABLE IF NOT EXISTS Tab (id BIGINT PRIMARY KEY, name TEXT UNIQUE, display_order "
      "INTEGER, is_default BOOLEAN, created_ts BIGINT);"
      "CREATE TABLE IF NOT EXISTS UnnamedGallery (gallery_id TEXT PRIMARY KEY, intended_name "
      "TEXT, gallery_path TEXT, queued_ts BIGINT, attempts INTEGER);"
      "CREATE TABLE IF NOT EXISTS FileHostUpload (id BIGINT PRIMARY KEY, gallery_path TEXT, "
      "host_name TEXT, status TEXT, uploaded_bytes BIGINT, total_bytes BIGINT, download_url "
      "TEXT, file_id TEXT, orphaned_file_id TEXT, error_message TEXT, retry_count INTEGER, "
      "created_ts BIGINT, started_ts BIGINT, finished_ts BIGINT);"
      "CREATE TABLE IF NOT EXISTS Setting (key TEXT PRIMARY KEY, value JSON);";

 public:
  explicit DBController(const file_path_t& db_path);
  ~DBController();

  DBController(const DBController&)            = delete;
  DBController& operator=(const DBController&) = delete;

  void InitializeDB();

  auto GetConnectionGuard() -> ConnectionGuard;
  auto GetDBPath() const -> const file_path_t& { return _db_path; }
};
};  // namespace imxup
