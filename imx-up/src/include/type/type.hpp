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
#include <filesystem>
#include <string>

namespace imxup {

// Local paths
#define image_path_t      std::filesystem::path
#define folder_path_t     std::filesystem::path
#define file_path_t       std::filesystem::path

// Gallery rows are keyed by the UTF-8 folder path
#define gallery_key_t     std::string

// Used in the file host upload table
#define host_upload_id_t  int64_t

// Used in the tab table
#define tab_id_t          int64_t

// Dense, gap tolerant display order
#define insertion_order_t int64_t

// Unix seconds
#define unix_ts_t         int64_t

#define IMXUP_VERSION     "1.4.0"
};  // namespace imxup
