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

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "concurrency/bandwidth_tracker.hpp"
#include "type/type.hpp"
#include "utils/log/logger.hpp"

namespace imxup {
struct EngineSettings {
  int                       thumbnail_size_      = 3;
  int                       thumbnail_format_    = 2;
  uint32_t                  max_retries_         = 3;
  uint32_t                  parallel_batch_size_ = 4;
  std::chrono::milliseconds retry_delay_{1000};
  std::string               template_name_       = "default";
};

struct QueueSettings {
  uint32_t worker_count_          = 1;
  uint32_t event_capacity_        = 1024;
  bool     auto_start_file_hosts_ = true;
};

/**
 * @brief Process-wide settings. Relative paths are resolved against the directory of the file
 * they were loaded from.
 */
struct AppConfig {
  file_path_t      database_path_       = "imxup.db";
  file_path_t      token_cache_path_    = "token_cache.json";
  folder_path_t    hosts_directory_     = "hosts";
  folder_path_t    artifacts_directory_ = "artifacts";
  std::string      image_host_id_       = "imx";

  LogConfig        log_{};
  EngineSettings   engine_{};
  BandwidthOptions bandwidth_{};
  QueueSettings    queue_{};

  /**
   * @brief Missing keys keep their defaults and unknown keys are ignored. Values of the wrong
   * type throw ValidationError.
   */
  static auto FromJson(const nlohmann::json& doc) -> AppConfig;
  static auto LoadFile(const file_path_t& path) -> AppConfig;
};
};  // namespace imxup
