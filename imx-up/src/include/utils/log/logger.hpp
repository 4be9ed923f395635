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

#include <spdlog/logger.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace imxup {
enum class LogCategory : uint8_t {
  ENGINE = 0,
  QUEUE,
  STORAGE,
  AUTH,
  UPLOADS,
  FILE_HOSTS,
  BANDWIDTH,
  APP,
};

struct LogConfig {
  std::string level_         = "info";
  // Empty means console only
  std::string file_path_{};
  size_t      max_file_size_ = 5 * 1024 * 1024;
  size_t      max_files_     = 3;
  std::string pattern_       = "%Y-%m-%d %H:%M:%S [%n] [%l] %v";
  bool        console_       = true;
};

class Logger {
 public:
  /**
   * @brief Install the shared sinks. Category loggers created before Init are rebuilt on the
   * new sinks.
   */
  static void Init(const LogConfig& config);

  static auto Get(LogCategory category) -> std::shared_ptr<spdlog::logger>;

  static void Shutdown();

  static auto CategoryName(LogCategory category) -> const char*;
};

/**
 * @brief "abcd***" for tokens, API keys and session ids.
 */
auto MaskSecret(const std::string& secret) -> std::string;
};  // namespace imxup
