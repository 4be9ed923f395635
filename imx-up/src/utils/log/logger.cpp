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

#include "utils/log/logger.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <mutex>
#include <vector>

namespace imxup {
namespace {
constexpr size_t kCategoryCount = 8;

struct LoggerRegistry {
  std::mutex                                                mutex;
  std::vector<spdlog::sink_ptr>                             sinks;
  spdlog::level::level_enum                                 level   = spdlog::level::info;
  std::string                                               pattern = LogConfig{}.pattern_;
  std::array<std::shared_ptr<spdlog::logger>, kCategoryCount> loggers{};
};

auto Registry() -> LoggerRegistry& {
  static LoggerRegistry registry;
  return registry;
}

auto MakeLogger(LoggerRegistry& registry, LogCategory category)
    -> std::shared_ptr<spdlog::logger> {
  if (registry.sinks.empty()) {
    registry.sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  auto logger = std::make_shared<spdlog::logger>(Logger::CategoryName(category),
                                                 registry.sinks.begin(), registry.sinks.end());
  logger->set_level(registry.level);
  logger->set_pattern(registry.pattern);
  logger->flush_on(spdlog::level::warn);
  return logger;
}
}  // namespace

auto Logger::CategoryName(LogCategory category) -> const char* {
  switch (category) {
    case LogCategory::ENGINE:
      return "engine";
    case LogCategory::QUEUE:
      return "queue";
    case LogCategory::STORAGE:
      return "storage";
    case LogCategory::AUTH:
      return "auth";
    case LogCategory::UPLOADS:
      return "uploads";
    case LogCategory::FILE_HOSTS:
      return "file_hosts";
    case LogCategory::BANDWIDTH:
      return "bandwidth";
    case LogCategory::APP:
      return "app";
  }
  return "app";
}

void Logger::Init(const LogConfig& config) {
  auto&                       registry = Registry();
  std::lock_guard<std::mutex> lock(registry.mutex);

  registry.sinks.clear();
  if (config.console_) {
    registry.sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  if (!config.file_path_.empty()) {
    registry.sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        config.file_path_, config.max_file_size_, config.max_files_));
  }
  if (registry.sinks.empty()) {
    registry.sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
  }
  registry.level   = spdlog::level::from_str(config.level_);
  registry.pattern = config.pattern_;

  for (size_t i = 0; i < kCategoryCount; ++i) {
    registry.loggers[i] = MakeLogger(registry, static_cast<LogCategory>(i));
  }
}

auto Logger::Get(LogCategory category) -> std::shared_ptr<spdlog::logger> {
  auto&                       registry = Registry();
  std::lock_guard<std::mutex> lock(registry.mutex);
  auto&                       slot = registry.loggers[static_cast<size_t>(category)];
  if (!slot) {
    slot = MakeLogger(registry, category);
  }
  return slot;
}

void Logger::Shutdown() {
  auto&                       registry = Registry();
  std::lock_guard<std::mutex> lock(registry.mutex);
  for (auto& logger : registry.loggers) {
    if (logger) logger->flush();
    logger.reset();
  }
  registry.sinks.clear();
}

auto MaskSecret(const std::string& secret) -> std::string {
  if (secret.empty()) return "<empty>";
  if (secret.size() <= 4) return "***";
  return secret.substr(0, 4) + "***";
}
};  // namespace imxup
