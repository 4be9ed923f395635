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


#include "config/app_config.hpp"

#include <fstream>

#include "type/errors.hpp"

namespace imxup {
namespace {
template <typename T>
void Read(const nlohmann::json& section, const char* key, T& target) {
  if (!section.contains(key) || section.at(key).is_null()) return;
  try {
    target = section.at(key).get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ValidationError(std::string("Invalid setting '") + key + "'", e.what());
  }
}

void ReadPath(const nlohmann::json& section, const char* key, std::filesystem::path& target) {
  std::string value;
  Read(section, key, value);
  if (!value.empty()) target = value;
}

auto Section(const nlohmann::json& doc, const char* key) -> const nlohmann::json& {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  if (!doc.contains(key)) return kEmpty;
  const auto& section = doc.at(key);
  if (!section.is_object()) {
    throw ValidationError(std::string("Setting section '") + key + "' must be an object");
  }
  return section;
}
}  // namespace

auto AppConfig::FromJson(const nlohmann::json& doc) -> AppConfig {
  if (!doc.is_object()) {
    throw ValidationError("Configuration must be a JSON object");
  }
  AppConfig config;
  ReadPath(doc, "database_path", config.database_path_);
  ReadPath(doc, "token_cache_path", config.token_cache_path_);
  ReadPath(doc, "hosts_directory", config.hosts_directory_);
  ReadPath(doc, "artifacts_directory", config.artifacts_directory_);
  Read(doc, "image_host", config.image_host_id_);

  const auto& log = Section(doc, "log");
  Read(log, "level", config.log_.level_);
  Read(log, "file", config.log_.file_path_);
  Read(log, "pattern", config.log_.pattern_);
  Read(log, "max_file_size", config.log_.max_file_size_);
  Read(log, "max_files", config.log_.max_files_);
  Read(log, "console", config.log_.console_);

  const auto& engine = Section(doc, "engine");
  Read(engine, "thumbnail_size", config.engine_.thumbnail_size_);
  Read(engine, "thumbnail_format", config.engine_.thumbnail_format_);
  Read(engine, "max_retries", config.engine_.max_retries_);
  Read(engine, "parallel_batch_size", config.engine_.parallel_batch_size_);
  Read(engine, "template_name", config.engine_.template_name_);
  int64_t retry_delay_ms = config.engine_.retry_delay_.count();
  Read(engine, "retry_delay_ms", retry_delay_ms);
  if (retry_delay_ms < 0) {
    throw ValidationError("retry_delay_ms must not be negative");
  }
  config.engine_.retry_delay_ = std::chrono::milliseconds(retry_delay_ms);
  if (config.engine_.parallel_batch_size_ == 0) {
    throw ValidationError("parallel_batch_size must be at least 1");
  }

  const auto& bandwidth = Section(doc, "bandwidth");
  int64_t     interval_ms = config.bandwidth_.interval_.count();
  Read(bandwidth, "interval_ms", interval_ms);
  if (interval_ms <= 0) {
    throw ValidationError("bandwidth interval_ms must be positive");
  }
  config.bandwidth_.interval_ = std::chrono::milliseconds(interval_ms);
  Read(bandwidth, "window", config.bandwidth_.window_size_);
  Read(bandwidth, "alpha_up", config.bandwidth_.alpha_up_);
  Read(bandwidth, "alpha_down", config.bandwidth_.alpha_down_);

  const auto& queue = Section(doc, "queue");
  Read(queue, "worker_count", config.queue_.worker_count_);
  Read(queue, "event_capacity", config.queue_.event_capacity_);
  Read(queue, "auto_start_file_hosts", config.queue_.auto_start_file_hosts_);
  return config;
}

auto AppConfig::LoadFile(const file_path_t& path) -> AppConfig {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ValidationError("Failed to open configuration file", path.string());
  }

  nlohmann::json doc;
  try {
    file >> doc;
  } catch (const nlohmann::json::parse_error& e) {
    throw ValidationError("Malformed configuration file " + path.filename().string(), e.what());
  }

  auto config = FromJson(doc);
  auto base   = path.has_parent_path() ? path.parent_path() : file_path_t{};
  for (auto* relative : {&config.database_path_, &config.token_cache_path_,
                         &config.hosts_directory_, &config.artifacts_directory_}) {
    if (relative->is_relative()) *relative = base / *relative;
  }
  if (!config.log_.file_path_.empty() && file_path_t(config.log_.file_path_).is_relative()) {
    config.log_.file_path_ = (base / config.log_.file_path_).string();
  }
  return config;
}
};  // namespace imxup
