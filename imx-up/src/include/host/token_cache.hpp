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

#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "type/type.hpp"

namespace imxup {
/**
 * @brief What a successful login leaves behind. Never holds the credentials themselves.
 */
struct SessionState {
  std::string                        token_;
  std::map<std::string, std::string> cookies_;
  std::string                        session_id_;
  unix_ts_t                          issued_at_ = 0;
  // nullopt means the host never expires it
  std::optional<unix_ts_t>           expires_at_;

  auto Empty() const -> bool { return token_.empty() && cookies_.empty(); }
  auto IsExpired(unix_ts_t now, int64_t margin_s = 0) const -> bool {
    return expires_at_.has_value() && now + margin_s >= *expires_at_;
  }

  auto        ToJson() const -> nlohmann::json;
  static auto FromJson(const nlohmann::json& doc) -> SessionState;
};

/**
 * @brief Per-host session states persisted as one JSON file. Writes go to a temporary file
 * that is renamed over the old one. Expired entries are dropped when read. An empty path keeps
 * the cache in memory only.
 */
class TokenCache {
 public:
  explicit TokenCache(file_path_t path = {});

  auto Load(const std::string& host_id) -> std::optional<SessionState>;
  void Store(const std::string& host_id, const SessionState& state);
  void Clear(const std::string& host_id);
  void ClearAll();

 private:
  void                                ReadFileLocked();
  void                                WriteFileLocked();

  std::mutex                          mtx_;
  file_path_t                         path_;
  bool                                loaded_ = false;
  std::map<std::string, SessionState> entries_;
};
};  // namespace imxup
