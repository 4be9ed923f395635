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

#include "host/token_cache.hpp"

#include <filesystem>
#include <fstream>
#include <utility>

#include "type/errors.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/log/logger.hpp"

namespace imxup {
auto SessionState::ToJson() const -> nlohmann::json {
  nlohmann::json doc;
  doc["token"]      = token_;
  doc["cookies"]    = cookies_;
  doc["session_id"] = session_id_;
  doc["issued_at"]  = issued_at_;
  doc["expires_at"] = expires_at_.has_value() ? nlohmann::json(*expires_at_) : nlohmann::json();
  return doc;
}

auto SessionState::FromJson(const nlohmann::json& doc) -> SessionState {
  SessionState state;
  state.token_      = doc.value("token", "");
  state.cookies_    = doc.value("cookies", std::map<std::string, std::string>{});
  state.session_id_ = doc.value("session_id", "");
  state.issued_at_  = doc.value("issued_at", int64_t{0});
  if (doc.contains("expires_at") && doc.at("expires_at").is_number()) {
    state.expires_at_ = doc.at("expires_at").get<int64_t>();
  }
  return state;
}

TokenCache::TokenCache(file_path_t path) : path_(std::move(path)) {}

auto TokenCache::Load(const std::string& host_id) -> std::optional<SessionState> {
  std::lock_guard<std::mutex> lock(mtx_);
  ReadFileLocked();
  auto it = entries_.find(host_id);
  if (it == entries_.end()) return std::nullopt;
  if (it->second.IsExpired(TimeProvider::NowUnix())) {
    Logger::Get(LogCategory::AUTH)->debug("Cached session for {} expired", host_id);
    entries_.erase(it);
    WriteFileLocked();
    return std::nullopt;
  }
  return it->second;
}

void TokenCache::Store(const std::string& host_id, const SessionState& state) {
  std::lock_guard<std::mutex> lock(mtx_);
  ReadFileLocked();
  entries_[host_id] = state;
  WriteFileLocked();
}

void TokenCache::Clear(const std::string& host_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  ReadFileLocked();
  if (entries_.erase(host_id) > 0) WriteFileLocked();
}

void TokenCache::ClearAll() {
  std::lock_guard<std::mutex> lock(mtx_);
  loaded_ = true;
  entries_.clear();
  WriteFileLocked();
}

void TokenCache::ReadFileLocked() {
  if (loaded_) return;
  loaded_ = true;
  if (path_.empty()) return;

  std::ifstream in(path_);
  if (!in) return;
  try {
    nlohmann::json doc;
    in >> doc;
    for (const auto& [host_id, entry] : doc.items()) {
      entries_[host_id] = SessionState::FromJson(entry);
    }
  } catch (const nlohmann::json::exception& e) {
    // A corrupt cache only costs a fresh login
    Logger::Get(LogCategory::AUTH)->warn("Ignoring unreadable token cache {}: {}",
                                         path_.string(), e.what());
    entries_.clear();
  }
}

void TokenCache::WriteFileLocked() {
  if (path_.empty()) return;

  nlohmann::json doc = nlohmann::json::object();
  for (const auto& [host_id, state] : entries_) doc[host_id] = state.ToJson();

  std::error_code ec;
  if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path(), ec);

  auto tmp = path_;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw StorageError("Cannot write token cache", tmp.string());
    }
    out << doc.dump(2);
    if (!out.flush()) {
      throw StorageError("Cannot write token cache", tmp.string());
    }
  }
  std::filesystem::rename(tmp, path_, ec);
  if (ec) {
    throw StorageError("Cannot replace token cache", ec.message());
  }
}
};  // namespace imxup
