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

#include "host/host_config.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <utility>

#include "type/errors.hpp"
#include "utils/log/logger.hpp"
#include "utils/string/string_utils.hpp"

namespace imxup {
namespace {
using nlohmann::json;

auto ParseMethod(const std::string& value, HttpMethod fallback) -> HttpMethod {
  auto lower = strutil::ToLower(value);
  if (lower.empty()) return fallback;
  if (lower == "get") return HttpMethod::GET;
  if (lower == "post") return HttpMethod::POST;
  if (lower == "put") return HttpMethod::PUT;
  if (lower == "delete") return HttpMethod::DELETE;
  throw ValidationError(std::format("Unsupported HTTP method '{}'", value));
}

auto StringMap(const json& doc, const char* key) -> std::map<std::string, std::string> {
  std::map<std::string, std::string> fields;
  if (!doc.contains(key)) return fields;
  for (const auto& [name, value] : doc.at(key).items()) {
    fields[name] = JsonScalarToString(value);
  }
  return fields;
}

auto PathOf(const json& doc, const char* key) -> JsonPath {
  if (!doc.contains(key) || doc.at(key).is_null()) return {};
  return ParseJsonPath(doc.at(key));
}

auto ParseCaptchaTransform(const std::string& value) -> CaptchaTransform {
  if (value.empty() || value == "none") return CaptchaTransform::NONE;
  if (value == "move_3rd_to_front") return CaptchaTransform::MOVE_3RD_TO_FRONT;
  if (value == "reverse") return CaptchaTransform::REVERSE;
  throw ValidationError(std::format("Unknown captcha transform '{}'", value));
}

auto ParseAuth(const std::string& auth_type, const json& auth) -> AuthScheme {
  if (auth_type.empty() || auth_type == "none") return NoAuth{};

  if (auth_type == "api_key" || auth_type == "bearer") {
    ApiKeyAuth scheme;
    scheme.header_      = auth.value("header", scheme.header_);
    scheme.scheme_      = auth.value("scheme", auth_type == "bearer" ? "Bearer" : scheme.scheme_);
    scheme.query_param_ = auth.value("query_param", "");
    return scheme;
  }

  if (auth_type == "token_login") {
    TokenLoginAuth scheme;
    scheme.login_url_    = auth.value("login_url", "");
    scheme.login_method_ = ParseMethod(auth.value("login_method", ""), HttpMethod::GET);
    scheme.login_fields_ = StringMap(auth, "login_fields");
    scheme.token_path_   = PathOf(auth, "token_path");
    scheme.error_path_   = PathOf(auth, "error_path");
    if (auth.contains("token_ttl") && auth.at("token_ttl").is_number()) {
      scheme.token_ttl_s_ = auth.at("token_ttl").get<int64_t>();
    }
    scheme.refresh_margin_s_   = auth.value("refresh_margin", scheme.refresh_margin_s_);
    scheme.header_             = auth.value("header", "");
    scheme.scheme_             = auth.value("scheme", scheme.scheme_);
    scheme.storage_total_path_ = PathOf(auth, "storage_total_path");
    scheme.storage_used_path_  = PathOf(auth, "storage_used_path");
    scheme.storage_left_path_  = PathOf(auth, "storage_left_path");
    if (scheme.login_url_.empty() || scheme.token_path_.empty()) {
      throw ValidationError("token_login needs login_url and token_path");
    }
    return scheme;
  }

  if (auth_type == "session") {
    SessionCookieAuth scheme;
    scheme.login_url_           = auth.value("login_url", "");
    scheme.login_page_url_      = auth.value("login_page_url", scheme.login_url_);
    scheme.login_fields_        = StringMap(auth, "login_fields");
    scheme.captcha_regex_       = auth.value("captcha_regex", "");
    scheme.captcha_field_       = auth.value("captcha_field", scheme.captcha_field_);
    scheme.captcha_transform_   = ParseCaptchaTransform(auth.value("captcha_transform", ""));
    scheme.session_cookie_name_ = auth.value("session_cookie_name", "");
    scheme.session_id_regex_    = auth.value("session_id_regex", "");
    scheme.upload_page_url_     = auth.value("upload_page_url", "");
    if (auth.contains("session_ttl") && auth.at("session_ttl").is_number()) {
      scheme.session_ttl_s_ = auth.at("session_ttl").get<int64_t>();
    }
    if (scheme.login_url_.empty()) {
      throw ValidationError("session auth needs login_url");
    }
    return scheme;
  }

  throw ValidationError(std::format("Unknown auth_type '{}'", auth_type));
}

auto ParseImageHost(const json& doc) -> ImageHostSpec {
  ImageHostSpec spec;
  spec.gallery_create_url_      = doc.value("gallery_create_url", "");
  spec.gallery_name_field_      = doc.value("gallery_name_field", spec.gallery_name_field_);
  spec.gallery_id_path_         = PathOf(doc, "gallery_id_path");
  spec.creates_named_galleries_ = doc.value("creates_named_galleries", true);
  spec.rename_url_              = doc.value("rename_url", "");
  spec.rename_id_field_         = doc.value("rename_id_field", spec.rename_id_field_);
  spec.rename_name_field_       = doc.value("rename_name_field", spec.rename_name_field_);
  spec.upload_url_              = doc.value("upload_url", "");
  spec.image_field_             = doc.value("image_field", spec.image_field_);
  spec.gallery_id_field_        = doc.value("gallery_id_field", spec.gallery_id_field_);
  spec.thumbnail_size_field_    = doc.value("thumbnail_size_field", spec.thumbnail_size_field_);
  spec.thumbnail_format_field_ = doc.value("thumbnail_format_field", spec.thumbnail_format_field_);
  spec.status_path_             = PathOf(doc, "status_path");
  spec.success_status_          = doc.value("success_status", spec.success_status_);
  spec.image_id_path_           = PathOf(doc, "image_id_path");
  spec.image_url_path_          = PathOf(doc, "image_url_path");
  spec.thumb_url_path_          = PathOf(doc, "thumb_url_path");
  spec.upload_gallery_id_path_  = PathOf(doc, "upload_gallery_id_path");
  spec.gallery_url_template_    = doc.value("gallery_url_template", "");
  spec.thumbnail_url_template_  = doc.value("thumbnail_url_template", "");
  spec.name_max_length_         = doc.value("name_max_length", spec.name_max_length_);
  spec.name_forbidden_chars_    = doc.value("name_forbidden_chars", "");
  if (spec.upload_url_.empty()) {
    throw ValidationError("image_host needs upload_url");
  }
  return spec;
}
}  // namespace

auto ParseJsonPath(const nlohmann::json& value) -> JsonPath {
  JsonPath path;
  if (value.is_string()) {
    path.emplace_back(value.get<std::string>());
    return path;
  }
  if (!value.is_array()) {
    throw ValidationError("JSON path must be a string or an array");
  }
  for (const auto& step : value) {
    if (step.is_number_integer()) {
      path.emplace_back(step.get<int64_t>());
    } else if (step.is_string()) {
      path.emplace_back(step.get<std::string>());
    } else {
      throw ValidationError("JSON path steps must be strings or integers");
    }
  }
  return path;
}

auto ExtractJsonPath(const nlohmann::json& doc, const JsonPath& path) -> const nlohmann::json* {
  const nlohmann::json* current = &doc;
  for (const auto& step : path) {
    if (const auto* key = std::get_if<std::string>(&step)) {
      if (!current->is_object()) return nullptr;
      auto it = current->find(*key);
      if (it == current->end()) return nullptr;
      current = &*it;
    } else {
      auto index = std::get<int64_t>(step);
      if (!current->is_array() || index < 0 || static_cast<size_t>(index) >= current->size()) {
        return nullptr;
      }
      current = &(*current)[static_cast<size_t>(index)];
    }
    if (current->is_null()) return nullptr;
  }
  return current;
}

auto JsonScalarToString(const nlohmann::json& value) -> std::string {
  if (value.is_string()) return value.get<std::string>();
  if (value.is_null()) return {};
  return value.dump();
}

auto JsonToUint64(const nlohmann::json* value) -> std::optional<uint64_t> {
  if (value == nullptr) return std::nullopt;
  if (value->is_number_unsigned()) return value->get<uint64_t>();
  if (value->is_number_integer()) {
    auto signed_value = value->get<int64_t>();
    if (signed_value < 0) return std::nullopt;
    return static_cast<uint64_t>(signed_value);
  }
  if (value->is_number_float()) {
    auto real = value->get<double>();
    if (real < 0) return std::nullopt;
    return static_cast<uint64_t>(real);
  }
  if (value->is_string()) {
    const auto& text = value->get_ref<const std::string&>();
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
      return std::nullopt;
    }
    return std::stoull(text);
  }
  return std::nullopt;
}

auto JsonToBool(const nlohmann::json* value) -> std::optional<bool> {
  if (value == nullptr) return std::nullopt;
  if (value->is_boolean()) return value->get<bool>();
  if (value->is_number()) return value->get<double>() != 0.0;
  if (value->is_string()) {
    auto text = strutil::ToLower(value->get<std::string>());
    return text == "1" || text == "true" || text == "yes" || text == "premium";
  }
  return std::nullopt;
}

auto AuthSchemeName(const AuthScheme& auth) -> const char* {
  struct Namer {
    auto operator()(const NoAuth&) const -> const char* { return "none"; }
    auto operator()(const ApiKeyAuth&) const -> const char* { return "api_key"; }
    auto operator()(const TokenLoginAuth&) const -> const char* { return "token_login"; }
    auto operator()(const SessionCookieAuth&) const -> const char* { return "session"; }
  };
  return std::visit(Namer{}, auth);
}

auto HostConfig::FiresOn(TriggerEvent event) const -> bool {
  if (!enabled_) return false;
  switch (event) {
    case TriggerEvent::ADDED:
      return triggers_.on_added_;
    case TriggerEvent::STARTED:
      return triggers_.on_started_;
    case TriggerEvent::COMPLETED:
      return triggers_.on_completed_;
  }
  return false;
}

auto HostConfig::SanitizeGalleryName(const std::string& name, const std::string& fallback) const
    -> std::string {
  size_t      max_length = image_ ? image_->name_max_length_ : 200;
  std::string forbidden  = image_ ? image_->name_forbidden_chars_ : std::string{};

  std::string cleaned;
  bool        pending_space = false;
  for (unsigned char c : name) {
    if (c < 0x20 || c == 0x7f || c == ' ') {
      // Control characters count as whitespace
      pending_space = !cleaned.empty();
      continue;
    }
    if (forbidden.find(static_cast<char>(c)) != std::string::npos) continue;
    if (pending_space) {
      cleaned.push_back(' ');
      pending_space = false;
    }
    cleaned.push_back(static_cast<char>(c));
  }

  if (cleaned.size() > max_length) {
    size_t cut = max_length;
    // Never split a UTF-8 sequence
    while (cut > 0 && (static_cast<unsigned char>(cleaned[cut]) & 0xC0) == 0x80) --cut;
    cleaned = strutil::Trim(cleaned.substr(0, cut));
  }

  if (cleaned.empty()) {
    return fallback.empty() ? std::string{"gallery"} : SanitizeGalleryName(fallback, {});
  }
  return cleaned;
}

/**
 * @brief Build a config from its JSON document. Missing keys take defaults; malformed values
 * throw ValidationError.
 *
 * @param id
 * @param doc
 * @return HostConfig
 */
auto HostConfig::FromJson(const std::string& id, const nlohmann::json& doc) -> HostConfig {
  try {
    HostConfig config;
    config.id_      = id;
    config.name_    = doc.value("name", id);
    config.kind_    = doc.value("kind", "file") == "image" ? HostKind::IMAGE_HOST
                                                           : HostKind::FILE_HOST;
    config.enabled_ = doc.value("enabled", true);

    const json empty = json::object();
    config.auth_     = ParseAuth(doc.value("auth_type", ""), doc.value("auth", empty));

    config.timeouts_.connect_s_ = doc.value("connect_timeout_seconds", config.timeouts_.connect_s_);
    config.timeouts_.inactivity_s_ =
        doc.value("inactivity_timeout_seconds", config.timeouts_.inactivity_s_);
    config.timeouts_.upload_s_ = doc.value("upload_timeout_seconds", config.timeouts_.upload_s_);

    auto upload                  = doc.value("upload", empty);
    config.upload_.get_server_url_ = upload.value("get_server", "");
    config.upload_.server_response_path_ = PathOf(upload, "server_response_path");
    config.upload_.endpoint_     = upload.value("endpoint", "");
    config.upload_.method_       = ParseMethod(upload.value("method", ""), HttpMethod::POST);
    config.upload_.file_field_   = upload.value("file_field", config.upload_.file_field_);
    config.upload_.extra_fields_ = StringMap(upload, "extra_fields");

    auto        response = doc.value("response", empty);
    std::string type     = response.value("type", "json");
    if (type == "json") {
      config.response_.type_ = ResponseType::JSON;
    } else if (type == "text" || type == "regex") {
      config.response_.type_ = ResponseType::TEXT;
    } else if (type == "redirect") {
      config.response_.type_ = ResponseType::REDIRECT;
    } else {
      throw ValidationError(std::format("Unknown response type '{}'", type));
    }
    config.response_.link_path_     = PathOf(response, "link_path");
    config.response_.link_prefix_   = response.value("link_prefix", "");
    config.response_.link_suffix_   = response.value("link_suffix", "");
    config.response_.link_regex_    = response.value("link_regex", "");
    config.response_.file_id_path_  = PathOf(response, "file_id_path");
    config.response_.file_id_regex_ = response.value("file_id_regex", "");

    auto del               = doc.value("delete", empty);
    config.delete_.url_    = del.value("url", "");
    config.delete_.method_ = ParseMethod(del.value("method", ""), HttpMethod::GET);

    auto info                             = doc.value("user_info", empty);
    config.user_info_.url_                = info.value("url", "");
    config.user_info_.storage_total_path_ = PathOf(info, "storage_total_path");
    config.user_info_.storage_used_path_  = PathOf(info, "storage_used_path");
    config.user_info_.storage_left_path_  = PathOf(info, "storage_left_path");
    config.user_info_.premium_path_       = PathOf(info, "premium_status_path");
    config.user_info_.storage_regex_      = info.value("storage_regex", "");

    auto triggers                   = doc.value("triggers", empty);
    config.triggers_.on_added_      = triggers.value("on_added", false);
    config.triggers_.on_started_    = triggers.value("on_started", false);
    config.triggers_.on_completed_  = triggers.value("on_completed", false);

    auto limits = doc.value("limits", empty);
    if (limits.contains("max_file_size_mb") && limits.at("max_file_size_mb").is_number()) {
      config.max_file_size_mb_ = limits.at("max_file_size_mb").get<uint64_t>();
    }
    config.max_connections_ = std::max<uint32_t>(1, limits.value("max_connections", 2u));

    auto retry           = doc.value("retry", empty);
    config.auto_retry_   = retry.value("auto_retry", true);
    config.max_retries_  = retry.value("max_retries", 3u);

    if (config.kind_ == HostKind::IMAGE_HOST) {
      config.image_ = ParseImageHost(doc.value("image_host", empty));
    } else if (config.upload_.endpoint_.empty()) {
      throw ValidationError("upload.endpoint is required");
    }
    return config;
  } catch (const nlohmann::json::exception& e) {
    throw ValidationError(std::format("Host config '{}' is malformed", id), e.what());
  } catch (const ValidationError& e) {
    throw ValidationError(std::format("Host config '{}': {}", id, e.Reason()), e.Details());
  }
}

/**
 * @brief Load every "*.json" file of a directory. A broken file is logged and skipped.
 *
 * @param directory
 * @return number of hosts loaded
 */
auto HostConfigRegistry::LoadDirectory(const folder_path_t& directory) -> size_t {
  std::error_code ec;
  if (!std::filesystem::is_directory(directory, ec)) return 0;

  std::vector<file_path_t> files;
  for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
    if (entry.is_regular_file() && strutil::ToLower(entry.path().extension().string()) == ".json") {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());

  size_t loaded = 0;
  for (const auto& file : files) {
    try {
      LoadFile(file);
      ++loaded;
    } catch (const ImxupError& e) {
      Logger::Get(LogCategory::FILE_HOSTS)
          ->error("Skipping host config {}: {}", file.string(), e.what());
    }
  }
  return loaded;
}

void HostConfigRegistry::LoadFile(const file_path_t& file) {
  std::ifstream in(file);
  if (!in) {
    throw ValidationError("Cannot open host config", file.string());
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::parse_error& e) {
    throw ValidationError("Host config is not valid JSON", e.what());
  }
  auto config = HostConfig::FromJson(file.stem().string(), doc);
  Logger::Get(LogCategory::FILE_HOSTS)
      ->debug("Loaded host {} ({}, auth {})", config.name_, config.id_,
              AuthSchemeName(config.auth_));
  Add(std::move(config));
}

void HostConfigRegistry::Add(HostConfig config) {
  auto id    = config.id_;
  hosts_[id] = std::move(config);
}

auto HostConfigRegistry::Get(const std::string& id) const -> const HostConfig* {
  auto it = hosts_.find(id);
  return it == hosts_.end() ? nullptr : &it->second;
}

auto HostConfigRegistry::Ids() const -> std::vector<std::string> {
  std::vector<std::string> ids;
  for (const auto& [id, _] : hosts_) ids.push_back(id);
  return ids;
}

auto HostConfigRegistry::Enabled(HostKind kind) const -> std::vector<const HostConfig*> {
  std::vector<const HostConfig*> enabled;
  for (const auto& [_, config] : hosts_) {
    if (config.enabled_ && config.kind_ == kind) enabled.push_back(&config);
  }
  return enabled;
}

auto HostConfigRegistry::ByTrigger(TriggerEvent event) const -> std::vector<const HostConfig*> {
  std::vector<const HostConfig*> hosts;
  for (const auto& [_, config] : hosts_) {
    if (config.kind_ == HostKind::FILE_HOST && config.FiresOn(event)) hosts.push_back(&config);
  }
  return hosts;
}
};  // namespace imxup
