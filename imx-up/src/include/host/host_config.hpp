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
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "host/http_transport.hpp"
#include "type/type.hpp"

namespace imxup {
// Mixed key/index path into a JSON document, e.g. ["data", 0, "url"]
using JsonPathStep = std::variant<std::string, int64_t>;
using JsonPath     = std::vector<JsonPathStep>;

auto ParseJsonPath(const nlohmann::json& value) -> JsonPath;

/**
 * @brief Walk path through doc. Returns nullptr when a step is missing or of the wrong kind.
 */
auto ExtractJsonPath(const nlohmann::json& doc, const JsonPath& path) -> const nlohmann::json*;

// JSON scalars as text; strings are returned unquoted
auto JsonScalarToString(const nlohmann::json& value) -> std::string;

// Numbers may arrive as JSON numbers or numeric strings
auto JsonToUint64(const nlohmann::json* value) -> std::optional<uint64_t>;
auto JsonToBool(const nlohmann::json* value) -> std::optional<bool>;

struct NoAuth {};

/**
 * @brief Stateless key sent with every request, either as a header ("<scheme> <key>") or as a
 * query parameter.
 */
struct ApiKeyAuth {
  std::string header_ = "Authorization";
  std::string scheme_ = "Bearer";
  std::string query_param_;
};

/**
 * @brief username:password exchanged for a bearer token with a limited lifetime. The token is
 * substituted for "{token}" in URLs and form fields, and sent as a header when header_ is set.
 */
struct TokenLoginAuth {
  std::string                        login_url_;
  HttpMethod                         login_method_ = HttpMethod::GET;
  std::map<std::string, std::string> login_fields_;
  JsonPath                           token_path_;
  JsonPath                           error_path_;
  std::optional<int64_t>             token_ttl_s_;
  int64_t                            refresh_margin_s_ = 60;
  std::string                        header_;
  std::string                        scheme_ = "Bearer";
  JsonPath                           storage_total_path_;
  JsonPath                           storage_used_path_;
  JsonPath                           storage_left_path_;
};

enum class CaptchaTransform : uint8_t { NONE = 0, MOVE_3RD_TO_FRONT, REVERSE };

/**
 * @brief Form login that yields a cookie jar. The login page may carry hidden fields and a
 * numeric captcha drawn with positioned spans.
 */
struct SessionCookieAuth {
  std::string                        login_url_;
  std::string                        login_page_url_;
  std::map<std::string, std::string> login_fields_;
  std::string                        captcha_regex_;
  std::string                        captcha_field_     = "code";
  CaptchaTransform                   captcha_transform_ = CaptchaTransform::NONE;
  std::string                        session_cookie_name_;
  std::string                        session_id_regex_;
  std::string                        upload_page_url_;
  std::optional<int64_t>             session_ttl_s_;
};

using AuthScheme = std::variant<NoAuth, ApiKeyAuth, TokenLoginAuth, SessionCookieAuth>;

auto AuthSchemeName(const AuthScheme& auth) -> const char*;

struct HostTimeouts {
  long connect_s_    = 30;
  long inactivity_s_ = 300;
  // 0 means unbounded
  long upload_s_     = 0;
};

enum class ResponseType : uint8_t { JSON = 0, TEXT, REDIRECT };

struct ResponseParsing {
  ResponseType type_ = ResponseType::JSON;
  JsonPath     link_path_;
  std::string  link_prefix_;
  std::string  link_suffix_;
  std::string  link_regex_;
  JsonPath     file_id_path_;
  std::string  file_id_regex_;
};

struct UploadSpec {
  std::string                        get_server_url_;
  JsonPath                           server_response_path_;
  std::string                        endpoint_;
  HttpMethod                         method_     = HttpMethod::POST;
  std::string                        file_field_ = "file";
  std::map<std::string, std::string> extra_fields_;
};

struct DeleteSpec {
  std::string url_;
  HttpMethod  method_ = HttpMethod::GET;
};

struct UserInfoSpec {
  std::string url_;
  JsonPath    storage_total_path_;
  JsonPath    storage_used_path_;
  JsonPath    storage_left_path_;
  JsonPath    premium_path_;
  // Alternative for HTML pages: two groups, used and total, in GiB
  std::string storage_regex_;
};

struct Triggers {
  bool on_added_     = false;
  bool on_started_   = false;
  bool on_completed_ = false;
};

enum class TriggerEvent : uint8_t { ADDED = 0, STARTED, COMPLETED };

/**
 * @brief Image host specifics: gallery creation, per-image fields and URL templates.
 */
struct ImageHostSpec {
  std::string gallery_create_url_;
  std::string gallery_name_field_      = "gallery_name";
  JsonPath    gallery_id_path_;
  // Anonymous galleries need a separate rename step
  bool        creates_named_galleries_ = true;
  std::string rename_url_;
  std::string rename_id_field_         = "id";
  std::string rename_name_field_       = "name";

  std::string upload_url_;
  std::string image_field_             = "image";
  std::string gallery_id_field_        = "gallery_id";
  std::string thumbnail_size_field_    = "thumbnail_size";
  std::string thumbnail_format_field_  = "thumbnail_format";
  JsonPath    status_path_;
  std::string success_status_          = "success";
  JsonPath    image_id_path_;
  JsonPath    image_url_path_;
  JsonPath    thumb_url_path_;
  JsonPath    upload_gallery_id_path_;

  std::string gallery_url_template_;
  std::string thumbnail_url_template_;

  size_t      name_max_length_ = 200;
  std::string name_forbidden_chars_;
};

enum class HostKind : uint8_t { FILE_HOST = 0, IMAGE_HOST };

/**
 * @brief Static settings of one host, loaded once per run and read-only afterwards.
 */
struct HostConfig {
  std::string                  id_;
  std::string                  name_;
  HostKind                     kind_    = HostKind::FILE_HOST;
  bool                         enabled_ = true;

  AuthScheme                   auth_ = NoAuth{};
  HostTimeouts                 timeouts_;
  UploadSpec                   upload_;
  ResponseParsing              response_;
  DeleteSpec                   delete_;
  UserInfoSpec                 user_info_;
  Triggers                     triggers_;
  std::optional<ImageHostSpec> image_;

  std::optional<uint64_t>      max_file_size_mb_;
  uint32_t                     max_connections_ = 2;
  bool                         auto_retry_      = true;
  uint32_t                     max_retries_     = 3;

  auto RequiresAuth() const -> bool { return !std::holds_alternative<NoAuth>(auth_); }
  auto FiresOn(TriggerEvent event) const -> bool;

  /**
   * @brief Make name acceptable to the host: control and forbidden characters removed,
   * whitespace collapsed, length capped. Falls back to fallback when nothing is left.
   */
  auto SanitizeGalleryName(const std::string& name, const std::string& fallback) const
      -> std::string;

  static auto FromJson(const std::string& id, const nlohmann::json& doc) -> HostConfig;
};

/**
 * @brief All known hosts by id. Configs load from a directory of "<id>.json" files; a later
 * directory overrides hosts of an earlier one.
 */
class HostConfigRegistry {
 public:
  auto LoadDirectory(const folder_path_t& directory) -> size_t;
  void LoadFile(const file_path_t& file);
  void Add(HostConfig config);

  auto Get(const std::string& id) const -> const HostConfig*;
  auto Ids() const -> std::vector<std::string>;
  auto Enabled(HostKind kind) const -> std::vector<const HostConfig*>;
  auto ByTrigger(TriggerEvent event) const -> std::vector<const HostConfig*>;

 private:
  std::map<std::string, HostConfig> hosts_;
};
};  // namespace imxup
