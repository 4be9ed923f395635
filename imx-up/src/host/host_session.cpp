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


#include "host/host_session.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <regex>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "utils/clock/time_provider.hpp"
#include "utils/string/string_utils.hpp"

namespace imxup {
namespace {
using nlohmann::json;

auto FillLoginFields(const std::map<std::string, std::string>& templates,
                     const Credentials&                        credentials)
    -> std::map<std::string, std::string> {
  std::map<std::string, std::string> fields;
  for (const auto& [name, value] : templates) {
    fields[name] = strutil::FormatTemplate(
        value, {{"username", credentials.username_}, {"password", credentials.password_}});
  }
  return fields;
}

auto AppendQuery(const std::string& url, const std::string& query) -> std::string {
  if (query.empty()) return url;
  return url + (url.find('?') == std::string::npos ? "?" : "&") + query;
}

// <input type="hidden" name=".." value=".."> pairs of a login form
auto ExtractHiddenFields(const std::string& html) -> std::map<std::string, std::string> {
  static const std::regex input_re(R"(<input[^>]+type=["']hidden["'][^>]*>)",
                                   std::regex::icase);
  static const std::regex name_re(R"(name=["']([^"']+)["'])");
  static const std::regex value_re(R"(value=["']([^"']*)["'])");

  std::map<std::string, std::string> fields;
  for (auto it = std::sregex_iterator(html.begin(), html.end(), input_re);
       it != std::sregex_iterator(); ++it) {
    const std::string tag = it->str();
    std::smatch       name_match;
    if (!std::regex_search(tag, name_match, name_re)) continue;
    std::smatch value_match;
    fields[name_match[1].str()] =
        std::regex_search(tag, value_match, value_re) ? value_match[1].str() : std::string{};
  }
  return fields;
}

auto CompileHostRegex(const std::string& pattern, const char* what) -> std::regex {
  try {
    return std::regex(pattern);
  } catch (const std::regex_error& e) {
    throw ValidationError(std::format("Invalid {}", what), e.what());
  }
}

// false when text is not a number that fits an int
auto ParseNumber(const std::string& text, int* value) -> bool {
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), *value);
  return ec == std::errc() && end == text.data() + text.size();
}

auto ExtractStorage(const json& doc, const JsonPath& total, const JsonPath& used,
                    const JsonPath& left) -> std::optional<StorageInfo> {
  StorageInfo info;
  if (!total.empty()) info.total_bytes_ = JsonToUint64(ExtractJsonPath(doc, total));
  if (!used.empty()) info.used_bytes_ = JsonToUint64(ExtractJsonPath(doc, used));
  if (!left.empty()) info.left_bytes_ = JsonToUint64(ExtractJsonPath(doc, left));
  if (!info.total_bytes_ && !info.used_bytes_ && !info.left_bytes_) return std::nullopt;
  return info;
}
}  // namespace

auto Credentials::Parse(const std::string& opaque, const AuthScheme& scheme) -> Credentials {
  Credentials credentials;
  if (std::holds_alternative<ApiKeyAuth>(scheme)) {
    credentials.api_key_ = strutil::Trim(opaque);
    return credentials;
  }
  auto colon = opaque.find(':');
  if (colon != std::string::npos) {
    credentials.username_ = opaque.substr(0, colon);
    credentials.password_ = opaque.substr(colon + 1);
  }
  return credentials;
}

HostSession::HostSession(HostConfig config, std::shared_ptr<HttpTransport> transport,
                         const std::string& credentials, std::shared_ptr<TokenCache> cache,
                         std::optional<SessionState> initial_state)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      cache_(std::move(cache)),
      credentials_(Credentials::Parse(credentials, config_.auth_)) {
  if (initial_state.has_value() && !initial_state->Empty() &&
      !initial_state->IsExpired(TimeProvider::NowUnix())) {
    state_ = std::move(*initial_state);
    Logger::Get(LogCategory::AUTH)->debug("{}: reusing supplied session state", config_.id_);
  } else if (cache_ && CanReauthenticate()) {
    if (auto cached = cache_->Load(config_.id_); cached.has_value()) {
      state_ = std::move(*cached);
      Logger::Get(LogCategory::AUTH)
          ->debug("{}: reusing cached session {}", config_.id_, MaskSecret(state_.token_));
    }
  }
}

auto HostSession::CanReauthenticate() const -> bool {
  return std::holds_alternative<TokenLoginAuth>(config_.auth_) ||
         std::holds_alternative<SessionCookieAuth>(config_.auth_);
}

auto HostSession::RefreshMarginLocked() const -> int64_t {
  if (const auto* token = std::get_if<TokenLoginAuth>(&config_.auth_)) {
    return token->refresh_margin_s_;
  }
  return 0;
}

auto HostSession::NeedsLoginLocked() const -> bool {
  if (!CanReauthenticate()) return false;
  return state_.Empty() || state_.IsExpired(TimeProvider::NowUnix(), RefreshMarginLocked());
}

void HostSession::EnsureAuthenticated() {
  if (std::holds_alternative<ApiKeyAuth>(config_.auth_) && credentials_.api_key_.empty()) {
    throw AuthenticationError(std::format("No API key configured for {}", config_.name_));
  }
  std::lock_guard<std::mutex> lock(mtx_);
  if (!NeedsLoginLocked()) return;
  if (!state_.Empty()) {
    Logger::Get(LogCategory::AUTH)->info("{}: token near expiry, refreshing", config_.id_);
  }
  LoginLocked();
}

auto HostSession::Generation() const -> uint64_t {
  std::lock_guard<std::mutex> lock(mtx_);
  return generation_;
}

void HostSession::Reauthenticate(uint64_t seen_generation) {
  if (!CanReauthenticate()) {
    throw AuthenticationError(std::format("{} rejected the configured key", config_.name_));
  }
  std::lock_guard<std::mutex> lock(mtx_);
  if (generation_ != seen_generation) return;
  state_ = {};
  if (cache_) cache_->Clear(config_.id_);
  LoginLocked();
}

void HostSession::Invalidate() {
  std::lock_guard<std::mutex> lock(mtx_);
  state_ = {};
  if (cache_) cache_->Clear(config_.id_);
}

void HostSession::LoginLocked() {
  if (credentials_.username_.empty()) {
    throw AuthenticationError(
        std::format("{} requires credentials in the form username:password", config_.name_));
  }
  if (const auto* token = std::get_if<TokenLoginAuth>(&config_.auth_)) {
    LoginWithToken(*token);
  } else if (const auto* session = std::get_if<SessionCookieAuth>(&config_.auth_)) {
    LoginWithSession(*session);
  }
  ++generation_;
  ++login_count_;
  if (cache_) cache_->Store(config_.id_, state_);
}

void HostSession::LoginWithToken(const TokenLoginAuth& auth) {
  Logger::Get(LogCategory::AUTH)->info("Logging in to {}", config_.name_);

  HttpRequest request;
  request.method_            = auth.login_method_;
  request.connect_timeout_s_ = config_.timeouts_.connect_s_;
  request.total_timeout_s_   = 30;
  auto fields                = FillLoginFields(auth.login_fields_, credentials_);
  if (auth.login_method_ == HttpMethod::GET) {
    request.url_ = AppendQuery(auth.login_url_, FormEncode(fields));
  } else {
    request.url_                     = auth.login_url_;
    request.body_                    = FormEncode(fields);
    request.headers_["Content-Type"] = "application/x-www-form-urlencoded";
  }

  auto response = transport_->Perform(request);
  if (response.status_ != 200) {
    throw AuthenticationError(std::format("Login failed with status {}", response.status_),
                              response.body_);
  }

  json doc = json::parse(response.body_, nullptr, false);
  if (doc.is_discarded()) {
    throw AuthenticationError("Login response is not JSON", response.body_);
  }

  // Some APIs answer 200 and carry their own status code in the body
  if (doc.is_object() && doc.contains("status") && doc.at("status").is_number_integer() &&
      doc.at("status").get<int64_t>() != 200) {
    std::string message;
    if (!auth.error_path_.empty()) {
      if (const auto* error = ExtractJsonPath(doc, auth.error_path_)) {
        message = JsonScalarToString(*error);
      }
    }
    if (message.empty()) {
      message = std::format("API returned status {}", doc.at("status").get<int64_t>());
    }
    throw AuthenticationError("Login failed: " + message, response.body_);
  }

  const auto* token_value = ExtractJsonPath(doc, auth.token_path_);
  if (token_value == nullptr || token_value->is_null()) {
    throw AuthenticationError("Failed to extract token from login response");
  }
  auto token = JsonScalarToString(*token_value);
  if (token.empty()) {
    throw AuthenticationError("Login response carries an empty token");
  }

  SessionState state;
  state.token_     = std::move(token);
  state.issued_at_ = TimeProvider::NowUnix();
  if (auth.token_ttl_s_.has_value()) state.expires_at_ = state.issued_at_ + *auth.token_ttl_s_;
  state_ = std::move(state);

  auto storage = ExtractStorage(doc, auth.storage_total_path_, auth.storage_used_path_,
                                auth.storage_left_path_);
  if (storage.has_value()) {
    login_storage_ = storage;
    Logger::Get(LogCategory::FILE_HOSTS)->debug("{}: storage info cached from login", config_.id_);
  }
  Logger::Get(LogCategory::AUTH)
      ->info("Logged in to {} (token {})", config_.name_, MaskSecret(state_.token_));
}

void HostSession::LoginWithSession(const SessionCookieAuth& auth) {
  auto log = Logger::Get(LogCategory::AUTH);
  log->info("Logging in to {} (session)", config_.name_);

  // Step 1: the login page sets the first cookies and carries hidden fields and the captcha
  HttpRequest page_request;
  page_request.url_               = auth.login_page_url_;
  page_request.connect_timeout_s_ = config_.timeouts_.connect_s_;
  page_request.total_timeout_s_   = 30;
  auto page                       = transport_->Perform(page_request);

  std::map<std::string, std::string> cookies = page.cookies_;
  auto                               form    = ExtractHiddenFields(page.body_);
  for (auto& [name, value] : FillLoginFields(auth.login_fields_, credentials_)) {
    form[name] = std::move(value);
  }
  if (!auth.captcha_regex_.empty()) {
    auto code = SolveCaptcha(page.body_, auth.captcha_regex_, auth.captcha_transform_);
    if (code.empty()) {
      log->warn("{}: could not read the login captcha", config_.id_);
    } else {
      form[auth.captcha_field_] = code;
    }
  }

  // Step 2: post the form with the cookies from step 1
  HttpRequest login_request;
  login_request.method_                  = HttpMethod::POST;
  login_request.url_                     = auth.login_url_;
  login_request.body_                    = FormEncode(form);
  login_request.cookies_                 = cookies;
  login_request.headers_["Content-Type"] = "application/x-www-form-urlencoded";
  login_request.connect_timeout_s_       = config_.timeouts_.connect_s_;
  login_request.total_timeout_s_         = 30;
  auto login                             = transport_->Perform(login_request);
  if (login.status_ != 200 && login.status_ != 302) {
    throw AuthenticationError(std::format("Login failed with status {}", login.status_),
                              login.body_);
  }
  for (const auto& [name, value] : login.cookies_) cookies[name] = value;
  if (cookies.empty()) {
    throw AuthenticationError("Login failed: no session cookies received");
  }

  SessionState state;
  state.cookies_   = std::move(cookies);
  state.issued_at_ = TimeProvider::NowUnix();
  if (auth.session_ttl_s_.has_value()) state.expires_at_ = state.issued_at_ + *auth.session_ttl_s_;

  // Session id for upload forms: a cookie value, or scraped from the upload page
  if (!auth.session_cookie_name_.empty()) {
    auto it = state.cookies_.find(auth.session_cookie_name_);
    if (it != state.cookies_.end()) {
      state.session_id_ = it->second;
    } else {
      log->warn("{}: cookie {} not set by login", config_.id_, auth.session_cookie_name_);
    }
  } else if (!auth.session_id_regex_.empty()) {
    auto upload_page = auth.upload_page_url_;
    if (upload_page.empty()) {
      const auto& endpoint = config_.upload_.endpoint_;
      upload_page          = endpoint.substr(0, endpoint.rfind('/')) + "/upload";
    }
    HttpRequest upload_request;
    upload_request.url_               = upload_page;
    upload_request.cookies_           = state.cookies_;
    upload_request.connect_timeout_s_ = config_.timeouts_.connect_s_;
    upload_request.total_timeout_s_   = 30;
    auto        upload_html           = transport_->Perform(upload_request);

    auto        session_re = CompileHostRegex(auth.session_id_regex_, "session_id_regex");
    std::smatch match;
    if (std::regex_search(upload_html.body_, match, session_re) && match.size() > 1) {
      state.session_id_ = match[1].str();
    } else {
      log->warn("{}: session id not found on upload page", config_.id_);
    }
  }
  state_ = std::move(state);
  log->info("Logged in to {} ({} cookies)", config_.name_, state_.cookies_.size());
}

auto HostSession::Expand(const std::string& text) const -> std::string {
  std::lock_guard<std::mutex> lock(mtx_);
  return strutil::FormatTemplate(text,
                                 {{"token", state_.token_}, {"sess_id", state_.session_id_}});
}

void HostSession::Authorize(HttpRequest& request) const {
  std::lock_guard<std::mutex> lock(mtx_);
  const std::map<std::string, std::string> vars{{"token", state_.token_},
                                                {"sess_id", state_.session_id_}};
  request.url_ = strutil::FormatTemplate(request.url_, vars);
  for (auto& part : request.form_) {
    if (part.file_.empty()) part.value_ = strutil::FormatTemplate(part.value_, vars);
  }

  std::visit(
      [&](const auto& auth) {
        using T = std::decay_t<decltype(auth)>;
        if constexpr (std::is_same_v<T, ApiKeyAuth>) {
          if (!auth.query_param_.empty()) {
            request.url_ = AppendQuery(request.url_, auth.query_param_ + "=" +
                                                         UrlEncode(credentials_.api_key_));
          } else {
            request.headers_[auth.header_] = auth.scheme_.empty()
                                                 ? credentials_.api_key_
                                                 : auth.scheme_ + " " + credentials_.api_key_;
          }
        } else if constexpr (std::is_same_v<T, TokenLoginAuth>) {
          if (!auth.header_.empty() && !state_.token_.empty()) {
            request.headers_[auth.header_] =
                auth.scheme_.empty() ? state_.token_ : auth.scheme_ + " " + state_.token_;
          }
        } else if constexpr (std::is_same_v<T, SessionCookieAuth>) {
          for (const auto& [name, value] : state_.cookies_) request.cookies_[name] = value;
        }
      },
      config_.auth_);
}

auto HostSession::State() const -> SessionState {
  std::lock_guard<std::mutex> lock(mtx_);
  return state_;
}

auto HostSession::LoginStorage() const -> std::optional<StorageInfo> {
  std::lock_guard<std::mutex> lock(mtx_);
  return login_storage_;
}

auto HostSession::LoginCount() const -> uint64_t {
  std::lock_guard<std::mutex> lock(mtx_);
  return login_count_;
}

auto HostSession::SolveCaptcha(const std::string& html, const std::string& captcha_regex,
                               CaptchaTransform transform) -> std::string {
  static const std::regex span_re(R"(<span[^>]*padding-left:\s*(\d+)px[^>]*>([^<]+)</span>)");
  static const std::regex entity_re(R"(&#(\d+);)");

  auto        area_re = CompileHostRegex(captcha_regex, "captcha_regex");
  std::smatch area;
  if (!std::regex_search(html, area, area_re)) return {};
  const std::string captcha_area = area.str();

  std::vector<std::pair<int, std::string>> digits;
  for (auto it = std::sregex_iterator(captcha_area.begin(), captcha_area.end(), span_re);
       it != std::sregex_iterator(); ++it) {
    int position = 0;
    if (!ParseNumber((*it)[1].str(), &position)) continue;
    std::string glyph = (*it)[2].str();
    std::smatch entity;
    if (std::regex_search(glyph, entity, entity_re)) {
      // Only plain ASCII entities stand for a digit
      int code_point = 0;
      if (!ParseNumber(entity[1].str(), &code_point) || code_point > 127) continue;
      glyph = std::string(1, static_cast<char>(code_point));
    } else {
      glyph = strutil::Trim(glyph);
    }
    digits.emplace_back(position, std::move(glyph));
  }
  std::stable_sort(digits.begin(), digits.end(),
                   [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

  std::string code;
  for (const auto& [position, glyph] : digits) code += glyph;

  switch (transform) {
    case CaptchaTransform::MOVE_3RD_TO_FRONT:
      // "1489" -> "8149"
      if (code.size() >= 3) code = code.substr(2, 1) + code.substr(0, 2) + code.substr(3);
      break;
    case CaptchaTransform::REVERSE:
      std::reverse(code.begin(), code.end());
      break;
    case CaptchaTransform::NONE:
      break;
  }
  return code;
}
};  // namespace imxup
