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
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "host/host_config.hpp"
#include "host/host_types.hpp"
#include "host/http_transport.hpp"
#include "host/token_cache.hpp"
#include "type/errors.hpp"
#include "utils/log/logger.hpp"

namespace imxup {
/**
 * @brief Opaque credential string split by scheme: "user:pass" for login schemes, the whole
 * string as key for API-key hosts.
 */
struct Credentials {
  std::string username_;
  std::string password_;
  std::string api_key_;

  static auto Parse(const std::string& opaque, const AuthScheme& scheme) -> Credentials;
};

/**
 * @brief Authentication state of one host. Owns the login flow of the configured scheme, the
 * resulting token or cookie jar, and its persistence in the TokenCache. Only the client of this
 * host touches it.
 *
 * Re-authentication is single-flight: callers remember the generation they used, and when
 * several of them see an auth failure at once only the first one logs in again.
 */
class HostSession {
 public:
  HostSession(HostConfig config, std::shared_ptr<HttpTransport> transport,
              const std::string& credentials, std::shared_ptr<TokenCache> cache,
              std::optional<SessionState> initial_state = std::nullopt);

  /**
   * @brief Log in when there is no usable state yet, or when a token-login token is within its
   * refresh margin of expiry.
   */
  void EnsureAuthenticated();

  /**
   * @brief Attach the current credentials to request: API key header or query parameter,
   * bearer header, cookies, and "{token}" / "{sess_id}" substitution in the URL and fields.
   */
  void Authorize(HttpRequest& request) const;

  /**
   * @brief Substitute "{token}" and "{sess_id}" in text.
   */
  auto Expand(const std::string& text) const -> std::string;

  auto Generation() const -> uint64_t;

  /**
   * @brief Drop the cached state and log in again, unless another caller already did so since
   * seen_generation.
   */
  void Reauthenticate(uint64_t seen_generation);

  void Invalidate();

  /**
   * @brief Run fn authenticated. An AuthenticationError from fn leads to one re-authentication
   * and exactly one more call; a second failure propagates.
   */
  template <typename Fn>
  auto WithAuthRetry(Fn&& fn) -> decltype(fn()) {
    EnsureAuthenticated();
    const uint64_t generation = Generation();
    try {
      return fn();
    } catch (const AuthenticationError& e) {
      if (!CanReauthenticate()) throw;
      Logger::Get(LogCategory::AUTH)
          ->warn("{}: {} - re-authenticating once", config_.id_, e.Reason());
    }
    Reauthenticate(generation);
    return fn();
  }

  auto CanReauthenticate() const -> bool;
  auto State() const -> SessionState;
  auto LoginStorage() const -> std::optional<StorageInfo>;
  auto LoginCount() const -> uint64_t;

  /**
   * @brief Read the numeric captcha drawn as absolutely positioned spans in the part of html
   * matched by captcha_regex. Digits are ordered by their padding-left offset, then transform
   * is applied.
   */
  static auto SolveCaptcha(const std::string& html, const std::string& captcha_regex,
                           CaptchaTransform transform) -> std::string;

 private:
  void                           LoginLocked();
  void                           LoginWithToken(const TokenLoginAuth& auth);
  void                           LoginWithSession(const SessionCookieAuth& auth);
  auto                           NeedsLoginLocked() const -> bool;
  auto                           RefreshMarginLocked() const -> int64_t;

  HostConfig                     config_;
  std::shared_ptr<HttpTransport> transport_;
  std::shared_ptr<TokenCache>    cache_;
  Credentials                    credentials_;

  mutable std::mutex             mtx_;
  SessionState                   state_;
  std::optional<StorageInfo>     login_storage_;
  uint64_t                       generation_  = 0;
  uint64_t                       login_count_ = 0;
};
};  // namespace imxup
