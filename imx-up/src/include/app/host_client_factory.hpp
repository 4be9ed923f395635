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
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "host/host_client.hpp"
#include "host/host_config.hpp"
#include "host/http_transport.hpp"
#include "host/image_host_client.hpp"
#include "host/token_cache.hpp"

namespace imxup {
/**
 * @brief Source of the opaque credential strings ("user:pass" or an API key). Storing them is
 * somebody else's job; clients only ever receive them.
 */
class CredentialVault {
 public:
  virtual ~CredentialVault()                                                      = default;
  virtual auto Lookup(const std::string& host_id) -> std::optional<std::string> = 0;

  // Throws SecurityError when nothing is stored for host_id
  auto         Require(const std::string& host_id) -> std::string;
};

/**
 * @brief Reads IMXUP_CREDENTIALS_<HOST_ID> from the environment, host id upper-cased with every
 * other character mapped to '_'.
 */
class EnvCredentialVault final : public CredentialVault {
 public:
  auto        Lookup(const std::string& host_id) -> std::optional<std::string> override;
  static auto VariableName(const std::string& host_id) -> std::string;
};

/**
 * @brief Builds one client per configured host and hands out the same instance afterwards, so
 * that every caller shares one session per host.
 */
class HostClientFactory {
 public:
  HostClientFactory(const HostConfigRegistry& registry, std::shared_ptr<HttpTransport> transport,
                    std::shared_ptr<TokenCache>      cache,
                    std::shared_ptr<CredentialVault> vault);

  auto FileHost(const std::string& host_id) -> std::shared_ptr<FileHostClient>;
  auto ImageHost(const std::string& host_id) -> std::shared_ptr<HttpImageHostClient>;

  auto Registry() const -> const HostConfigRegistry& { return _registry; }

 private:
  auto ConfigFor(const std::string& host_id, HostKind kind) const -> const HostConfig&;
  auto CredentialsFor(const HostConfig& config) -> std::string;

  const HostConfigRegistry&                                   _registry;
  std::shared_ptr<HttpTransport>                              _transport;
  std::shared_ptr<TokenCache>                                 _cache;
  std::shared_ptr<CredentialVault>                            _vault;

  std::mutex                                                  _mtx;
  std::map<std::string, std::shared_ptr<FileHostClient>>      _file_hosts;
  std::map<std::string, std::shared_ptr<HttpImageHostClient>> _image_hosts;
};
};  // namespace imxup
