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


#include "app/host_client_factory.hpp"

#include <cctype>
#include <cstdlib>
#include <utility>

#include "type/errors.hpp"
#include "utils/log/logger.hpp"
#include "utils/string/string_utils.hpp"

namespace imxup {
auto CredentialVault::Require(const std::string& host_id) -> std::string {
  auto credentials = Lookup(host_id);
  if (!credentials.has_value() || strutil::Trim(*credentials).empty()) {
    throw SecurityError("No credentials available for " + host_id);
  }
  return *credentials;
}

auto EnvCredentialVault::VariableName(const std::string& host_id) -> std::string {
  std::string name = "IMXUP_CREDENTIALS_";
  for (char c : host_id) {
    auto uc = static_cast<unsigned char>(c);
    name += std::isalnum(uc) ? static_cast<char>(std::toupper(uc)) : '_';
  }
  return name;
}

auto EnvCredentialVault::Lookup(const std::string& host_id) -> std::optional<std::string> {
  const char* value = std::getenv(VariableName(host_id).c_str());
  if (value == nullptr) return std::nullopt;
  return std::string(value);
}

HostClientFactory::HostClientFactory(const HostConfigRegistry&        registry,
                                     std::shared_ptr<HttpTransport>   transport,
                                     std::shared_ptr<TokenCache>      cache,
                                     std::shared_ptr<CredentialVault> vault)
    : _registry(registry),
      _transport(std::move(transport)),
      _cache(std::move(cache)),
      _vault(std::move(vault)) {}

auto HostClientFactory::ConfigFor(const std::string& host_id, HostKind kind) const
    -> const HostConfig& {
  const auto* config = _registry.Get(host_id);
  if (config == nullptr) {
    throw ValidationError("Unknown host: " + host_id);
  }
  if (config->kind_ != kind) {
    throw ValidationError(host_id + (kind == HostKind::IMAGE_HOST ? " is not an image host"
                                                                  : " is not a file host"));
  }
  if (!config->enabled_) {
    throw ValidationError("Host is disabled: " + host_id);
  }
  return *config;
}

auto HostClientFactory::CredentialsFor(const HostConfig& config) -> std::string {
  if (!config.RequiresAuth()) return {};
  if (!_vault) {
    throw SecurityError("No credential store configured", config.id_);
  }
  return _vault->Require(config.id_);
}

auto HostClientFactory::FileHost(const std::string& host_id) -> std::shared_ptr<FileHostClient> {
  std::lock_guard<std::mutex> lock(_mtx);
  auto                        it = _file_hosts.find(host_id);
  if (it != _file_hosts.end()) return it->second;

  const auto& config = ConfigFor(host_id, HostKind::FILE_HOST);
  auto client = std::make_shared<FileHostClient>(config, _transport, CredentialsFor(config), _cache);
  Logger::Get(LogCategory::FILE_HOSTS)
      ->debug("Created client for {} ({})", config.name_, AuthSchemeName(config.auth_));
  _file_hosts.emplace(host_id, client);
  return client;
}

auto HostClientFactory::ImageHost(const std::string& host_id)
    -> std::shared_ptr<HttpImageHostClient> {
  std::lock_guard<std::mutex> lock(_mtx);
  auto                        it = _image_hosts.find(host_id);
  if (it != _image_hosts.end()) return it->second;

  const auto& config = ConfigFor(host_id, HostKind::IMAGE_HOST);
  auto        client =
      std::make_shared<HttpImageHostClient>(config, _transport, CredentialsFor(config), _cache);
  Logger::Get(LogCategory::UPLOADS)
      ->debug("Created image host client for {} ({})", config.name_, AuthSchemeName(config.auth_));
  _image_hosts.emplace(host_id, client);
  return client;
}
};  // namespace imxup
