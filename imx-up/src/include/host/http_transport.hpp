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
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace imxup {
enum class HttpMethod : uint8_t { GET = 0, POST, PUT, DELETE };

auto HttpMethodName(HttpMethod method) -> const char*;

// One multipart field. A non-empty file_ streams that file as the field content.
struct FormPart {
  std::string name_;
  std::string value_;
  file_path_t file_;
};

/**
 * @brief Called while bytes go out. Returning false aborts the transfer, which then fails with
 * CancelledError.
 */
using TransferCallback = std::function<bool(uint64_t uploaded, uint64_t total)>;

struct HttpRequest {
  HttpMethod                         method_ = HttpMethod::GET;
  std::string                        url_;
  std::map<std::string, std::string> headers_;
  std::map<std::string, std::string> cookies_;

  // Raw body, sent as is (form-urlencoded or JSON)
  std::string                        body_;
  // Multipart body when non-empty
  std::vector<FormPart>              form_;
  // PUT body streamed from disk when non-empty
  file_path_t                        upload_file_;

  long                               connect_timeout_s_    = 30;
  // Abort when no byte moves for this long; 0 disables
  long                               inactivity_timeout_s_ = 0;
  // Hard ceiling for the whole transfer; 0 is unbounded
  long                               total_timeout_s_      = 0;
  bool                               follow_redirects_     = true;

  TransferCallback                   on_progress_;
};

struct HttpResponse {
  long                               status_ = 0;
  std::string                        body_;
  std::map<std::string, std::string> headers_;
  std::map<std::string, std::string> cookies_;
  std::string                        effective_url_;

  auto                               Ok() const -> bool { return status_ >= 200 && status_ < 300; }
};

/**
 * @brief The single seam between host clients and the network. Transport failures (DNS,
 * connect, timeout) throw NetworkError, an aborted transfer throws CancelledError; any HTTP
 * status is returned as a response.
 */
class HttpTransport {
 public:
  virtual ~HttpTransport()                                   = default;
  virtual auto Perform(const HttpRequest& request) -> HttpResponse = 0;
};

class CurlTransport : public HttpTransport {
 public:
  CurlTransport();
  auto Perform(const HttpRequest& request) -> HttpResponse override;
};

/**
 * @brief Percent-encode a query or form value.
 */
auto UrlEncode(const std::string& value) -> std::string;

auto FormEncode(const std::map<std::string, std::string>& fields) -> std::string;
};  // namespace imxup
