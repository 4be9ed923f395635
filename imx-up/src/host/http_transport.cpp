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

#include "host/http_transport.hpp"

#include <curl/curl.h>

#include <cstdio>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "type/errors.hpp"
#include "utils/log/logger.hpp"
#include "utils/string/string_utils.hpp"

namespace imxup {
namespace {
struct CurlEasyDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};
struct CurlSlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
struct CurlMimeDeleter {
  void operator()(curl_mime* mime) const { curl_mime_free(mime); }
};
struct FileCloser {
  void operator()(std::FILE* file) const { std::fclose(file); }
};

using CurlEasyPtr  = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;
using CurlMimePtr  = std::unique_ptr<curl_mime, CurlMimeDeleter>;
using FilePtr      = std::unique_ptr<std::FILE, FileCloser>;

std::once_flag curl_init_flag;

auto WriteBody(char* data, size_t size, size_t nmemb, void* userdata) -> size_t {
  auto* body = static_cast<std::string*>(userdata);
  body->append(data, size * nmemb);
  return size * nmemb;
}

auto WriteHeader(char* data, size_t size, size_t nmemb, void* userdata) -> size_t {
  auto*       response = static_cast<HttpResponse*>(userdata);
  std::string line(data, size * nmemb);
  auto        colon = line.find(':');
  if (colon == std::string::npos) return size * nmemb;

  auto name  = strutil::ToLower(strutil::Trim(line.substr(0, colon)));
  auto value = strutil::Trim(line.substr(colon + 1));
  if (name == "set-cookie") {
    // name=value; Path=/; ...
    auto pair = value.substr(0, value.find(';'));
    auto eq   = pair.find('=');
    if (eq != std::string::npos) {
      response->cookies_[strutil::Trim(pair.substr(0, eq))] = strutil::Trim(pair.substr(eq + 1));
    }
  } else {
    response->headers_[name] = value;
  }
  return size * nmemb;
}

auto TransferInfo(void* clientp, curl_off_t, curl_off_t, curl_off_t ultotal, curl_off_t ulnow)
    -> int {
  auto* request = static_cast<const HttpRequest*>(clientp);
  if (!request->on_progress_) return 0;
  return request->on_progress_(static_cast<uint64_t>(ulnow), static_cast<uint64_t>(ultotal)) ? 0
                                                                                              : 1;
}
}  // namespace

auto HttpMethodName(HttpMethod method) -> const char* {
  switch (method) {
    case HttpMethod::GET:
      return "GET";
    case HttpMethod::POST:
      return "POST";
    case HttpMethod::PUT:
      return "PUT";
    case HttpMethod::DELETE:
      return "DELETE";
  }
  return "GET";
}

CurlTransport::CurlTransport() {
  std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

/**
 * @brief Run one request on a fresh easy handle. Handles are not shared between threads, so
 * several upload workers may call Perform concurrently.
 *
 * @param request
 * @return HttpResponse
 */
auto CurlTransport::Perform(const HttpRequest& request) -> HttpResponse {
  CurlEasyPtr curl{curl_easy_init()};
  if (!curl) {
    throw NetworkError("Could not create an HTTP session");
  }
  CURL*        handle = curl.get();
  HttpResponse response;

  curl_easy_setopt(handle, CURLOPT_URL, request.url_.c_str());
  curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, request.follow_redirects_ ? 1L : 0L);
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_USERAGENT, "imxup/" IMXUP_VERSION);
  curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, request.connect_timeout_s_);
  if (request.inactivity_timeout_s_ > 0) {
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, request.inactivity_timeout_s_);
  }
  if (request.total_timeout_s_ > 0) {
    curl_easy_setopt(handle, CURLOPT_TIMEOUT, request.total_timeout_s_);
  }

  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, WriteBody);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body_);
  curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, WriteHeader);
  curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response);

  curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, TransferInfo);
  curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &request);

  curl_slist* raw_headers = nullptr;
  for (const auto& [name, value] : request.headers_) {
    raw_headers = curl_slist_append(raw_headers, (name + ": " + value).c_str());
  }
  CurlSlistPtr headers{raw_headers};
  if (headers) curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());

  std::string cookie_line;
  for (const auto& [name, value] : request.cookies_) {
    if (!cookie_line.empty()) cookie_line += "; ";
    cookie_line += name + "=" + value;
  }
  if (!cookie_line.empty()) curl_easy_setopt(handle, CURLOPT_COOKIE, cookie_line.c_str());

  CurlMimePtr mime;
  FilePtr     upload_file;
  switch (request.method_) {
    case HttpMethod::GET:
      curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
      break;
    case HttpMethod::DELETE:
      curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, "DELETE");
      break;
    case HttpMethod::PUT:
      if (!request.upload_file_.empty()) {
        std::error_code ec;
        auto            size = std::filesystem::file_size(request.upload_file_, ec);
        upload_file.reset(std::fopen(request.upload_file_.string().c_str(), "rb"));
        if (ec || !upload_file) {
          throw UploadError("Cannot read " + request.upload_file_.filename().string(),
                            ec ? ec.message() : std::string{"open failed"});
        }
        curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(handle, CURLOPT_READDATA, upload_file.get());
        curl_easy_setopt(handle, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
      } else {
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body_.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body_.size()));
      }
      break;
    case HttpMethod::POST:
      if (!request.form_.empty()) {
        mime.reset(curl_mime_init(handle));
        for (const auto& part : request.form_) {
          curl_mimepart* field = curl_mime_addpart(mime.get());
          curl_mime_name(field, part.name_.c_str());
          if (!part.file_.empty()) {
            if (curl_mime_filedata(field, part.file_.string().c_str()) != CURLE_OK) {
              throw UploadError("Cannot read " + part.file_.filename().string());
            }
          } else {
            curl_mime_data(field, part.value_.data(), part.value_.size());
          }
        }
        curl_easy_setopt(handle, CURLOPT_MIMEPOST, mime.get());
      } else {
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body_.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body_.size()));
      }
      break;
  }

  CURLcode code = curl_easy_perform(handle);
  if (code == CURLE_ABORTED_BY_CALLBACK) {
    throw CancelledError("Transfer cancelled");
  }
  if (code == CURLE_OPERATION_TIMEDOUT) {
    throw NetworkError("Transfer timed out", curl_easy_strerror(code));
  }
  if (code != CURLE_OK) {
    throw NetworkError("Network failure", curl_easy_strerror(code));
  }

  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status_);
  char* effective = nullptr;
  curl_easy_getinfo(handle, CURLINFO_EFFECTIVE_URL, &effective);
  if (effective) response.effective_url_ = effective;

  // Query strings may carry tokens
  Logger::Get(LogCategory::UPLOADS)
      ->trace("{} {} -> {}", HttpMethodName(request.method_),
              request.url_.substr(0, request.url_.find('?')), response.status_);
  return response;
}

auto UrlEncode(const std::string& value) -> std::string {
  CurlEasyPtr curl{curl_easy_init()};
  if (!curl) {
    throw NetworkError("Could not create an HTTP session");
  }
  char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size()));
  if (escaped == nullptr) return {};
  std::string result(escaped);
  curl_free(escaped);
  return result;
}

auto FormEncode(const std::map<std::string, std::string>& fields) -> std::string {
  std::string body;
  for (const auto& [name, value] : fields) {
    if (!body.empty()) body += '&';
    body += UrlEncode(name) + "=" + UrlEncode(value);
  }
  return body;
}
};  // namespace imxup
