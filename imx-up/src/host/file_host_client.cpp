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


#include "host/host_client.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <regex>
#include <string>
#include <utility>

#include "type/errors.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/log/logger.hpp"
#include "utils/string/string_utils.hpp"

namespace imxup {
namespace {
using nlohmann::json;

constexpr double kBytesPerGiB = 1024.0 * 1024.0 * 1024.0;

auto CompileRegex(const std::string& pattern, const char* what) -> std::regex {
  try {
    return std::regex(pattern);
  } catch (const std::regex_error& e) {
    throw ValidationError(std::format("Invalid {}", what), e.what());
  }
}

auto SearchGroup(const std::string& pattern, const std::string& text, const char* what)
    -> std::optional<std::string> {
  auto        re = CompileRegex(pattern, what);
  std::smatch match;
  if (!std::regex_search(text, match, re)) return std::nullopt;
  return match.size() > 1 ? match[1].str() : match[0].str();
}

auto GiBToBytes(const std::string& text) -> uint64_t {
  try {
    return static_cast<uint64_t>(std::stod(text) * kBytesPerGiB);
  } catch (const std::exception&) {
    throw UploadError("Unreadable storage figure on account page", text);
  }
}

/**
 * @brief Converts the cumulative byte count of the transport into the (uploaded, total, speed)
 * triple of the host client contract, and answers the transport's "keep going" question from
 * the cancellation token.
 */
class ProgressRelay {
 public:
  ProgressRelay(const UploadProgressCallback& on_progress, const CancellationToken* cancel)
      : on_progress_(on_progress), cancel_(cancel), last_tick_(std::chrono::steady_clock::now()) {}

  auto operator()(uint64_t uploaded, uint64_t total) -> bool {
    if (IsCancelled(cancel_)) return false;
    if (!on_progress_ || uploaded == last_bytes_) return true;

    auto   now     = std::chrono::steady_clock::now();
    double seconds = std::chrono::duration<double>(now - last_tick_).count();
    double speed   = seconds > 0.0 && uploaded > last_bytes_
                         ? static_cast<double>(uploaded - last_bytes_) / seconds
                         : 0.0;
    last_tick_     = now;
    last_bytes_    = uploaded;
    on_progress_(uploaded, total, speed);
    return true;
  }

 private:
  const UploadProgressCallback&         on_progress_;
  const CancellationToken*              cancel_;
  std::chrono::steady_clock::time_point last_tick_;
  uint64_t                              last_bytes_ = 0;
};
}  // namespace

void ThrowOnAuthOrRateLimit(const HttpResponse& response, const std::string& host_name) {
  if (response.status_ == 401 || response.status_ == 403) {
    throw AuthenticationError(
        std::format("{} rejected the credentials (HTTP {})", host_name, response.status_),
        response.body_);
  }
  if (response.status_ == 429) {
    std::optional<int64_t> retry_after;
    auto                   it = response.headers_.find("retry-after");
    if (it != response.headers_.end() && !it->second.empty() &&
        it->second.find_first_not_of("0123456789") == std::string::npos) {
      retry_after = std::stoll(it->second);
    }
    throw RateLimitError(std::format("{} is rate limiting requests", host_name), retry_after,
                         response.body_);
  }
}

FileHostClient::FileHostClient(HostConfig config, std::shared_ptr<HttpTransport> transport,
                               const std::string& credentials, std::shared_ptr<TokenCache> cache,
                               std::optional<SessionState> session_state)
    : config_(std::move(config)), transport_(std::move(transport)) {
  session_ = std::make_unique<HostSession>(config_, transport_, credentials, std::move(cache),
                                           std::move(session_state));
}

auto FileHostClient::BaseRequest(HttpMethod method, std::string url) const -> HttpRequest {
  HttpRequest request;
  request.method_               = method;
  request.url_                  = std::move(url);
  request.connect_timeout_s_    = config_.timeouts_.connect_s_;
  request.inactivity_timeout_s_ = config_.timeouts_.inactivity_s_;
  return request;
}

auto FileHostClient::ResolveUploadUrl(const file_path_t& path) -> std::string {
  auto url = strutil::ReplaceAll(config_.upload_.endpoint_, "{filename}",
                                 UrlEncode(path.filename().string()));
  if (config_.upload_.get_server_url_.empty()) return url;

  auto request             = BaseRequest(HttpMethod::GET, config_.upload_.get_server_url_);
  request.total_timeout_s_ = 10;
  session_->Authorize(request);
  auto response = transport_->Perform(request);
  ThrowOnAuthOrRateLimit(response, config_.name_);
  if (!response.Ok()) {
    throw UploadError(std::format("Upload server lookup failed with status {}", response.status_),
                      response.body_, static_cast<int>(response.status_));
  }

  json doc = json::parse(response.body_, nullptr, false);
  if (doc.is_discarded()) {
    throw UploadError("Upload server lookup returned no JSON", response.body_);
  }
  const auto* server = ExtractJsonPath(doc, config_.upload_.server_response_path_);
  if (server == nullptr || server->is_null()) {
    Logger::Get(LogCategory::FILE_HOSTS)
        ->warn("{}: no server in lookup response, using the endpoint as is", config_.id_);
    return url;
  }
  return strutil::ReplaceAll(url, "{server}", JsonScalarToString(*server));
}

auto FileHostClient::UploadFile(const file_path_t& path, const UploadProgressCallback& on_progress,
                                const CancellationToken* cancel) -> FileUploadResult {
  std::error_code ec;
  auto            file_size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw UploadError(std::format("Cannot read {}", path.filename().string()), ec.message());
  }
  if (config_.max_file_size_mb_.has_value() &&
      file_size > *config_.max_file_size_mb_ * 1024ULL * 1024ULL) {
    throw UploadError(std::format("{} exceeds the {} MiB limit of {}", path.filename().string(),
                                  *config_.max_file_size_mb_, config_.name_));
  }
  if (IsCancelled(cancel)) {
    throw CancelledError("Upload cancelled before start");
  }

  return session_->WithAuthRetry([&] { return UploadOnce(path, file_size, on_progress, cancel); });
}

auto FileHostClient::UploadOnce(const file_path_t& path, uint64_t file_size,
                                const UploadProgressCallback& on_progress,
                                const CancellationToken* cancel) -> FileUploadResult {
  auto log     = Logger::Get(LogCategory::FILE_HOSTS);
  auto request = BaseRequest(config_.upload_.method_, ResolveUploadUrl(path));
  request.total_timeout_s_ = config_.timeouts_.upload_s_;

  if (config_.upload_.method_ == HttpMethod::PUT) {
    request.upload_file_ = path;
  } else {
    request.form_.push_back(FormPart{config_.upload_.file_field_, {}, path});
    for (const auto& [name, value] : config_.upload_.extra_fields_) {
      request.form_.push_back(FormPart{name, value, {}});
    }
    auto session_id = session_->State().session_id_;
    if (!session_id.empty()) request.form_.push_back(FormPart{"sess_id", session_id, {}});
  }
  session_->Authorize(request);

  ProgressRelay relay(on_progress, cancel);
  request.on_progress_ = [&relay](uint64_t uploaded, uint64_t total) {
    return relay(uploaded, total);
  };

  log->info("Uploading {} ({} bytes) to {}", path.filename().string(), file_size, config_.name_);
  auto response = transport_->Perform(request);
  ThrowOnAuthOrRateLimit(response, config_.name_);
  if (response.status_ != 200 && response.status_ != 201) {
    throw UploadError(std::format("Upload failed with status {}", response.status_),
                      response.body_, static_cast<int>(response.status_));
  }

  auto result = ParseUploadResponse(response);

  // The transfer finished before the stop request was seen; take the copy down again
  if (IsCancelled(cancel)) {
    std::string orphan = result.file_id_;
    if (!orphan.empty() && !config_.delete_.url_.empty()) {
      try {
        DeleteFile(orphan);
        orphan.clear();
      } catch (const ImxupError& e) {
        log->warn("{}: could not remove cancelled upload {}: {}", config_.id_, orphan,
                  e.Reason());
      }
    }
    throw CancelledError("Upload cancelled", orphan);
  }

  log->info("Uploaded {} to {}: {}", path.filename().string(), config_.name_, result.url_);
  return result;
}

auto FileHostClient::ParseUploadResponse(const HttpResponse& response) const -> FileUploadResult {
  const auto&      rules = config_.response_;
  FileUploadResult result;
  result.raw_ = response.body_;

  switch (rules.type_) {
    case ResponseType::JSON: {
      json doc = json::parse(response.body_, nullptr, false);
      if (doc.is_discarded()) {
        throw UploadError("Host answered with malformed JSON", response.body_);
      }
      if (doc.is_array() && !doc.empty()) doc = doc.front();

      if (const auto* link = ExtractJsonPath(doc, rules.link_path_);
          link != nullptr && !link->is_null() && !rules.link_path_.empty()) {
        result.url_ = JsonScalarToString(*link);
        if (!rules.link_regex_.empty()) {
          auto extracted = SearchGroup(rules.link_regex_, result.url_, "link_regex");
          if (extracted.has_value()) result.url_ = *extracted;
        }
        result.url_ = rules.link_prefix_ + result.url_ + rules.link_suffix_;
      }
      if (!rules.file_id_path_.empty()) {
        if (const auto* id = ExtractJsonPath(doc, rules.file_id_path_); id != nullptr) {
          result.file_id_ = JsonScalarToString(*id);
        }
      }
      break;
    }
    case ResponseType::TEXT:
      if (!rules.link_regex_.empty()) {
        auto extracted = SearchGroup(rules.link_regex_, response.body_, "link_regex");
        if (extracted.has_value()) {
          result.url_ = rules.link_prefix_ + *extracted + rules.link_suffix_;
        }
      } else {
        result.url_ = strutil::Trim(response.body_);
      }
      break;
    case ResponseType::REDIRECT:
      result.url_ = response.effective_url_;
      break;
  }

  if (result.file_id_.empty() && !rules.file_id_regex_.empty()) {
    auto id = SearchGroup(rules.file_id_regex_, response.body_, "file_id_regex");
    if (id.has_value()) result.file_id_ = *id;
  }
  if (result.url_.empty()) {
    throw UploadError(std::format("{} did not return a download link", config_.name_),
                      response.body_);
  }
  result.status_ = FileUploadStatus::SUCCESS;
  return result;
}

void FileHostClient::DeleteFile(const std::string& file_id) {
  if (config_.delete_.url_.empty()) {
    throw UploadError(std::format("{} does not support file deletion", config_.name_));
  }
  session_->WithAuthRetry([&] {
    auto request = BaseRequest(config_.delete_.method_,
                               strutil::ReplaceAll(config_.delete_.url_, "{file_id}", file_id));
    request.total_timeout_s_ = 30;
    session_->Authorize(request);
    auto response = transport_->Perform(request);
    ThrowOnAuthOrRateLimit(response, config_.name_);
    if (response.status_ == 404) {
      Logger::Get(LogCategory::FILE_HOSTS)
          ->debug("{}: file {} already gone", config_.id_, file_id);
      return;
    }
    if (response.status_ != 200 && response.status_ != 204) {
      throw UploadError(std::format("Delete failed with status {}", response.status_),
                        response.body_, static_cast<int>(response.status_));
    }
    Logger::Get(LogCategory::FILE_HOSTS)->info("Deleted {} from {}", file_id, config_.name_);
  });
}

auto FileHostClient::GetUserInfo() -> StorageInfo {
  const auto& spec = config_.user_info_;
  if (spec.url_.empty()) {
    throw UploadError(std::format("{} does not expose account information", config_.name_));
  }
  return session_->WithAuthRetry([&] {
    auto request             = BaseRequest(HttpMethod::GET, spec.url_);
    request.total_timeout_s_ = 30;
    session_->Authorize(request);
    auto response = transport_->Perform(request);
    ThrowOnAuthOrRateLimit(response, config_.name_);
    if (response.status_ != 200) {
      throw UploadError(std::format("User info request failed with status {}", response.status_),
                        response.body_, static_cast<int>(response.status_));
    }

    StorageInfo info;
    if (!spec.storage_regex_.empty()) {
      // "566.87 of 10240 GB" style pages: used, then total
      std::smatch match;
      auto        re = CompileRegex(spec.storage_regex_, "storage_regex");
      if (std::regex_search(response.body_, match, re) && match.size() > 2) {
        auto used_bytes   = GiBToBytes(match[1].str());
        auto total_bytes  = GiBToBytes(match[2].str());
        info.used_bytes_  = used_bytes;
        info.total_bytes_ = total_bytes;
        info.left_bytes_  = total_bytes > used_bytes ? total_bytes - used_bytes : 0;
      } else {
        Logger::Get(LogCategory::FILE_HOSTS)
            ->warn("{}: storage pattern did not match the account page", config_.id_);
      }
      return info;
    }

    json doc = json::parse(response.body_, nullptr, false);
    if (doc.is_discarded()) {
      throw UploadError("User info response is not JSON", response.body_);
    }
    if (!spec.storage_total_path_.empty()) {
      info.total_bytes_ = JsonToUint64(ExtractJsonPath(doc, spec.storage_total_path_));
    }
    if (!spec.storage_used_path_.empty()) {
      info.used_bytes_ = JsonToUint64(ExtractJsonPath(doc, spec.storage_used_path_));
    }
    if (!spec.storage_left_path_.empty()) {
      info.left_bytes_ = JsonToUint64(ExtractJsonPath(doc, spec.storage_left_path_));
    }
    if (!spec.premium_path_.empty()) {
      info.premium_ = JsonToBool(ExtractJsonPath(doc, spec.premium_path_));
    }
    if (!info.left_bytes_ && info.total_bytes_ && info.used_bytes_) {
      info.left_bytes_ =
          *info.total_bytes_ > *info.used_bytes_ ? *info.total_bytes_ - *info.used_bytes_ : 0;
    }
    return info;
  });
}

auto FileHostClient::TestCredentials() -> CredentialTestResult {
  CredentialTestResult result;
  if (!config_.RequiresAuth()) {
    result.success_ = true;
    result.message_ = "No authentication required";
    return result;
  }
  try {
    session_->EnsureAuthenticated();
    if (!config_.user_info_.url_.empty()) {
      result.storage_ = GetUserInfo();
      result.message_ = "Credentials validated successfully";
    } else {
      result.storage_ = session_->LoginStorage();
      result.message_ = "Logged in (host has no validation endpoint)";
    }
    result.success_ = true;
  } catch (const ImxupError& e) {
    result.message_ = "Credential validation failed: " + e.Reason();
  } catch (const std::exception& e) {
    result.message_ = std::string("Credential validation failed: ") + e.what();
  }
  return result;
}

auto FileHostClient::TestUpload(bool cleanup) -> UploadTestResult {
  UploadTestResult result;
  auto             test_file = std::filesystem::temp_directory_path() /
                   std::format("imxup_test_{}_{}.txt", config_.id_, TimeProvider::NowUnix());
  {
    std::ofstream out(test_file, std::ios::trunc);
    out << "imxup test file - safe to delete\n";
    if (!out.flush()) {
      result.message_ = "Upload test failed: cannot create the test file";
      return result;
    }
  }

  try {
    auto upload     = UploadFile(test_file, nullptr, nullptr);
    result.url_     = upload.url_;
    result.file_id_ = upload.file_id_;
    std::string cleanup_note;
    if (!cleanup) {
      cleanup_note = " (test file kept)";
    } else if (config_.delete_.url_.empty() || upload.file_id_.empty()) {
      cleanup_note = " (host cannot delete the test file)";
    } else {
      try {
        DeleteFile(upload.file_id_);
        cleanup_note = " (test file deleted)";
      } catch (const ImxupError& e) {
        cleanup_note = " (cleanup failed: " + e.Reason() + ")";
      }
    }
    result.success_ = true;
    result.message_ = "Upload test successful" + cleanup_note;
  } catch (const ImxupError& e) {
    result.message_ = "Upload test failed: " + e.Reason();
  } catch (const std::exception& e) {
    result.message_ = std::string("Upload test failed: ") + e.what();
  }

  std::error_code ec;
  std::filesystem::remove(test_file, ec);
  return result;
}

auto FileHostClient::GetSessionState() const -> SessionState { return session_->State(); }
};  // namespace imxup
