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


#include "host/image_host_client.hpp"

#include <format>
#include <utility>

#include "host/host_client.hpp"
#include "type/errors.hpp"
#include "utils/log/logger.hpp"
#include "utils/string/string_utils.hpp"

namespace imxup {
namespace {
using nlohmann::json;

auto LastPathStem(const std::string& url) -> std::string {
  auto trimmed = url.substr(0, url.find('?'));
  while (!trimmed.empty() && trimmed.back() == '/') trimmed.pop_back();
  auto segment = trimmed.substr(trimmed.rfind('/') + 1);
  return segment.substr(0, segment.rfind('.'));
}
}  // namespace

HttpImageHostClient::HttpImageHostClient(HostConfig config, std::shared_ptr<HttpTransport> transport,
                                         const std::string& credentials,
                                         std::shared_ptr<TokenCache>  cache,
                                         std::optional<SessionState> session_state)
    : config_(std::move(config)), transport_(std::move(transport)) {
  if (!config_.image_.has_value()) {
    throw ValidationError(std::format("{} is not configured as an image host", config_.id_));
  }
  session_ = std::make_unique<HostSession>(config_, transport_, credentials, std::move(cache),
                                           std::move(session_state));
}

auto HttpImageHostClient::GalleryUrl(const std::string& gallery_id) const -> std::string {
  if (gallery_id.empty()) return {};
  return strutil::FormatTemplate(Spec().gallery_url_template_, {{"gallery_id", gallery_id}});
}

auto HttpImageHostClient::ThumbnailUrl(const std::string& image_id, const std::string& ext) const
    -> std::string {
  if (image_id.empty() || Spec().thumbnail_url_template_.empty()) return {};
  return strutil::FormatTemplate(Spec().thumbnail_url_template_,
                                 {{"img_id", image_id}, {"ext", ext}});
}

auto HttpImageHostClient::CreateGalleryWithName(const std::string& name) -> GalleryHandle {
  const auto&   spec = Spec();
  GalleryHandle handle;
  handle.named_ = spec.creates_named_galleries_;
  if (spec.gallery_create_url_.empty()) {
    // The first upload opens the gallery
    return handle;
  }

  return session_->WithAuthRetry([&] {
    HttpRequest request;
    request.method_            = HttpMethod::POST;
    request.url_               = spec.gallery_create_url_;
    request.connect_timeout_s_ = config_.timeouts_.connect_s_;
    request.total_timeout_s_   = 60;
    request.form_.push_back(FormPart{spec.gallery_name_field_, name, {}});
    session_->Authorize(request);

    auto response = transport_->Perform(request);
    ThrowOnAuthOrRateLimit(response, config_.name_);
    if (!response.Ok()) {
      throw UploadError(std::format("Gallery creation failed with status {}", response.status_),
                        response.body_, static_cast<int>(response.status_));
    }
    json doc = json::parse(response.body_, nullptr, false);
    if (doc.is_discarded()) {
      throw UploadError("Gallery creation returned no JSON", response.body_);
    }
    const auto* id = ExtractJsonPath(doc, spec.gallery_id_path_);
    if (id == nullptr || id->is_null() || spec.gallery_id_path_.empty()) {
      throw UploadError("Gallery creation returned no gallery id", response.body_);
    }

    GalleryHandle created = handle;
    created.gallery_id_   = JsonScalarToString(*id);
    created.gallery_url_  = GalleryUrl(created.gallery_id_);
    Logger::Get(LogCategory::UPLOADS)
        ->info("Created gallery {} on {}", created.gallery_id_, config_.name_);
    return created;
  });
}

auto HttpImageHostClient::UploadImage(const image_path_t& path, const ImageUploadOptions& options,
                                      const ByteProgressCallback& on_progress,
                                      const CancellationToken*    cancel) -> ImageUploadResponse {
  const auto& spec = Spec();
  return session_->WithAuthRetry([&] {
    HttpRequest request;
    request.method_               = HttpMethod::POST;
    request.url_                  = spec.upload_url_;
    request.connect_timeout_s_    = config_.timeouts_.connect_s_;
    request.inactivity_timeout_s_ = config_.timeouts_.inactivity_s_;
    request.total_timeout_s_      = config_.timeouts_.upload_s_;

    request.form_.push_back(FormPart{spec.image_field_, {}, path});
    request.form_.push_back(
        FormPart{spec.thumbnail_size_field_, std::to_string(options.thumbnail_size_), {}});
    request.form_.push_back(
        FormPart{spec.thumbnail_format_field_, std::to_string(options.thumbnail_format_), {}});
    if (!options.gallery_id_.empty()) {
      request.form_.push_back(FormPart{spec.gallery_id_field_, options.gallery_id_, {}});
    } else if (spec.creates_named_galleries_ && !options.gallery_name_.empty()) {
      request.form_.push_back(FormPart{spec.gallery_name_field_, options.gallery_name_, {}});
    }
    for (const auto& [name, value] : config_.upload_.extra_fields_) {
      request.form_.push_back(FormPart{name, value, {}});
    }
    session_->Authorize(request);

    request.on_progress_ = [&](uint64_t uploaded, uint64_t total) {
      if (IsCancelled(cancel)) return false;
      if (on_progress) on_progress(uploaded, total);
      return true;
    };

    auto response = transport_->Perform(request);
    ThrowOnAuthOrRateLimit(response, config_.name_);
    if (!response.Ok()) {
      throw UploadError(std::format("Upload failed with status {}", response.status_),
                        response.body_, static_cast<int>(response.status_));
    }
    return ParseUploadResponse(response, path);
  });
}

auto HttpImageHostClient::ParseUploadResponse(const HttpResponse& response,
                                              const image_path_t& path) const
    -> ImageUploadResponse {
  const auto& spec = Spec();
  json        doc  = json::parse(response.body_, nullptr, false);
  if (doc.is_discarded()) {
    throw UploadError("Host answered with malformed JSON", response.body_);
  }

  if (!spec.status_path_.empty()) {
    const auto* status = ExtractJsonPath(doc, spec.status_path_);
    auto        text   = status ? JsonScalarToString(*status) : std::string{};
    if (text != spec.success_status_) {
      throw UploadError(std::format("Host reported '{}'", text.empty() ? "no status" : text),
                        response.body_);
    }
  }

  auto string_at = [&doc](const JsonPath& json_path) -> std::string {
    if (json_path.empty()) return {};
    const auto* value = ExtractJsonPath(doc, json_path);
    return value ? JsonScalarToString(*value) : std::string{};
  };

  ImageUploadResponse result;
  result.raw_       = response.body_;
  result.image_url_ = string_at(spec.image_url_path_);
  if (result.image_url_.empty()) {
    throw UploadError("Host response carries no image URL", response.body_);
  }
  result.image_id_ = string_at(spec.image_id_path_);
  if (result.image_id_.empty()) result.image_id_ = LastPathStem(result.image_url_);

  result.thumb_url_ = string_at(spec.thumb_url_path_);
  if (result.thumb_url_.empty()) {
    auto ext          = strutil::ToLower(path.extension().string());
    result.thumb_url_ = ThumbnailUrl(result.image_id_, ext.empty() ? ".jpg" : ext);
  }

  result.gallery_id_  = string_at(spec.upload_gallery_id_path_);
  result.gallery_url_ = GalleryUrl(result.gallery_id_);
  return result;
}

void HttpImageHostClient::RenameGallery(const std::string& gallery_id, const std::string& name) {
  const auto& spec = Spec();
  if (spec.rename_url_.empty()) {
    throw UploadError(std::format("{} cannot rename galleries", config_.name_));
  }
  session_->WithAuthRetry([&] {
    HttpRequest request;
    request.method_            = HttpMethod::POST;
    request.url_               = spec.rename_url_;
    request.connect_timeout_s_ = config_.timeouts_.connect_s_;
    request.total_timeout_s_   = 30;
    request.form_.push_back(FormPart{spec.rename_id_field_, gallery_id, {}});
    request.form_.push_back(FormPart{spec.rename_name_field_, name, {}});
    session_->Authorize(request);

    auto response = transport_->Perform(request);
    ThrowOnAuthOrRateLimit(response, config_.name_);
    if (!response.Ok()) {
      throw UploadError(std::format("Rename failed with status {}", response.status_),
                        response.body_, static_cast<int>(response.status_));
    }
    Logger::Get(LogCategory::UPLOADS)->info("Renamed gallery {} to '{}'", gallery_id, name);
  });
}
};  // namespace imxup
