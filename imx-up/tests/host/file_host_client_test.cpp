#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "concurrency/cancellation_token.hpp"
#include "host/host_client.hpp"
#include "support/fake_transport.hpp"
#include "type/errors.hpp"
#include "utils/clock/time_provider.hpp"

namespace imxup {
namespace {
auto ApiKeyHost() -> HostConfig {
  return HostConfig::FromJson("drop", nlohmann::json::parse(R"({
    "name": "Drop",
    "auth_type": "bearer",
    "upload": {
      "get_server": "https://api.drop.test/server",
      "server_response_path": ["data", "server"],
      "endpoint": "https://{server}/upload/{filename}",
      "extra_fields": {"folder": "root"}
    },
    "response": {"type": "json", "link_path": ["data", "code"],
                 "link_prefix": "https://drop.test/d/", "file_id_path": ["data", "id"]},
    "delete": {"url": "https://api.drop.test/delete/{file_id}", "method": "DELETE"},
    "user_info": {"url": "https://api.drop.test/account",
                  "storage_total_path": ["data", "total"],
                  "storage_used_path": ["data", "used"],
                  "premium_status_path": ["data", "premium"]},
    "limits": {"max_file_size_mb": 1}
  })"));
}
}  // namespace

class FileHostClientTests : public ::testing::Test {
 protected:
  std::filesystem::path dir_;
  std::filesystem::path archive_;

  void SetUp() override {
    TimeProvider::Refresh();
    dir_ = std::filesystem::temp_directory_path() / "imxup_file_host_client_test";
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
    archive_ = dir_ / "My Gallery.zip";
    std::ofstream(archive_, std::ios::binary) << std::string(4096, 'z');
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }
};

TEST_F(FileHostClientTests, UploadResolvesServerAndParsesLink) {
  auto transport = std::make_shared<FakeTransport>([](const HttpRequest& request) {
    if (request.url_ == "https://api.drop.test/server") {
      return Respond(200, R"({"data": {"server": "s7.drop.test"}})");
    }
    return Respond(200, R"({"data": {"code": "AbC123", "id": 991}})");
  });
  FileHostClient client(ApiKeyHost(), transport, "KEY", nullptr);

  uint64_t last_reported = 0;
  auto     result        = client.UploadFile(
      archive_, [&](uint64_t uploaded, uint64_t, double) { last_reported = uploaded; }, nullptr);

  EXPECT_EQ(result.status_, FileUploadStatus::SUCCESS);
  EXPECT_EQ(result.url_, "https://drop.test/d/AbC123");
  EXPECT_EQ(result.file_id_, "991");
  EXPECT_EQ(last_reported, 4096u);

  auto requests = transport->Requests();
  ASSERT_EQ(requests.size(), 2u);
  EXPECT_EQ(requests[0].headers_.at("Authorization"), "Bearer KEY");
  EXPECT_EQ(requests[1].url_, "https://s7.drop.test/upload/My%20Gallery.zip");
  EXPECT_EQ(FindField(requests[1], "folder"), "root");
  EXPECT_EQ(FindField(requests[1], "file"), archive_.string());
}

TEST_F(FileHostClientTests, OversizedFileIsRejectedBeforeAnyRequest) {
  std::ofstream(archive_, std::ios::binary | std::ios::trunc) << std::string(2 * 1024 * 1024, 'z');
  auto transport = std::make_shared<FakeTransport>(
      [](const HttpRequest&) { return Respond(200, "{}"); });
  FileHostClient client(ApiKeyHost(), transport, "KEY", nullptr);

  EXPECT_THROW(client.UploadFile(archive_, nullptr, nullptr), UploadError);
  EXPECT_TRUE(transport->Requests().empty());
}

TEST_F(FileHostClientTests, RateLimitCarriesRetryAfter) {
  auto transport = std::make_shared<FakeTransport>([](const HttpRequest& request) {
    if (request.url_ == "https://api.drop.test/server") {
      return Respond(200, R"({"data": {"server": "s7.drop.test"}})");
    }
    auto limited                    = Respond(429, "slow down");
    limited.headers_["retry-after"] = "7";
    return limited;
  });
  FileHostClient client(ApiKeyHost(), transport, "KEY", nullptr);

  try {
    client.UploadFile(archive_, nullptr, nullptr);
    FAIL() << "upload should be rate limited";
  } catch (const RateLimitError& e) {
    EXPECT_EQ(e.RetryAfterSeconds().value_or(0), 7);
    EXPECT_EQ(e.Kind(), ErrorKind::NETWORK);
  }
}

TEST_F(FileHostClientTests, CancelledTransferThrowsCancelled) {
  CancellationToken cancel;
  auto              transport = std::make_shared<FakeTransport>([&](const HttpRequest& request) {
    if (request.url_ == "https://api.drop.test/server") {
      cancel.Cancel();
      return Respond(200, R"({"data": {"server": "s7.drop.test"}})");
    }
    return Respond(200, R"({"data": {"code": "x", "id": 1}})");
  });
  FileHostClient client(ApiKeyHost(), transport, "KEY", nullptr);

  EXPECT_THROW(client.UploadFile(archive_, nullptr, &cancel), CancelledError);
  EXPECT_EQ(transport->CountPrefix("https://s7.drop.test/"), 1u);
}

TEST_F(FileHostClientTests, ParsesTextAndRedirectResponses) {
  auto transport = std::make_shared<FakeTransport>(
      [](const HttpRequest&) { return Respond(200, ""); });

  auto text_config                     = ApiKeyHost();
  text_config.response_.type_          = ResponseType::TEXT;
  text_config.response_.link_regex_    = R"re(href="(https://drop\.test/f/\w+)")re";
  text_config.response_.file_id_regex_ = R"(/f/(\w+))";
  FileHostClient text_client(text_config, transport, "KEY", nullptr);

  auto text = text_client.ParseUploadResponse(
      Respond(200, R"(<a href="https://drop.test/f/q9Z">download</a>)"));
  EXPECT_EQ(text.url_, "https://drop.test/f/q9Z");
  EXPECT_EQ(text.file_id_, "q9Z");

  auto redirect_config             = ApiKeyHost();
  redirect_config.response_.type_ = ResponseType::REDIRECT;
  FileHostClient redirect_client(redirect_config, transport, "KEY", nullptr);
  auto           redirected = Respond(200, "<html/>");
  redirected.effective_url_ = "https://drop.test/done/55";
  EXPECT_EQ(redirect_client.ParseUploadResponse(redirected).url_, "https://drop.test/done/55");

  FileHostClient json_client(ApiKeyHost(), transport, "KEY", nullptr);
  EXPECT_THROW(json_client.ParseUploadResponse(Respond(200, R"({"data": {}})")), UploadError);
  EXPECT_THROW(json_client.ParseUploadResponse(Respond(200, "<html>")), UploadError);
  // Hosts answering with a one element array
  auto listed = json_client.ParseUploadResponse(
      Respond(200, R"([{"data": {"code": "L1", "id": "7"}}])"));
  EXPECT_EQ(listed.url_, "https://drop.test/d/L1");
}

TEST_F(FileHostClientTests, DeleteTreatsMissingFileAsDone) {
  auto transport = std::make_shared<FakeTransport>(
      [](const HttpRequest&) { return Respond(404, "gone"); });
  FileHostClient client(ApiKeyHost(), transport, "KEY", nullptr);

  EXPECT_NO_THROW(client.DeleteFile("991"));
  auto requests = transport->Requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].method_, HttpMethod::DELETE);
  EXPECT_EQ(requests[0].url_, "https://api.drop.test/delete/991");
}

TEST_F(FileHostClientTests, UserInfoAndCredentialTest) {
  auto transport = std::make_shared<FakeTransport>([](const HttpRequest&) {
    return Respond(200, R"({"data": {"total": "1000", "used": 250, "premium": 1}})");
  });
  FileHostClient client(ApiKeyHost(), transport, "KEY", nullptr);

  auto info = client.GetUserInfo();
  EXPECT_EQ(info.total_bytes_.value_or(0), 1000u);
  EXPECT_EQ(info.used_bytes_.value_or(0), 250u);
  EXPECT_EQ(info.left_bytes_.value_or(0), 750u);
  EXPECT_TRUE(info.premium_.value_or(false));

  auto check = client.TestCredentials();
  EXPECT_TRUE(check.success_);
  ASSERT_TRUE(check.storage_.has_value());

  FileHostClient keyless(ApiKeyHost(), transport, "", nullptr);
  auto           failed = keyless.TestCredentials();
  EXPECT_FALSE(failed.success_);
  EXPECT_NE(failed.message_.find("No API key"), std::string::npos);
}

TEST_F(FileHostClientTests, StorageRegexReadsGigabytes) {
  auto config                      = ApiKeyHost();
  config.user_info_.storage_regex_ = R"(([\d.]+) of ([\d.]+) GB)";
  auto transport = std::make_shared<FakeTransport>(
      [](const HttpRequest&) { return Respond(200, "<b>512 of 1024 GB</b> used"); });
  FileHostClient client(config, transport, "KEY", nullptr);

  auto info = client.GetUserInfo();
  EXPECT_EQ(info.used_bytes_.value_or(0), 512ULL * 1024 * 1024 * 1024);
  EXPECT_EQ(info.left_bytes_.value_or(0), 512ULL * 1024 * 1024 * 1024);
}

TEST_F(FileHostClientTests, TestUploadCleansUp) {
  std::atomic<int> deletes{0};
  auto             transport = std::make_shared<FakeTransport>([&](const HttpRequest& request) {
    if (request.url_ == "https://api.drop.test/server") {
      return Respond(200, R"({"data": {"server": "s7.drop.test"}})");
    }
    if (request.method_ == HttpMethod::DELETE) {
      ++deletes;
      return Respond(204, "");
    }
    return Respond(200, R"({"data": {"code": "T", "id": "t-1"}})");
  });
  FileHostClient client(ApiKeyHost(), transport, "KEY", nullptr);

  auto result = client.TestUpload();
  EXPECT_TRUE(result.success_);
  EXPECT_EQ(result.file_id_, "t-1");
  EXPECT_EQ(deletes.load(), 1);
  EXPECT_EQ(result.message_, "Upload test successful (test file deleted)");

  auto kept = client.TestUpload(false);
  EXPECT_TRUE(kept.success_);
  EXPECT_EQ(deletes.load(), 1);
}

TEST_F(FileHostClientTests, AuthRejectionMapsToAuthenticationError) {
  HttpResponse forbidden = Respond(403, "nope");
  EXPECT_THROW(ThrowOnAuthOrRateLimit(forbidden, "Drop"), AuthenticationError);
  EXPECT_NO_THROW(ThrowOnAuthOrRateLimit(Respond(500, ""), "Drop"));
}
}  // namespace imxup
