#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

#include "host/host_config.hpp"
#include "type/errors.hpp"

namespace imxup {
namespace {
auto TokenHostDoc() -> nlohmann::json {
  return nlohmann::json::parse(R"({
    "name": "Rapid Share",
    "auth_type": "token_login",
    "auth": {
      "login_url": "https://api.rapid.test/login",
      "login_method": "POST",
      "login_fields": {"user": "{username}", "pass": "{password}"},
      "token_path": ["data", "token"],
      "token_ttl": 3600,
      "refresh_margin": 120
    },
    "upload": {
      "get_server": "https://api.rapid.test/server",
      "server_response_path": ["result", 0, "host"],
      "endpoint": "https://{server}/upload?token={token}",
      "file_field": "file"
    },
    "response": {"type": "json", "link_path": ["data", "url"], "file_id_path": "id"},
    "triggers": {"on_completed": true},
    "limits": {"max_file_size_mb": 2048, "max_connections": 3},
    "retry": {"auto_retry": false}
  })");
}
}  // namespace

TEST(HostConfigTest, ParsesTokenLoginHost) {
  auto config = HostConfig::FromJson("rapid", TokenHostDoc());

  EXPECT_EQ(config.id_, "rapid");
  EXPECT_EQ(config.name_, "Rapid Share");
  EXPECT_EQ(config.kind_, HostKind::FILE_HOST);
  ASSERT_TRUE(std::holds_alternative<TokenLoginAuth>(config.auth_));
  const auto& auth = std::get<TokenLoginAuth>(config.auth_);
  EXPECT_EQ(auth.login_method_, HttpMethod::POST);
  EXPECT_EQ(auth.login_fields_.at("user"), "{username}");
  ASSERT_EQ(auth.token_path_.size(), 2u);
  EXPECT_EQ(std::get<std::string>(auth.token_path_[1]), "token");
  EXPECT_EQ(auth.token_ttl_s_.value_or(0), 3600);
  EXPECT_EQ(auth.refresh_margin_s_, 120);

  ASSERT_EQ(config.upload_.server_response_path_.size(), 3u);
  EXPECT_EQ(std::get<int64_t>(config.upload_.server_response_path_[1]), 0);
  EXPECT_EQ(config.max_file_size_mb_.value_or(0), 2048u);
  EXPECT_EQ(config.max_connections_, 3u);
  EXPECT_FALSE(config.auto_retry_);
  EXPECT_EQ(config.max_retries_, 3u);
  EXPECT_TRUE(config.FiresOn(TriggerEvent::COMPLETED));
  EXPECT_FALSE(config.FiresOn(TriggerEvent::ADDED));
  EXPECT_STREQ(AuthSchemeName(config.auth_), "token_login");
}

TEST(HostConfigTest, FileHostWithoutEndpointIsRejected) {
  auto doc = TokenHostDoc();
  doc["upload"].erase("endpoint");
  EXPECT_THROW(HostConfig::FromJson("rapid", doc), ValidationError);
}

TEST(HostConfigTest, UnknownMethodIsRejected) {
  auto doc                = TokenHostDoc();
  doc["upload"]["method"] = "PATCH";
  EXPECT_THROW(HostConfig::FromJson("rapid", doc), ValidationError);
}

TEST(HostConfigTest, DisabledHostNeverFires) {
  auto doc       = TokenHostDoc();
  doc["enabled"] = false;
  auto config    = HostConfig::FromJson("rapid", doc);
  EXPECT_FALSE(config.FiresOn(TriggerEvent::COMPLETED));
}

TEST(HostConfigTest, ExtractJsonPathWalksKeysAndIndexes) {
  auto doc  = nlohmann::json::parse(R"({"result": [{"host": "s1.test"}, {"host": null}]})");
  auto path = ParseJsonPath(nlohmann::json::parse(R"(["result", 0, "host"])"));
  const auto* value = ExtractJsonPath(doc, path);
  ASSERT_NE(value, nullptr);
  EXPECT_EQ(JsonScalarToString(*value), "s1.test");

  EXPECT_EQ(ExtractJsonPath(doc, ParseJsonPath(nlohmann::json::parse(R"(["result", 1, "host"])"))),
            nullptr);
  EXPECT_EQ(ExtractJsonPath(doc, ParseJsonPath(nlohmann::json::parse(R"(["result", 5])"))),
            nullptr);
  EXPECT_THROW(ParseJsonPath(nlohmann::json(42)), ValidationError);
}

TEST(HostConfigTest, NumbersMayArriveAsStrings) {
  auto doc = nlohmann::json::parse(R"({"a": "1024", "b": 2048, "c": "12a", "d": -1})");
  EXPECT_EQ(JsonToUint64(&doc["a"]).value_or(0), 1024u);
  EXPECT_EQ(JsonToUint64(&doc["b"]).value_or(0), 2048u);
  EXPECT_FALSE(JsonToUint64(&doc["c"]).has_value());
  EXPECT_FALSE(JsonToUint64(&doc["d"]).has_value());
  EXPECT_FALSE(JsonToUint64(nullptr).has_value());
}

TEST(HostConfigTest, SanitizeGalleryName) {
  auto config = HostConfig::FromJson("imx", nlohmann::json::parse(R"({
    "kind": "image",
    "image_host": {"upload_url": "https://imx.test/upload", "name_max_length": 10,
                   "name_forbidden_chars": "<>"}
  })"));

  EXPECT_EQ(config.SanitizeGalleryName("  My <Trip>\t2024 ", "folder"), "My Trip 20");
  EXPECT_EQ(config.SanitizeGalleryName("<<>>", "fallback"), "fallback");
  EXPECT_EQ(config.SanitizeGalleryName("", ""), "gallery");
  // Cut lands inside the two byte "é"
  EXPECT_EQ(config.SanitizeGalleryName("abcdefghi\xC3\xA9", "x"), "abcdefghi");
}

TEST(HostConfigTest, RegistryLoadsDirectoryAndSkipsBrokenFiles) {
  auto dir = std::filesystem::temp_directory_path() / "imxup_host_registry_test";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  {
    std::ofstream(dir / "rapid.json") << TokenHostDoc().dump();
    std::ofstream(dir / "broken.json") << "{ not json";
    auto other        = TokenHostDoc();
    other["triggers"] = {{"on_added", true}};
    std::ofstream(dir / "other.json") << other.dump();
    std::ofstream(dir / "notes.txt") << "ignored";
  }

  HostConfigRegistry registry;
  EXPECT_EQ(registry.LoadDirectory(dir), 2u);
  EXPECT_NE(registry.Get("rapid"), nullptr);
  EXPECT_EQ(registry.Get("broken"), nullptr);
  EXPECT_EQ(registry.Enabled(HostKind::FILE_HOST).size(), 2u);

  auto on_added = registry.ByTrigger(TriggerEvent::ADDED);
  ASSERT_EQ(on_added.size(), 1u);
  EXPECT_EQ(on_added.front()->id_, "other");

  std::filesystem::remove_all(dir);
}
}  // namespace imxup
