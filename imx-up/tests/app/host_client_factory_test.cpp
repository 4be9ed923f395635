#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>

#include "app/host_client_factory.hpp"
#include "support/fake_hosts.hpp"
#include "support/fake_transport.hpp"
#include "type/errors.hpp"

namespace imxup {
class HostClientFactoryTests : public ::testing::Test {
 protected:
  HostConfigRegistry                   registry_;
  std::shared_ptr<FakeTransport>       transport_ = std::make_shared<FakeTransport>(
      [](const HttpRequest&) { return Respond(404, ""); });
  std::shared_ptr<FakeCredentialVault> vault_ = std::make_shared<FakeCredentialVault>();

  void SetUp() override {
    auto open = FileHostConfig("open");
    registry_.Add(open);

    auto keyed  = FileHostConfig("keyed");
    keyed.auth_ = ApiKeyAuth{};
    registry_.Add(keyed);

    auto off     = FileHostConfig("off");
    off.enabled_ = false;
    registry_.Add(off);

    HostConfig image;
    image.id_   = "imx";
    image.name_ = "IMX";
    image.kind_ = HostKind::IMAGE_HOST;
    image.auth_ = ApiKeyAuth{"X-API-Key", "", ""};
    ImageHostSpec spec;
    spec.upload_url_ = "https://api.imx.test/upload";
    image.image_     = spec;
    registry_.Add(image);
  }

  auto Factory() -> HostClientFactory {
    return HostClientFactory(registry_, transport_, nullptr, vault_);
  }
};

TEST_F(HostClientFactoryTests, SameHostSharesOneClient) {
  vault_->entries_["keyed"] = "KEY";
  auto factory              = Factory();

  auto first = factory.FileHost("keyed");
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first, factory.FileHost("keyed"));
  EXPECT_NE(first, factory.FileHost("open"));
  EXPECT_EQ(first->Config().id_, "keyed");
}

TEST_F(HostClientFactoryTests, WrongKindUnknownOrDisabledHostsAreRejected) {
  vault_->entries_["imx"] = "KEY";
  auto factory            = Factory();

  EXPECT_THROW(factory.FileHost("imx"), ValidationError);
  EXPECT_THROW(factory.ImageHost("open"), ValidationError);
  EXPECT_THROW(factory.FileHost("missing"), ValidationError);
  EXPECT_THROW(factory.FileHost("off"), ValidationError);
  EXPECT_NE(factory.ImageHost("imx"), nullptr);
}

TEST_F(HostClientFactoryTests, HostsThatNeedAuthRequireCredentials) {
  auto factory = Factory();
  EXPECT_THROW(factory.FileHost("keyed"), SecurityError);

  vault_->entries_["keyed"] = "   ";
  EXPECT_THROW(factory.FileHost("keyed"), SecurityError);

  // No credentials needed
  EXPECT_NE(factory.FileHost("open"), nullptr);

  HostClientFactory without_vault(registry_, transport_, nullptr, nullptr);
  EXPECT_THROW(without_vault.FileHost("keyed"), SecurityError);
}

TEST(EnvCredentialVaultTest, ReadsUpperCasedVariable) {
  EXPECT_EQ(EnvCredentialVault::VariableName("file.host-1"), "IMXUP_CREDENTIALS_FILE_HOST_1");

  EnvCredentialVault vault;
  ::setenv("IMXUP_CREDENTIALS_VAULT_TEST", "alice:pw", 1);
  EXPECT_EQ(vault.Lookup("vault_test").value_or(""), "alice:pw");
  EXPECT_EQ(vault.Require("vault-test"), "alice:pw");
  ::unsetenv("IMXUP_CREDENTIALS_VAULT_TEST");
  EXPECT_FALSE(vault.Lookup("vault_test").has_value());
  EXPECT_THROW(vault.Require("vault_test"), SecurityError);
}
}  // namespace imxup
