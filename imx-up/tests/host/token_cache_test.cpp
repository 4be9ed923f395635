#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "host/token_cache.hpp"
#include "utils/clock/time_provider.hpp"

namespace imxup {
class TokenCacheTests : public ::testing::Test {
 protected:
  std::filesystem::path cache_path_;

  void SetUp() override {
    TimeProvider::Refresh();
    cache_path_ = std::filesystem::temp_directory_path() / "imxup_token_cache_test" / "tokens.json";
    std::filesystem::remove_all(cache_path_.parent_path());
  }

  void TearDown() override { std::filesystem::remove_all(cache_path_.parent_path()); }
};

TEST_F(TokenCacheTests, StatesSurviveAReload) {
  SessionState state;
  state.token_           = "tok-1";
  state.cookies_["xfss"] = "abc";
  state.session_id_      = "abc";
  state.issued_at_       = TimeProvider::NowUnix();
  state.expires_at_      = state.issued_at_ + 3600;
  {
    TokenCache cache(cache_path_);
    cache.Store("keep", state);
  }
  ASSERT_TRUE(std::filesystem::exists(cache_path_));
  EXPECT_FALSE(std::filesystem::exists(cache_path_.string() + ".tmp"));

  TokenCache reloaded(cache_path_);
  auto       loaded = reloaded.Load("keep");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->token_, "tok-1");
  EXPECT_EQ(loaded->cookies_.at("xfss"), "abc");
  EXPECT_EQ(loaded->expires_at_.value_or(0), state.issued_at_ + 3600);
  EXPECT_FALSE(reloaded.Load("other").has_value());
}

TEST_F(TokenCacheTests, ExpiredEntriesAreDropped) {
  SessionState state;
  state.token_      = "old";
  state.expires_at_ = TimeProvider::NowUnix() - 1;

  TokenCache cache(cache_path_);
  cache.Store("keep", state);
  EXPECT_FALSE(cache.Load("keep").has_value());

  TokenCache reloaded(cache_path_);
  EXPECT_FALSE(reloaded.Load("keep").has_value());
}

TEST_F(TokenCacheTests, ClearRemovesOneHost) {
  SessionState state;
  state.token_ = "t";
  TokenCache cache(cache_path_);
  cache.Store("a", state);
  cache.Store("b", state);
  cache.Clear("a");
  EXPECT_FALSE(cache.Load("a").has_value());
  EXPECT_TRUE(cache.Load("b").has_value());

  cache.ClearAll();
  EXPECT_FALSE(cache.Load("b").has_value());
}

TEST_F(TokenCacheTests, CorruptFileCostsOnlyAFreshLogin) {
  std::filesystem::create_directories(cache_path_.parent_path());
  std::ofstream(cache_path_) << "{ definitely not json";

  TokenCache cache(cache_path_);
  EXPECT_FALSE(cache.Load("keep").has_value());

  SessionState state;
  state.token_ = "new";
  cache.Store("keep", state);
  EXPECT_EQ(TokenCache(cache_path_).Load("keep")->token_, "new");
}
}  // namespace imxup
