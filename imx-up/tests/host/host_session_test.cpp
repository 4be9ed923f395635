#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <nlohmann/json.hpp>

#include "host/host_session.hpp"
#include "host/token_cache.hpp"
#include "support/fake_transport.hpp"
#include "type/errors.hpp"
#include "utils/clock/time_provider.hpp"

namespace imxup {
namespace {
const char* kCaptchaPage =
    R"(<form><input type="hidden" name="op" value="login"><input type="hidden" name="token" )"
    R"(value="abc"><div class="captcha">)"
    R"(<span style="position:absolute;padding-left:40px">&#56;</span>)"
    R"(<span style="position:absolute;padding-left:10px">1</span>)"
    R"(<span style="position:absolute;padding-left:25px"> 4 </span>)"
    R"(<span style="position:absolute;padding-left:55px">9</span></div></form>)";

auto TokenHost(HttpMethod method) -> HostConfig {
  HostConfig config;
  config.id_   = "keep";
  config.name_ = "Keep";
  TokenLoginAuth auth;
  auth.login_url_    = "https://api.keep.test/login";
  auth.login_method_ = method;
  auth.login_fields_ = {{"login", "{username}"}, {"password", "{password}"}};
  auth.token_path_   = {std::string("token")};
  auth.error_path_   = {std::string("msg")};
  auth.header_       = "Authorization";
  config.auth_       = auth;
  return config;
}
}  // namespace

class HostSessionTests : public ::testing::Test {
 protected:
  std::atomic<int>               logins_{0};
  std::shared_ptr<FakeTransport> transport_;

  void SetUp() override {
    TimeProvider::Refresh();
    transport_ = std::make_shared<FakeTransport>([this](const HttpRequest& request) {
      if (request.url_.find("/login") != std::string::npos) {
        int n = ++logins_;
        return Respond(200, nlohmann::json{{"token", "t" + std::to_string(n)}}.dump());
      }
      return Respond(404, "");
    });
  }
};

TEST(HostSessionCaptchaTest, DigitsAreOrderedByOffset) {
  const std::string area = R"(<div class="captcha">.*?</div>)";
  EXPECT_EQ(HostSession::SolveCaptcha(kCaptchaPage, area, CaptchaTransform::NONE), "1489");
  EXPECT_EQ(HostSession::SolveCaptcha(kCaptchaPage, area, CaptchaTransform::MOVE_3RD_TO_FRONT),
            "8149");
  EXPECT_EQ(HostSession::SolveCaptcha(kCaptchaPage, area, CaptchaTransform::REVERSE), "9841");
  EXPECT_EQ(HostSession::SolveCaptcha("<p>no captcha</p>", area, CaptchaTransform::NONE), "");
  EXPECT_THROW(HostSession::SolveCaptcha(kCaptchaPage, "(", CaptchaTransform::NONE),
               ValidationError);
}

TEST(HostSessionCaptchaTest, UnusableSpansAreSkipped) {
  const std::string page =
      R"(<div class="captcha">)"
      R"(<span style="padding-left:99999999999999999999px">7</span>)"
      R"(<span style="padding-left:5px">&#99999999999999999999;</span>)"
      R"(<span style="padding-left:6px">&#300;</span>)"
      R"(<span style="padding-left:20px">&#50;</span>)"
      R"(<span style="padding-left:10px">3</span></div>)";
  const std::string area = R"(<div class="captcha">.*?</div>)";
  EXPECT_EQ(HostSession::SolveCaptcha(page, area, CaptchaTransform::NONE), "32");
}

TEST_F(HostSessionTests, GetLoginSendsCredentialsAsQuery) {
  HostSession session(TokenHost(HttpMethod::GET), transport_, "alice:s3cret", nullptr);
  session.EnsureAuthenticated();

  auto requests = transport_->Requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].method_, HttpMethod::GET);
  EXPECT_EQ(requests[0].url_, "https://api.keep.test/login?login=alice&password=s3cret");
  EXPECT_EQ(session.State().token_, "t1");
  EXPECT_EQ(session.LoginCount(), 1u);

  HttpRequest upload;
  upload.url_ = "https://up.keep.test/upload?token={token}";
  upload.form_.push_back(FormPart{"sess", "{token}", {}});
  session.Authorize(upload);
  EXPECT_EQ(upload.url_, "https://up.keep.test/upload?token=t1");
  EXPECT_EQ(upload.form_[0].value_, "t1");
  EXPECT_EQ(upload.headers_.at("Authorization"), "Bearer t1");

  // A usable token is not refreshed
  session.EnsureAuthenticated();
  EXPECT_EQ(session.LoginCount(), 1u);
}

TEST_F(HostSessionTests, PostLoginSendsFormBody) {
  HostSession session(TokenHost(HttpMethod::POST), transport_, "alice:s3cret", nullptr);
  session.EnsureAuthenticated();

  auto requests = transport_->Requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].url_, "https://api.keep.test/login");
  EXPECT_EQ(requests[0].body_, "login=alice&password=s3cret");
  EXPECT_EQ(requests[0].headers_.at("Content-Type"), "application/x-www-form-urlencoded");
}

TEST_F(HostSessionTests, ApiStatusInBodyFailsLogin) {
  auto transport = std::make_shared<FakeTransport>([](const HttpRequest&) {
    return Respond(200, R"({"status": 403, "msg": "Wrong password"})");
  });
  HostSession session(TokenHost(HttpMethod::GET), transport, "alice:bad", nullptr);
  try {
    session.EnsureAuthenticated();
    FAIL() << "login should fail";
  } catch (const AuthenticationError& e) {
    EXPECT_EQ(e.Reason(), "Login failed: Wrong password");
  }
}

TEST_F(HostSessionTests, MissingCredentialsFailLogin) {
  HostSession session(TokenHost(HttpMethod::GET), transport_, "", nullptr);
  EXPECT_THROW(session.EnsureAuthenticated(), AuthenticationError);
  EXPECT_TRUE(transport_->Requests().empty());
}

TEST_F(HostSessionTests, AuthRetryLogsInOnceMore) {
  HostSession session(TokenHost(HttpMethod::GET), transport_, "alice:s3cret", nullptr);

  int  calls  = 0;
  auto result = session.WithAuthRetry([&] {
    ++calls;
    if (calls == 1) throw AuthenticationError("token revoked");
    return session.State().token_;
  });
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(result, "t2");
  EXPECT_EQ(session.LoginCount(), 2u);
}

TEST_F(HostSessionTests, SecondAuthFailurePropagates) {
  HostSession session(TokenHost(HttpMethod::GET), transport_, "alice:s3cret", nullptr);

  int  calls  = 0;
  auto always = [&]() -> int {
    ++calls;
    throw AuthenticationError("still revoked");
  };
  EXPECT_THROW(session.WithAuthRetry(always), AuthenticationError);
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(session.LoginCount(), 2u);
}

TEST_F(HostSessionTests, StaleGenerationDoesNotLogInAgain) {
  HostSession session(TokenHost(HttpMethod::GET), transport_, "alice:s3cret", nullptr);
  session.EnsureAuthenticated();
  auto seen = session.Generation();

  session.Reauthenticate(seen);
  EXPECT_EQ(session.LoginCount(), 2u);
  // A second caller that saw the same generation finds the fresh token in place
  session.Reauthenticate(seen);
  EXPECT_EQ(session.LoginCount(), 2u);
}

TEST_F(HostSessionTests, CachedTokenIsReused) {
  auto         cache = std::make_shared<TokenCache>();
  SessionState cached;
  cached.token_     = "cached";
  cached.issued_at_ = TimeProvider::NowUnix();
  cache->Store("keep", cached);

  HostSession session(TokenHost(HttpMethod::GET), transport_, "alice:s3cret", cache);
  session.EnsureAuthenticated();
  EXPECT_EQ(session.LoginCount(), 0u);
  EXPECT_EQ(session.State().token_, "cached");

  session.Reauthenticate(session.Generation());
  EXPECT_EQ(cache->Load("keep")->token_, "t1");
}

TEST_F(HostSessionTests, TokenNearExpiryIsRefreshed) {
  auto config = TokenHost(HttpMethod::GET);
  std::get<TokenLoginAuth>(config.auth_).refresh_margin_s_ = 60;

  SessionState supplied;
  supplied.token_      = "old";
  supplied.issued_at_  = TimeProvider::NowUnix() - 3000;
  supplied.expires_at_ = TimeProvider::NowUnix() + 30;
  HostSession session(config, transport_, "alice:s3cret", nullptr, supplied);
  EXPECT_EQ(session.State().token_, "old");

  session.EnsureAuthenticated();
  EXPECT_EQ(session.State().token_, "t1");
  EXPECT_EQ(session.LoginCount(), 1u);
}

TEST_F(HostSessionTests, ApiKeyGoesIntoHeaderOrQuery) {
  HostConfig config;
  config.id_   = "pixel";
  config.name_ = "Pixel";
  config.auth_ = ApiKeyAuth{"X-Api-Key", "", ""};

  HostSession header_session(config, transport_, "  KEY123 ", nullptr);
  header_session.EnsureAuthenticated();
  HttpRequest request;
  request.url_ = "https://pixel.test/upload";
  header_session.Authorize(request);
  EXPECT_EQ(request.headers_.at("X-Api-Key"), "KEY123");
  EXPECT_THROW(header_session.Reauthenticate(0), AuthenticationError);

  config.auth_ = ApiKeyAuth{"Authorization", "Bearer", "key"};
  HostSession query_session(config, transport_, "KEY123", nullptr);
  HttpRequest query_request;
  query_request.url_ = "https://pixel.test/upload?x=1";
  query_session.Authorize(query_request);
  EXPECT_EQ(query_request.url_, "https://pixel.test/upload?x=1&key=KEY123");

  HostSession empty_session(config, transport_, "", nullptr);
  EXPECT_THROW(empty_session.EnsureAuthenticated(), AuthenticationError);
}

TEST_F(HostSessionTests, SessionLoginSolvesCaptchaAndKeepsCookies) {
  HostConfig config;
  config.id_   = "files";
  config.name_ = "Files";
  SessionCookieAuth auth;
  auth.login_url_           = "https://files.test/login";
  auth.login_page_url_      = "https://files.test/login.html";
  auth.login_fields_        = {{"login", "{username}"}, {"password", "{password}"}};
  auth.captcha_regex_       = R"(<div class="captcha">.*?</div>)";
  auth.captcha_transform_   = CaptchaTransform::MOVE_3RD_TO_FRONT;
  auth.session_cookie_name_ = "xfss";
  config.auth_              = auth;

  auto transport = std::make_shared<FakeTransport>([](const HttpRequest& request) {
    if (request.url_ == "https://files.test/login.html") {
      auto page             = Respond(200, kCaptchaPage);
      page.cookies_["lang"] = "en";
      return page;
    }
    auto login             = Respond(302, "");
    login.cookies_["xfss"] = "S355ION";
    return login;
  });

  HostSession session(config, transport, "alice:pw", nullptr);
  session.EnsureAuthenticated();

  auto requests = transport->Requests();
  ASSERT_EQ(requests.size(), 2u);
  EXPECT_EQ(requests[1].method_, HttpMethod::POST);
  EXPECT_EQ(requests[1].body_, "code=8149&login=alice&op=login&password=pw&token=abc");
  EXPECT_EQ(requests[1].cookies_.at("lang"), "en");

  auto state = session.State();
  EXPECT_EQ(state.session_id_, "S355ION");
  EXPECT_EQ(state.cookies_.size(), 2u);

  HttpRequest upload;
  session.Authorize(upload);
  EXPECT_EQ(upload.cookies_.at("xfss"), "S355ION");
}
}  // namespace imxup
