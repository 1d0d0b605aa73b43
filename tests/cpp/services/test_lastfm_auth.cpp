#include "services/lastfm_auth.h"
#include "support/fake_services.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace scrobble_services;
using ScrobbleEngine::ErrorCode;
using test_support::FakeTransport;

class LastfmAuthTest : public ::testing::Test {
   protected:
    void SetUp() override {
        tempDir = fs::temp_directory_path() /
                  ("np_scrobbler_auth_test_" + std::to_string(getpid()));
        fs::create_directories(tempDir);
        configPath = tempDir / "config.json";

        config.lastfm.apiKey = "key123";
        config.lastfm.apiSecret = "secret456";
        transport = std::make_shared<FakeTransport>();
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    fs::path tempDir;
    fs::path configPath;
    AppConfig config;
    std::shared_ptr<FakeTransport> transport;
};

TEST_F(LastfmAuthTest, AuthorizationUrlContainsKeyAndToken) {
    EXPECT_EQ(LastfmAuthFlow::authorizationUrl("key123", "tok"),
              "https://www.last.fm/api/auth/?api_key=key123&token=tok");
}

TEST_F(LastfmAuthTest, FullFlowStoresSessionKey) {
    transport->enqueue(FakeTransport::ok(R"({"token": "tok"})"));
    transport->enqueue(
        FakeTransport::ok(R"({"session": {"name": "listener", "key": "sk-abc", "subscriber": 0}})"));

    std::istringstream in("\n");
    std::ostringstream out;
    std::string error;
    ASSERT_TRUE(runLastfmAuth(configPath, config, transport, in, out, error)) << error;

    EXPECT_EQ(config.lastfm.sessionKey, "sk-abc");
    EXPECT_TRUE(config.lastfm.enabled);
    EXPECT_NE(out.str().find("token=tok"), std::string::npos);
    EXPECT_NE(out.str().find("Authorized as listener"), std::string::npos);

    AppConfig saved;
    ASSERT_TRUE(loadAppConfig(configPath, saved, error, false)) << error;
    EXPECT_EQ(saved.lastfm.sessionKey, "sk-abc");
    EXPECT_TRUE(saved.lastfm.enabled);

    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_NE(requests[0].body.find("method=auth.getToken"), std::string::npos);
    EXPECT_NE(requests[1].body.find("method=auth.getSession"), std::string::npos);
    EXPECT_NE(requests[1].body.find("token=tok"), std::string::npos);
}

TEST_F(LastfmAuthTest, MissingApiCredentialsFailsWithoutNetwork) {
    config.lastfm.apiSecret.clear();
    std::istringstream in;
    std::ostringstream out;
    std::string error;

    EXPECT_FALSE(runLastfmAuth(configPath, config, transport, in, out, error));
    EXPECT_NE(error.find("apiSecret"), std::string::npos);
    EXPECT_TRUE(transport->requests().empty());
}

TEST_F(LastfmAuthTest, UnapprovedTokenReportsFailure) {
    transport->enqueue(FakeTransport::ok(R"({"token": "tok"})"));
    transport->enqueue(FakeTransport::reply(
        403, R"({"error": 14, "message": "This token has not been authorized"})"));

    std::istringstream in("\n");
    std::ostringstream out;
    std::string error;
    EXPECT_FALSE(runLastfmAuth(configPath, config, transport, in, out, error));
    EXPECT_NE(error.find("auth.getSession"), std::string::npos);
    EXPECT_TRUE(config.lastfm.sessionKey.empty());
    EXPECT_FALSE(fs::exists(configPath));
}

TEST_F(LastfmAuthTest, TokenResponseWithoutTokenIsBadResponse) {
    transport->enqueue(FakeTransport::ok(R"({"unexpected": true})"));
    LastfmService service(config.lastfm, transport);
    LastfmAuthFlow flow(service);

    std::string token;
    auto result = flow.requestToken(token);
    EXPECT_EQ(result.code, ErrorCode::SERVICE_BAD_RESPONSE);
    EXPECT_TRUE(token.empty());
}
