/**
 * @file test_lastfm_service.cpp
 * @brief Last.fm adapter: request signing, form body and error mapping
 */

#include "services/lastfm_service.h"
#include "support/fake_services.h"

#include <gtest/gtest.h>

using namespace scrobble_services;
using ScrobbleEngine::ErrorCode;
using test_support::FakeTransport;

namespace {

std::string percentDecode(const std::string& in) {
    std::string out;
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            out += static_cast<char>(std::stoi(in.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += in[i];
        }
    }
    return out;
}

LastfmParams parseForm(const std::string& body) {
    LastfmParams params;
    size_t start = 0;
    while (start <= body.size()) {
        size_t end = body.find('&', start);
        if (end == std::string::npos) {
            end = body.size();
        }
        std::string pair = body.substr(start, end - start);
        size_t eq = pair.find('=');
        if (eq != std::string::npos) {
            params[percentDecode(pair.substr(0, eq))] = percentDecode(pair.substr(eq + 1));
        }
        start = end + 1;
    }
    return params;
}

scrobble::Track sampleTrack() {
    return scrobble::Track{"Paranoid Android", "Radiohead", std::string("OK Computer"), 387};
}

}  // namespace

class LastfmServiceTest : public ::testing::Test {
   protected:
    void SetUp() override {
        config.enabled = true;
        config.apiKey = "key123";
        config.apiSecret = "secret456";
        config.sessionKey = "session789";
        config.apiUrl = "https://lastfm.test/2.0/";
        transport = std::make_shared<FakeTransport>();
    }

    LastfmParams lastBody() {
        auto requests = transport->requests();
        EXPECT_FALSE(requests.empty());
        return requests.empty() ? LastfmParams{} : parseForm(requests.back().body);
    }

    LastfmConfig config;
    std::shared_ptr<FakeTransport> transport;
};

// ============================================================
// Signature
// ============================================================

TEST(LastfmSignature, MatchesReferenceDigest) {
    LastfmParams params = {{"api_key", "xxx"}, {"method", "auth.getSession"}, {"token", "yyy"}};
    EXPECT_EQ(lastfmSignature(params, "zzz"), "75df1fdb6b738160924a52b1732fdde7");
}

TEST(LastfmSignature, FormatAndCallbackAreExcluded) {
    LastfmParams params = {{"api_key", "xxx"}, {"method", "auth.getSession"}, {"token", "yyy"}};
    LastfmParams withFormat = params;
    withFormat["format"] = "json";
    withFormat["callback"] = "cb";
    EXPECT_EQ(lastfmSignature(withFormat, "zzz"), lastfmSignature(params, "zzz"));
}

// ============================================================
// Requests
// ============================================================

TEST_F(LastfmServiceTest, NowPlayingSendsSignedForm) {
    transport->enqueue(FakeTransport::ok(R"({"nowplaying": {}})"));
    LastfmService service(config, transport);

    auto result = service.updateNowPlaying(sampleTrack());
    EXPECT_TRUE(result.ok()) << result.message;

    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, HttpRequest::Method::Post);
    EXPECT_EQ(requests[0].url, "https://lastfm.test/2.0/");
    EXPECT_EQ(requests[0].contentType, "application/x-www-form-urlencoded");

    auto params = parseForm(requests[0].body);
    EXPECT_EQ(params["method"], "track.updateNowPlaying");
    EXPECT_EQ(params["artist"], "Radiohead");
    EXPECT_EQ(params["track"], "Paranoid Android");
    EXPECT_EQ(params["album"], "OK Computer");
    EXPECT_EQ(params["duration"], "387");
    EXPECT_EQ(params["sk"], "session789");
    EXPECT_EQ(params["api_key"], "key123");
    EXPECT_EQ(params["format"], "json");
    EXPECT_EQ(params.count("timestamp"), 0u);

    std::string sent = params["api_sig"];
    params.erase("api_sig");
    EXPECT_EQ(sent, lastfmSignature(params, "secret456"));
}

TEST_F(LastfmServiceTest, ScrobbleCarriesSessionStartTimestamp) {
    transport->enqueue(
        FakeTransport::ok(R"({"scrobbles": {"@attr": {"accepted": 1, "ignored": 0}}})"));
    LastfmService service(config, transport);

    auto startedAt = std::chrono::system_clock::time_point(std::chrono::seconds(1700000123));
    EXPECT_TRUE(service.submitListen(sampleTrack(), startedAt).ok());

    auto params = lastBody();
    EXPECT_EQ(params["method"], "track.scrobble");
    EXPECT_EQ(params["timestamp"], "1700000123");
}

TEST_F(LastfmServiceTest, OptionalFieldsOmittedWhenUnknown) {
    LastfmService service(config, transport);
    scrobble::Track track{"Song", "Artist", std::nullopt, std::nullopt};
    service.updateNowPlaying(track);

    auto params = lastBody();
    EXPECT_EQ(params.count("album"), 0u);
    EXPECT_EQ(params.count("duration"), 0u);
}

TEST_F(LastfmServiceTest, MissingSessionKeySkipsNetwork) {
    config.sessionKey.clear();
    LastfmService service(config, transport);

    auto result = service.updateNowPlaying(sampleTrack());
    EXPECT_EQ(result.code, ErrorCode::AUTH_MISSING_CREDENTIALS);
    EXPECT_TRUE(transport->requests().empty());
}

TEST_F(LastfmServiceTest, IgnoredScrobbleIsRejected) {
    transport->enqueue(
        FakeTransport::ok(R"({"scrobbles": {"@attr": {"accepted": "0", "ignored": "1"}}})"));
    LastfmService service(config, transport);

    auto result = service.submitListen(sampleTrack(), std::chrono::system_clock::now());
    EXPECT_EQ(result.code, ErrorCode::SERVICE_REJECTED);
    EXPECT_EQ(result.message, "scrobble ignored");
}

// ============================================================
// Response mapping
// ============================================================

TEST(LastfmResponseMapping, ApiErrorCodes) {
    nlohmann::json parsed;
    auto map = [&parsed](long status, const std::string& body) {
        return mapLastfmResponse(FakeTransport::reply(status, body), parsed).code;
    };

    EXPECT_EQ(map(403, R"({"error": 9, "message": "Invalid session key"})"),
              ErrorCode::AUTH_INVALID_SESSION);
    EXPECT_EQ(map(403, R"({"error": 10, "message": "Invalid API key"})"),
              ErrorCode::AUTH_INVALID_TOKEN);
    EXPECT_EQ(map(503, R"({"error": 11, "message": "Service Offline"})"),
              ErrorCode::SERVICE_UNAVAILABLE);
    EXPECT_EQ(map(500, R"({"error": 16, "message": "Temporary error"})"),
              ErrorCode::SERVICE_UNAVAILABLE);
    EXPECT_EQ(map(429, R"({"error": 29, "message": "Rate limit"})"),
              ErrorCode::SERVICE_RATE_LIMITED);
    EXPECT_EQ(map(400, R"({"error": 6, "message": "Invalid parameters"})"),
              ErrorCode::SERVICE_REJECTED);
}

TEST(LastfmResponseMapping, ErrorMessageIncludesCode) {
    nlohmann::json parsed;
    auto result = mapLastfmResponse(
        FakeTransport::reply(200, R"({"error": "9", "message": "Invalid session key"})"), parsed);
    EXPECT_EQ(result.code, ErrorCode::AUTH_INVALID_SESSION);
    EXPECT_EQ(result.message, "Last.fm error 9: Invalid session key");
}

TEST(LastfmResponseMapping, HttpStatusWithoutErrorBody) {
    nlohmann::json parsed;
    EXPECT_EQ(mapLastfmResponse(FakeTransport::reply(502, "Bad Gateway"), parsed).code,
              ErrorCode::SERVICE_UNAVAILABLE);
    EXPECT_EQ(mapLastfmResponse(FakeTransport::reply(403, ""), parsed).code,
              ErrorCode::AUTH_INVALID_SESSION);
    EXPECT_EQ(mapLastfmResponse(FakeTransport::reply(404, ""), parsed).code,
              ErrorCode::SERVICE_REJECTED);
    EXPECT_EQ(mapLastfmResponse(FakeTransport::reply(200, "<html>"), parsed).code,
              ErrorCode::SERVICE_BAD_RESPONSE);
    EXPECT_TRUE(mapLastfmResponse(FakeTransport::reply(200, "{}"), parsed).ok());
}

TEST(LastfmResponseMapping, TransportErrorsPassThrough) {
    nlohmann::json parsed;
    auto result = mapLastfmResponse(FakeTransport::transportFailure(ErrorCode::NETWORK_TIMEOUT),
                                    parsed);
    EXPECT_EQ(result.code, ErrorCode::NETWORK_TIMEOUT);
    EXPECT_TRUE(result.retryable());
}
