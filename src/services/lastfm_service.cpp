#include "services/lastfm_service.h"

#include "logging/logger.h"

#include <cstdio>
#include <openssl/evp.h>

namespace scrobble_services {

using scrobble::ServiceResult;
using ScrobbleEngine::ErrorCode;

namespace {

std::string md5Hex(const std::string& input) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &length, EVP_md5(), nullptr) != 1) {
        return {};
    }

    std::string hex;
    hex.reserve(length * 2);
    char buf[3];
    for (unsigned int i = 0; i < length; ++i) {
        std::snprintf(buf, sizeof(buf), "%02x", digest[i]);
        hex += buf;
    }
    return hex;
}

ErrorCode mapApiError(int code) {
    switch (code) {
    case 9:  // Invalid session key
        return ErrorCode::AUTH_INVALID_SESSION;
    case 4:   // Authentication failed
    case 10:  // Invalid API key
    case 26:  // Suspended API key
        return ErrorCode::AUTH_INVALID_TOKEN;
    case 11:  // Service offline
    case 16:  // Temporary error
        return ErrorCode::SERVICE_UNAVAILABLE;
    case 29:  // Rate limit exceeded
        return ErrorCode::SERVICE_RATE_LIMITED;
    default:
        return ErrorCode::SERVICE_REJECTED;
    }
}

int jsonInt(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    if (value.is_string()) {
        try {
            return std::stoi(value.get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

}  // namespace

std::string lastfmSignature(const LastfmParams& params, const std::string& secret) {
    std::string raw;
    for (const auto& [key, value] : params) {
        if (key == "format" || key == "callback") {
            continue;
        }
        raw += key;
        raw += value;
    }
    raw += secret;
    return md5Hex(raw);
}

ServiceResult mapLastfmResponse(const HttpResponse& response, nlohmann::json& parsed) {
    if (!response.transportOk()) {
        return ServiceResult::failure(response.transportError, response.error);
    }

    parsed = nlohmann::json::parse(response.body, nullptr, false);
    const bool isJson = !parsed.is_discarded() && parsed.is_object();

    if (isJson && parsed.contains("error")) {
        int apiError = jsonInt(parsed["error"]);
        std::string message = parsed.value("message", std::string("Last.fm error"));
        return ServiceResult::failure(mapApiError(apiError),
                                      "Last.fm error " + std::to_string(apiError) + ": " +
                                          message);
    }
    if (response.status >= 500) {
        return ServiceResult::failure(ErrorCode::SERVICE_UNAVAILABLE,
                                      "HTTP " + std::to_string(response.status));
    }
    if (response.status == 403) {
        return ServiceResult::failure(ErrorCode::AUTH_INVALID_SESSION, "HTTP 403");
    }
    if (response.status >= 400 || response.status < 200) {
        return ServiceResult::failure(ErrorCode::SERVICE_REJECTED,
                                      "HTTP " + std::to_string(response.status));
    }
    if (!isJson) {
        return ServiceResult::failure(ErrorCode::SERVICE_BAD_RESPONSE, "response is not JSON");
    }
    return ServiceResult::success();
}

LastfmService::LastfmService(LastfmConfig config, std::shared_ptr<HttpTransport> http)
    : config_(std::move(config)), http_(std::move(http)) {}

ServiceResult LastfmService::callMethod(const std::string& method, LastfmParams params,
                                        nlohmann::json& response) {
    params["method"] = method;
    params["api_key"] = config_.apiKey;
    params["api_sig"] = lastfmSignature(params, config_.apiSecret);
    params["format"] = "json";

    FormParams form(params.begin(), params.end());
    HttpRequest request;
    request.method = HttpRequest::Method::Post;
    request.url = config_.apiUrl;
    request.body = encodeForm(form);
    request.contentType = "application/x-www-form-urlencoded";

    return mapLastfmResponse(http_->execute(request), response);
}

LastfmParams LastfmService::trackParams(const scrobble::Track& track) const {
    LastfmParams params;
    params["artist"] = track.artist;
    params["track"] = track.title;
    if (track.album && !track.album->empty()) {
        params["album"] = *track.album;
    }
    if (track.durationSeconds && *track.durationSeconds > 0) {
        params["duration"] = std::to_string(*track.durationSeconds);
    }
    params["sk"] = config_.sessionKey;
    return params;
}

ServiceResult LastfmService::updateNowPlaying(const scrobble::Track& track) {
    if (config_.sessionKey.empty()) {
        return ServiceResult::failure(ErrorCode::AUTH_MISSING_CREDENTIALS,
                                      "Last.fm session key missing");
    }
    nlohmann::json response;
    return callMethod("track.updateNowPlaying", trackParams(track), response);
}

ServiceResult LastfmService::submitListen(const scrobble::Track& track,
                                          std::chrono::system_clock::time_point listenedAt) {
    if (config_.sessionKey.empty()) {
        return ServiceResult::failure(ErrorCode::AUTH_MISSING_CREDENTIALS,
                                      "Last.fm session key missing");
    }

    auto params = trackParams(track);
    params["timestamp"] = std::to_string(
        std::chrono::duration_cast<std::chrono::seconds>(listenedAt.time_since_epoch()).count());

    nlohmann::json response;
    auto result = callMethod("track.scrobble", std::move(params), response);
    if (!result.ok()) {
        return result;
    }

    // A 200 response can still report the scrobble as ignored (e.g. timestamp too old)
    if (response.contains("scrobbles") && response["scrobbles"].contains("@attr")) {
        const auto& attr = response["scrobbles"]["@attr"];
        if (attr.contains("accepted") && jsonInt(attr["accepted"]) == 0 &&
            attr.contains("ignored") && jsonInt(attr["ignored"]) > 0) {
            LOG_WARN("[lastfm] scrobble ignored by server: {}", track.displayName());
            return ServiceResult::failure(ErrorCode::SERVICE_REJECTED, "scrobble ignored");
        }
    }
    return result;
}

}  // namespace scrobble_services
