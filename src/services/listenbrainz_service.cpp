#include "services/listenbrainz_service.h"

#include "core/daemon_constants.h"
#include "logging/logger.h"

namespace scrobble_services {

using scrobble::ServiceResult;
using ScrobbleEngine::ErrorCode;

nlohmann::json buildListenPayload(const scrobble::Track& track,
                                  std::optional<int64_t> listenedAtUnix) {
    nlohmann::json additional = {
        {"submission_client", DaemonConstants::CLIENT_NAME},
        {"submission_client_version", DaemonConstants::CLIENT_VERSION},
    };
    if (track.durationSeconds && *track.durationSeconds > 0) {
        additional["duration_ms"] = *track.durationSeconds * 1000;
    }

    nlohmann::json metadata = {
        {"artist_name", track.artist},
        {"track_name", track.title},
        {"additional_info", additional},
    };
    if (track.album && !track.album->empty()) {
        metadata["release_name"] = *track.album;
    }

    nlohmann::json listen = {{"track_metadata", metadata}};
    if (listenedAtUnix) {
        listen["listened_at"] = *listenedAtUnix;
    }

    return {
        {"listen_type", listenedAtUnix ? "single" : "playing_now"},
        {"payload", nlohmann::json::array({listen})},
    };
}

ServiceResult mapListenBrainzResponse(const HttpResponse& response) {
    if (!response.transportOk()) {
        return ServiceResult::failure(response.transportError, response.error);
    }
    if (response.status >= 200 && response.status < 300) {
        return ServiceResult::success();
    }

    std::string detail = "HTTP " + std::to_string(response.status);
    auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("error") &&
        body["error"].is_string()) {
        detail += ": " + body["error"].get<std::string>();
    }

    if (response.status == 401) {
        return ServiceResult::failure(ErrorCode::AUTH_INVALID_TOKEN, detail);
    }
    if (response.status == 429) {
        return ServiceResult::failure(ErrorCode::SERVICE_RATE_LIMITED, detail);
    }
    if (response.status >= 500) {
        return ServiceResult::failure(ErrorCode::SERVICE_UNAVAILABLE, detail);
    }
    return ServiceResult::failure(ErrorCode::SERVICE_REJECTED, detail);
}

ListenBrainzService::ListenBrainzService(ListenBrainzConfig config,
                                         std::shared_ptr<HttpTransport> http)
    : config_(std::move(config)), http_(std::move(http)) {
    while (!config_.apiUrl.empty() && config_.apiUrl.back() == '/') {
        config_.apiUrl.pop_back();
    }
}

std::string ListenBrainzService::endpoint(const char* path) const {
    std::string base = config_.apiUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + path;
}

ServiceResult ListenBrainzService::post(const nlohmann::json& payload) {
    HttpRequest request;
    request.method = HttpRequest::Method::Post;
    request.url = endpoint("/1/submit-listens");
    request.headers.emplace_back("Authorization", "Token " + config_.token);
    request.body = payload.dump();
    request.contentType = "application/json";
    return mapListenBrainzResponse(http_->execute(request));
}

ServiceResult ListenBrainzService::updateNowPlaying(const scrobble::Track& track) {
    return post(buildListenPayload(track, std::nullopt));
}

ServiceResult ListenBrainzService::submitListen(const scrobble::Track& track,
                                                std::chrono::system_clock::time_point listenedAt) {
    int64_t unix =
        std::chrono::duration_cast<std::chrono::seconds>(listenedAt.time_since_epoch()).count();
    return post(buildListenPayload(track, unix));
}

ServiceResult ListenBrainzService::validateToken() {
    HttpRequest request;
    request.method = HttpRequest::Method::Get;
    request.url = endpoint("/1/validate-token");
    request.headers.emplace_back("Authorization", "Token " + config_.token);

    HttpResponse response = http_->execute(request);
    auto result = mapListenBrainzResponse(response);
    if (!result.ok()) {
        return result;
    }

    auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return ServiceResult::failure(ErrorCode::SERVICE_BAD_RESPONSE, "response is not JSON");
    }
    if (!body.value("valid", false)) {
        return ServiceResult::failure(ErrorCode::AUTH_INVALID_TOKEN,
                                      body.value("message", std::string("token invalid")));
    }
    LOG_INFO("[{}] token valid for user '{}'", id(), body.value("user_name", std::string()));
    return result;
}

}  // namespace scrobble_services
