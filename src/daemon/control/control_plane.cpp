#include "daemon/control/control_plane.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>

namespace daemon_control {

using daemon_ipc::ZmqCommandServer;
using daemon_ipc::ZmqRequest;
using ScrobbleEngine::ErrorCode;

namespace {

int64_t toUnixSeconds(scrobble::Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

nlohmann::json trackToJson(const scrobble::Track& track) {
    nlohmann::json j = {{"title", track.title}, {"artist", track.artist}};
    j["album"] = track.album ? nlohmann::json(*track.album) : nlohmann::json(nullptr);
    j["duration"] =
        track.durationSeconds ? nlohmann::json(*track.durationSeconds) : nlohmann::json(nullptr);
    return j;
}

}  // namespace

bool parseDecision(const std::string& text, scrobble::AppFilterAction& out) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "allow") {
        out = scrobble::AppFilterAction::Allow;
        return true;
    }
    if (lower == "ignore") {
        out = scrobble::AppFilterAction::Ignore;
        return true;
    }
    return false;
}

ControlPlane::ControlPlane(std::string endpoint, ControlPlaneDependencies deps, int recvTimeoutMs)
    : deps_(std::move(deps)),
      server_(std::make_unique<ZmqCommandServer>(std::move(endpoint), recvTimeoutMs)) {
    registerHandlers();
}

ControlPlane::~ControlPlane() {
    stop();
}

bool ControlPlane::start() {
    return server_->start();
}

void ControlPlane::stop() {
    server_->stop();
}

bool ControlPlane::isRunning() const {
    return server_->isRunning();
}

const std::string& ControlPlane::endpoint() const {
    return server_->endpoint();
}

const std::string& ControlPlane::pubEndpoint() const {
    return server_->pubEndpoint();
}

void ControlPlane::registerHandlers() {
    server_->registerCommand("PING", [this](const ZmqRequest& r) { return handlePing(r); });
    server_->registerCommand("STATUS", [this](const ZmqRequest& r) { return handleStatus(r); });
    server_->registerCommand("PENDING_APPS",
                             [this](const ZmqRequest& r) { return handlePendingApps(r); });
    server_->registerCommand("APP_DECISION",
                             [this](const ZmqRequest& r) { return handleAppDecision(r); });
}

void ControlPlane::publish(const nlohmann::json& payload) {
    if (server_->isRunning()) {
        server_->publish(payload.dump());
    }
}

void ControlPlane::publishNowPlaying(const scrobble::NowPlayingEvent& event) {
    publish({{"type", "now_playing"},
             {"track", trackToJson(event.track)},
             {"app", event.sourceAppId.value_or("")}});
}

void ControlPlane::publishScrobble(const scrobble::ScrobbleEvent& event) {
    publish({{"type", "scrobble"},
             {"track", trackToJson(event.track)},
             {"started_at", toUnixSeconds(event.startedAt)},
             {"app", event.sourceAppId.value_or("")}});
}

void ControlPlane::publishAskUser(const std::string& appId) {
    publish({{"type", "ask_user"}, {"app", appId}});
}

void ControlPlane::publishDeliveryFailed(const std::string& serviceId,
                                         const std::string& eventType,
                                         const std::string& message) {
    publish({{"type", "delivery_failed"},
             {"service", serviceId},
             {"event", eventType},
             {"message", message}});
}

std::string ControlPlane::handlePing(const ZmqRequest& request) {
    if (request.isJson) {
        return ZmqCommandServer::buildOkResponse(request, "PONG");
    }
    return "PONG";
}

std::string ControlPlane::handleStatus(const ZmqRequest& request) {
    if (!deps_.status) {
        return ZmqCommandServer::buildErrorResponse(request, ErrorCode::INTERNAL_UNKNOWN,
                                                    "status unavailable");
    }
    auto data = daemon_metrics::statusToJson(deps_.status->snapshot());
    data["now_playing_text"] = deps_.status->nowPlayingText();
    data["last_scrobbled_text"] = deps_.status->lastScrobbledText();
    return ZmqCommandServer::buildOkResponse(request, data);
}

std::string ControlPlane::handlePendingApps(const ZmqRequest& request) {
    if (!deps_.status) {
        return ZmqCommandServer::buildErrorResponse(request, ErrorCode::INTERNAL_UNKNOWN,
                                                    "status unavailable");
    }
    nlohmann::json apps = deps_.status->pendingApps();
    return ZmqCommandServer::buildOkResponse(request, apps);
}

std::string ControlPlane::handleAppDecision(const ZmqRequest& request) {
    if (!deps_.recordAppDecision) {
        return ZmqCommandServer::buildErrorResponse(request, ErrorCode::INTERNAL_UNKNOWN,
                                                    "app filter unavailable");
    }

    std::string appId;
    std::string decisionText;
    if (request.isJson) {
        auto params = request.params();
        if (params.contains("app") && params["app"].is_string()) {
            appId = params["app"].get<std::string>();
        }
        if (params.contains("decision") && params["decision"].is_string()) {
            decisionText = params["decision"].get<std::string>();
        }
    } else {
        auto eq = request.payload.rfind('=');
        if (eq != std::string::npos) {
            appId = request.payload.substr(0, eq);
            decisionText = request.payload.substr(eq + 1);
        }
    }

    scrobble::AppFilterAction decision;
    if (appId.empty() || !parseDecision(decisionText, decision)) {
        return ZmqCommandServer::buildErrorResponse(
            request, ErrorCode::IPC_INVALID_PARAMS,
            "expected app and decision (allow|ignore)");
    }

    std::string error;
    const bool saved = deps_.recordAppDecision(appId, decision, error);
    if (deps_.status) {
        deps_.status->removePendingApp(appId);
    }
    LOG_INFO("App '{}' set to {}", appId, scrobble::appFilterActionToString(decision));

    publish({{"type", "app_decision"},
             {"app", appId},
             {"decision", scrobble::appFilterActionToString(decision)}});

    if (!saved) {
        LOG_ERROR("Cannot save app decision for '{}': {}", appId, error);
        return ZmqCommandServer::buildErrorResponse(request, ErrorCode::VALIDATION_INVALID_CONFIG,
                                                    "decision applied but not saved: " + error);
    }

    nlohmann::json data = {{"app", appId},
                           {"decision", scrobble::appFilterActionToString(decision)}};
    return ZmqCommandServer::buildOkResponse(request, data);
}

}  // namespace daemon_control
