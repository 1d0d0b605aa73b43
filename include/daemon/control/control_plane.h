/**
 * @file control_plane.h
 * @brief ZeroMQ command handlers and event stream for the scrobbler daemon
 *
 * Commands (REQ/REP):
 * - PING          -> PONG
 * - STATUS        -> status JSON
 * - PENDING_APPS  -> apps waiting for an allow/ignore decision
 * - APP_DECISION  -> {"app": "...", "decision": "allow"|"ignore"} or "APP_DECISION:app=allow"
 *
 * Events (PUB): now_playing, scrobble, ask_user, app_decision, delivery_failed.
 * Every event is a JSON object with a "type" field.
 */

#pragma once

#include "daemon/control/zmq_server.h"
#include "daemon/metrics/status_tracker.h"
#include "scrobble/app_filter.h"
#include "scrobble/play_session.h"

#include <chrono>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace daemon_control {

struct ControlPlaneDependencies {
    daemon_metrics::StatusTracker* status = nullptr;

    /**
     * Applies a user decision to the shared filter and saves it. Returns
     * false when the decision was applied in memory but could not be saved.
     */
    std::function<bool(const std::string& appId, scrobble::AppFilterAction decision,
                       std::string& error)>
        recordAppDecision;
};

class ControlPlane {
   public:
    ControlPlane(std::string endpoint, ControlPlaneDependencies deps, int recvTimeoutMs = 500);
    ~ControlPlane();

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    bool start();
    void stop();
    bool isRunning() const;

    const std::string& endpoint() const;
    const std::string& pubEndpoint() const;

    void publishNowPlaying(const scrobble::NowPlayingEvent& event);
    void publishScrobble(const scrobble::ScrobbleEvent& event);
    void publishAskUser(const std::string& appId);
    void publishDeliveryFailed(const std::string& serviceId, const std::string& eventType,
                               const std::string& message);

   private:
    void registerHandlers();
    void publish(const nlohmann::json& payload);

    std::string handlePing(const daemon_ipc::ZmqRequest& request);
    std::string handleStatus(const daemon_ipc::ZmqRequest& request);
    std::string handlePendingApps(const daemon_ipc::ZmqRequest& request);
    std::string handleAppDecision(const daemon_ipc::ZmqRequest& request);

    ControlPlaneDependencies deps_;
    std::unique_ptr<daemon_ipc::ZmqCommandServer> server_;
};

/**
 * @brief Parse "allow"/"ignore" (case-insensitive)
 */
bool parseDecision(const std::string& text, scrobble::AppFilterAction& out);

}  // namespace daemon_control
