/**
 * @file app.h
 * @brief Scrobbler daemon: poll loop, dispatch worker, control plane and status sink
 *
 * App owns every runtime component. The poll loop runs on the thread that
 * calls run(); deliveries run on the DispatchWorker thread and control
 * commands on the ZeroMQ server thread.
 */

#pragma once

#include "core/config_loader.h"
#include "daemon/control/control_plane.h"
#include "daemon/metrics/status_file.h"
#include "daemon/metrics/status_tracker.h"
#include "graceful_shutdown.h"
#include "scrobble/dispatch_worker.h"
#include "scrobble/play_session.h"
#include "services/http_client.h"
#include "source/now_playing_source.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace daemon_app {

struct AppOptions {
    std::filesystem::path configPath;
    std::string logLevelOverride;  // Re-applied after each reload
    bool enableControl = true;     // Also requires control.enabled in the config
    bool validateTokens = true;    // ListenBrainz token check when building services
    bool reinitializeLogging = true;
};

struct AppDependencies {
    std::unique_ptr<now_playing::NowPlayingSource> source;
    std::shared_ptr<scrobble_services::HttpTransport> http;
};

class App {
   public:
    App(AppOptions options, AppConfig config, AppDependencies deps);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /**
     * @brief Build services and start the worker and control plane
     *
     * A control socket that cannot bind is logged and skipped; the daemon
     * keeps scrobbling without it.
     */
    bool initialize(std::string& error);
    void shutdown();

    /**
     * @brief One poll: fetch a snapshot, evaluate it and route the events
     */
    scrobble::PollEvents tick(scrobble::Clock::time_point now);

    /**
     * @brief Poll loop until controller stops running
     *
     * Signals are processed between sleep slices so SIGTERM never waits a
     * full refresh interval.
     */
    int run(GracefulShutdown::Controller& controller);

    /**
     * @brief Re-read the config file (SIGHUP)
     *
     * On failure the running configuration stays in effect. Retry policies
     * and the control endpoint are fixed at startup.
     */
    bool reload(std::string& error);

    /**
     * @brief Apply an allow/ignore choice and write the filter lists back to
     *        the config file
     *
     * Serialized with reload() so a concurrent SIGHUP can neither drop the
     * decision nor save lists it has already replaced.
     *
     * @return false if the decision could not be saved (it stays applied)
     */
    bool recordAppDecision(const std::string& appId, scrobble::AppFilterAction decision,
                           std::string& error);

    // Wait for queued deliveries (used by --once)
    bool waitForDeliveries(std::chrono::milliseconds timeout);

    const daemon_metrics::StatusTracker& status() const {
        return status_;
    }
    AppConfig config() const;
    size_t serviceCount() const;
    const daemon_control::ControlPlane* controlPlane() const {
        return controlPlane_.get();
    }

   private:
    void onDeliveryOutcome(const scrobble::DispatchEvent& event,
                           const std::vector<scrobble::DispatchOutcome>& outcomes);
    void postToServices(scrobble::DispatchEvent event);
    void rebuildServices();
    void writeStatus(scrobble::Clock::time_point now);
    bool persistAppFilter(std::string& error);

    AppOptions options_;
    AppDependencies deps_;

    mutable std::mutex configMutex_;
    AppConfig config_;

    // Held across reload() and recordAppDecision()
    std::mutex filterUpdateMutex_;
    scrobble::SharedAppFilter appFilter_;
    scrobble::PlaySessionMachine machine_;

    mutable std::mutex servicesMutex_;
    scrobble::ServiceList services_;

    daemon_metrics::StatusTracker status_;
    std::unique_ptr<daemon_metrics::StatusFile> statusFile_;
    std::unique_ptr<scrobble::DispatchWorker> worker_;
    std::unique_ptr<daemon_control::ControlPlane> controlPlane_;
    bool initialized_ = false;
};

/**
 * @brief Retry policies derived from the "retry" config section
 */
scrobble::RetryPolicy nowPlayingPolicyFromConfig(const RetryConfig& retry);
scrobble::RetryPolicy scrobblePolicyFromConfig(const RetryConfig& retry);

}  // namespace daemon_app
