#include "daemon/app/app.h"

#include "core/daemon_constants.h"
#include "logging/logger.h"
#include "services/service_factory.h"
#include "source/mpris_source.h"

#include <algorithm>
#include <thread>

namespace daemon_app {

using namespace DaemonConstants;
using std::chrono::milliseconds;

namespace {

constexpr milliseconds kSignalPollSlice{200};

int64_t toUnixSeconds(scrobble::Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

}  // namespace

scrobble::RetryPolicy nowPlayingPolicyFromConfig(const RetryConfig& retry) {
    scrobble::RetryPolicy policy = scrobble::RetryPolicy::nowPlaying();
    policy.maxElapsed = milliseconds(retry.nowPlayingBudgetMs);
    policy.baseDelay = milliseconds(retry.baseDelayMs);
    policy.multiplier = retry.multiplier;
    return policy;
}

scrobble::RetryPolicy scrobblePolicyFromConfig(const RetryConfig& retry) {
    scrobble::RetryPolicy policy = scrobble::RetryPolicy::scrobble();
    policy.maxElapsed = milliseconds(retry.scrobbleBudgetMs);
    policy.baseDelay = milliseconds(retry.baseDelayMs);
    policy.multiplier = retry.multiplier;
    return policy;
}

App::App(AppOptions options, AppConfig config, AppDependencies deps)
    : options_(std::move(options)),
      deps_(std::move(deps)),
      config_(std::move(config)),
      appFilter_(config_.appFiltering),
      machine_(appFilter_, config_.scrobbleThreshold, config_.cleanup) {
    if (!deps_.http) {
        deps_.http = std::make_shared<scrobble_services::CurlHttpClient>(
            milliseconds(config_.httpTimeoutMs));
    }
    if (!deps_.source) {
        deps_.source = std::make_unique<now_playing::MprisSource>();
    }
    statusFile_ = std::make_unique<daemon_metrics::StatusFile>(config_.statusFile);
    worker_ = std::make_unique<scrobble::DispatchWorker>(nowPlayingPolicyFromConfig(config_.retry),
                                                         scrobblePolicyFromConfig(config_.retry),
                                                         DISPATCH_QUEUE_CAPACITY);
}

App::~App() {
    shutdown();
}

bool App::initialize(std::string& error) {
    if (initialized_) {
        error = "already initialized";
        return false;
    }

    rebuildServices();

    if (!worker_->initialize(
            [this](const scrobble::DispatchEvent& event,
                   const std::vector<scrobble::DispatchOutcome>& outcomes) {
                onDeliveryOutcome(event, outcomes);
            })) {
        error = "dispatch worker failed to start";
        return false;
    }

    AppConfig snapshot = config();
    if (options_.enableControl && snapshot.control.enabled) {
        daemon_control::ControlPlaneDependencies controlDeps;
        controlDeps.status = &status_;
        controlDeps.recordAppDecision = [this](const std::string& appId,
                                               scrobble::AppFilterAction decision,
                                               std::string& err) {
            return recordAppDecision(appId, decision, err);
        };
        controlPlane_ = std::make_unique<daemon_control::ControlPlane>(snapshot.control.endpoint,
                                                                        std::move(controlDeps));
        if (!controlPlane_->start()) {
            LOG_ERROR("Control plane unavailable on {}; continuing without it",
                      snapshot.control.endpoint);
            controlPlane_.reset();
        } else {
            LOG_INFO("Control plane: {} (events: {})", controlPlane_->endpoint(),
                     controlPlane_->pubEndpoint());
        }
    }

    LOG_INFO("Scrobbler started: source={}, services={}, refresh={}s, threshold={}%",
             deps_.source->name(), serviceCount(), snapshot.refreshIntervalSec,
             snapshot.scrobbleThreshold);
    initialized_ = true;
    return true;
}

void App::shutdown() {
    if (!initialized_) {
        return;
    }
    initialized_ = false;

    if (controlPlane_) {
        controlPlane_->stop();
    }
    worker_->shutdown();
    controlPlane_.reset();

    auto stats = worker_->getStats();
    LOG_INFO("Scrobbler stopped: {} dispatched, {} dropped", stats.completed, stats.dropped);
}

AppConfig App::config() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

size_t App::serviceCount() const {
    std::lock_guard<std::mutex> lock(servicesMutex_);
    return services_.size();
}

void App::rebuildServices() {
    AppConfig snapshot = config();
    auto services =
        scrobble_services::createBackendServices(snapshot, deps_.http, options_.validateTokens);

    std::lock_guard<std::mutex> lock(servicesMutex_);
    services_ = std::move(services);
}

void App::postToServices(scrobble::DispatchEvent event) {
    scrobble::ServiceList services;
    {
        std::lock_guard<std::mutex> lock(servicesMutex_);
        services = services_;
    }
    if (services.empty()) {
        return;
    }
    if (!worker_->post(std::move(event), std::move(services))) {
        LOG_EVERY_N(WARN, 10, "Dispatch queue rejected an event");
    }
}

void App::onDeliveryOutcome(const scrobble::DispatchEvent& event,
                            const std::vector<scrobble::DispatchOutcome>& outcomes) {
    for (const auto& outcome : outcomes) {
        status_.recordDelivery(outcome.serviceId, outcome.ok(), outcome.retry.result.message);
        if (!outcome.ok() && !outcome.retry.interrupted && controlPlane_) {
            controlPlane_->publishDeliveryFailed(outcome.serviceId,
                                                 scrobble::dispatchEventTypeToString(event.type),
                                                 outcome.retry.result.message);
        }
    }
}

scrobble::PollEvents App::tick(scrobble::Clock::time_point now) {
    std::optional<scrobble::Snapshot> snapshot = deps_.source->fetch();
    scrobble::PollEvents events = machine_.poll(snapshot, now);

    if (events.nowPlaying) {
        const auto& np = *events.nowPlaying;
        status_.setNowPlaying(np.track, np.sourceAppId);
        status_.recordNowPlayingEvent();
        LOG_INFO("Now playing: {}", np.track.displayName());
        if (controlPlane_) {
            controlPlane_->publishNowPlaying(np);
        }
        postToServices(scrobble::DispatchEvent::fromNowPlaying(np));
    }

    if (events.scrobble) {
        const auto& sc = *events.scrobble;
        status_.recordScrobbleEvent(sc.track);
        LOG_INFO("Scrobble: {}", sc.track.displayName());
        if (controlPlane_) {
            controlPlane_->publishScrobble(sc);
        }
        postToServices(scrobble::DispatchEvent::fromScrobble(sc));
    }

    if (events.askUser) {
        const std::string& appId = events.askUser->appId;
        if (status_.addPendingApp(appId)) {
            LOG_INFO("New player '{}' waiting for allow/ignore decision", appId);
            if (controlPlane_) {
                controlPlane_->publishAskUser(appId);
            }
        }
    }

    const scrobble::SessionState state = machine_.state();
    if (state == scrobble::SessionState::Empty) {
        status_.clearNowPlaying();
    }
    status_.setSessionState(scrobble::sessionStateToString(state));

    writeStatus(now);
    return events;
}

void App::writeStatus(scrobble::Clock::time_point now) {
    status_.setLastPoll(toUnixSeconds(now));
    if (statusFile_ && statusFile_->enabled()) {
        statusFile_->update(status_.snapshot());
    }
}

int App::run(GracefulShutdown::Controller& controller) {
    controller.setReloadCallback([this]() {
        std::string error;
        if (!reload(error)) {
            LOG_ERROR("Reload failed, keeping current configuration: {}", error);
        }
    });

    while (controller.isRunning()) {
        tick(scrobble::Clock::now());

        const auto interval = std::chrono::seconds(config().refreshIntervalSec);
        const auto deadline = std::chrono::steady_clock::now() + interval;
        while (controller.isRunning()) {
            controller.processPendingSignals();
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline || !controller.isRunning()) {
                break;
            }
            auto remaining = std::chrono::duration_cast<milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(remaining, kSignalPollSlice));
        }
    }

    LOG_INFO("Shutdown requested (signal {})", controller.getLastSignal());
    shutdown();
    return 0;
}

bool App::reload(std::string& error) {
    std::lock_guard<std::mutex> filterLock(filterUpdateMutex_);

    AppConfig fresh;
    if (!loadAppConfig(options_.configPath, fresh, error, false)) {
        return false;
    }

    AppConfig previous = config();
    if (fresh.control.endpoint != previous.control.endpoint ||
        fresh.control.enabled != previous.control.enabled) {
        LOG_WARN("Control socket changes take effect after restart");
    }

    {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_ = fresh;
    }

    if (options_.reinitializeLogging) {
        np_scrobbler::logging::initializeFromConfig(options_.configPath.string(),
                                                    options_.logLevelOverride);
    }

    appFilter_.replace(fresh.appFiltering);
    for (const auto& app : fresh.appFiltering.allowedApps) {
        status_.removePendingApp(app);
    }
    for (const auto& app : fresh.appFiltering.ignoredApps) {
        status_.removePendingApp(app);
    }
    machine_.setThresholdPercent(fresh.scrobbleThreshold);
    machine_.setCleanup(fresh.cleanup);

    if (fresh.statusFile != previous.statusFile) {
        statusFile_ = std::make_unique<daemon_metrics::StatusFile>(fresh.statusFile);
    }

    rebuildServices();
    LOG_INFO("Configuration reloaded from {}", options_.configPath.string());
    return true;
}

bool App::recordAppDecision(const std::string& appId, scrobble::AppFilterAction decision,
                            std::string& error) {
    std::lock_guard<std::mutex> filterLock(filterUpdateMutex_);
    if (!appFilter_.recordDecision(appId, decision)) {
        error = "invalid decision for '" + appId + "'";
        return false;
    }
    return persistAppFilter(error);
}

bool App::persistAppFilter(std::string& error) {
    AppConfig updated = config();
    updated.appFiltering = appFilter_.snapshot();
    if (!saveAppConfig(options_.configPath, updated, error)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(configMutex_);
    config_.appFiltering = updated.appFiltering;
    return true;
}

bool App::waitForDeliveries(milliseconds timeout) {
    return worker_->waitIdle(timeout);
}

}  // namespace daemon_app
