#include "daemon/metrics/status_tracker.h"

#include <algorithm>

namespace daemon_metrics {

void StatusTracker::setNowPlaying(const scrobble::Track& track,
                                  const std::optional<std::string>& appId) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.nowPlaying = track.displayName();
    status_.nowPlayingApp = appId.value_or("");
}

void StatusTracker::clearNowPlaying() {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.nowPlaying.clear();
    status_.nowPlayingApp.clear();
}

void StatusTracker::setSessionState(const std::string& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.sessionState = state;
}

void StatusTracker::setLastPoll(int64_t unixSeconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.lastPollUnix = unixSeconds;
}

void StatusTracker::recordNowPlayingEvent() {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.nowPlayingEvents++;
}

void StatusTracker::recordScrobbleEvent(const scrobble::Track& track) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.scrobbleEvents++;
    status_.lastScrobbled = track.displayName();
}

void StatusTracker::recordDelivery(const std::string& serviceId, bool ok,
                                   const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& counters = status_.services[serviceId];
    if (ok) {
        counters.delivered++;
    } else {
        counters.failed++;
        counters.lastError = error;
    }
}

bool StatusTracker::addPendingApp(const std::string& appId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& pending = status_.pendingApps;
    if (std::find(pending.begin(), pending.end(), appId) != pending.end()) {
        return false;
    }
    pending.push_back(appId);
    return true;
}

bool StatusTracker::removePendingApp(const std::string& appId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& pending = status_.pendingApps;
    auto it = std::find(pending.begin(), pending.end(), appId);
    if (it == pending.end()) {
        return false;
    }
    pending.erase(it);
    return true;
}

std::vector<std::string> StatusTracker::pendingApps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_.pendingApps;
}

StatusSnapshot StatusTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::string StatusTracker::nowPlayingText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return "Now Playing: " + (status_.nowPlaying.empty() ? std::string("-") : status_.nowPlaying);
}

std::string StatusTracker::lastScrobbledText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return "Last Scrobbled: " +
           (status_.lastScrobbled.empty() ? std::string("-") : status_.lastScrobbled);
}

nlohmann::json statusToJson(const StatusSnapshot& status) {
    nlohmann::json services = nlohmann::json::object();
    for (const auto& [id, counters] : status.services) {
        services[id] = {{"delivered", counters.delivered},
                        {"failed", counters.failed},
                        {"last_error", counters.lastError}};
    }

    return {
        {"now_playing", status.nowPlaying},
        {"now_playing_app", status.nowPlayingApp},
        {"last_scrobbled", status.lastScrobbled},
        {"session_state", status.sessionState},
        {"now_playing_events", status.nowPlayingEvents},
        {"scrobble_events", status.scrobbleEvents},
        {"last_poll", status.lastPollUnix},
        {"services", services},
        {"pending_apps", status.pendingApps},
    };
}

}  // namespace daemon_metrics
