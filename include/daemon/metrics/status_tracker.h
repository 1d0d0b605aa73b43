#pragma once

#include "scrobble/track.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace daemon_metrics {

struct ServiceCounters {
    uint64_t delivered{0};
    uint64_t failed{0};
    std::string lastError;
};

struct StatusSnapshot {
    std::string nowPlaying;  // "Artist - Title", empty when idle
    std::string nowPlayingApp;
    std::string lastScrobbled;
    std::string sessionState{"empty"};
    uint64_t nowPlayingEvents{0};
    uint64_t scrobbleEvents{0};
    int64_t lastPollUnix{0};
    std::map<std::string, ServiceCounters> services;
    std::vector<std::string> pendingApps;
};

// Aggregates what the poll loop and dispatch worker report; read by the
// control plane and the status file writer.
class StatusTracker {
   public:
    void setNowPlaying(const scrobble::Track& track, const std::optional<std::string>& appId);
    void clearNowPlaying();
    void setSessionState(const std::string& state);
    void setLastPoll(int64_t unixSeconds);
    void recordNowPlayingEvent();
    void recordScrobbleEvent(const scrobble::Track& track);
    void recordDelivery(const std::string& serviceId, bool ok, const std::string& error);

    // true when appId was not pending yet
    bool addPendingApp(const std::string& appId);
    bool removePendingApp(const std::string& appId);
    std::vector<std::string> pendingApps() const;

    StatusSnapshot snapshot() const;

    // "Now Playing: <track>" / "Last Scrobbled: <track>", "-" when unset
    std::string nowPlayingText() const;
    std::string lastScrobbledText() const;

   private:
    mutable std::mutex mutex_;
    StatusSnapshot status_;
};

nlohmann::json statusToJson(const StatusSnapshot& status);

}  // namespace daemon_metrics
