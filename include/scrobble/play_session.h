/**
 * @file play_session.h
 * @brief Play-session state machine: turns snapshots into now-playing and scrobble events
 *
 * One PlaySessionMachine owns at most one PlaySession. poll() is the only
 * operation that mutates it and runs under the machine's mutex, so the
 * machine may be driven from any thread but never evaluates two snapshots
 * at once.
 */

#pragma once

#include "scrobble/app_filter.h"
#include "scrobble/text_normalizer.h"
#include "scrobble/track.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace scrobble {

using Clock = std::chrono::system_clock;

enum class SessionState { Empty, ActiveUnscrobbled, ActiveScrobbled };

const char* sessionStateToString(SessionState state);

struct PlaySession {
    Track track;
    std::optional<std::string> sourceAppId;
    std::optional<std::string> updateToken;
    Clock::time_point startedAt;
    uint64_t durationSeconds = 0;  // 0 = unknown
    bool scrobbled = false;
    bool nowPlayingSent = false;
};

struct NowPlayingEvent {
    Track track;
    std::optional<std::string> sourceAppId;
};

struct ScrobbleEvent {
    Track track;
    Clock::time_point startedAt;  // Listen timestamp reported to services
    std::optional<std::string> sourceAppId;
};

struct AskUserEvent {
    std::string appId;
};

/**
 * @brief Result of one poll; any combination of fields may be set
 */
struct PollEvents {
    std::optional<NowPlayingEvent> nowPlaying;
    std::optional<ScrobbleEvent> scrobble;
    std::optional<AskUserEvent> askUser;

    bool empty() const {
        return !nowPlaying && !scrobble && !askUser;
    }
};

/**
 * @brief Seconds of playback required before a track of this length scrobbles
 *
 * min(duration * percent / 100, 240). Integer arithmetic.
 */
uint64_t scrobbleThresholdSeconds(uint64_t durationSeconds, int thresholdPercent);

/**
 * @brief Eligibility ignoring the session's scrobbled flag
 *
 * Tracks shorter than 30 seconds (or of unknown length) never qualify.
 */
bool isScrobbleEligible(uint64_t durationSeconds, uint64_t elapsedSeconds, int thresholdPercent);

/**
 * @brief Whole seconds from startedAt to now, floored at zero
 */
uint64_t elapsedSeconds(Clock::time_point startedAt, Clock::time_point now);

class PlaySessionMachine {
   public:
    /**
     * @param filter App filter consulted on every playing snapshot. Must
     *               outlive the machine.
     * @param thresholdPercent Clamped to [1, 100]
     */
    PlaySessionMachine(const SharedAppFilter& filter, int thresholdPercent,
                       const CleanupConfig& cleanup = CleanupConfig{});

    PlaySessionMachine(const PlaySessionMachine&) = delete;
    PlaySessionMachine& operator=(const PlaySessionMachine&) = delete;

    /**
     * @brief Evaluate one snapshot
     *
     * @param snapshot nullopt means the source reported no media at all,
     *                 which ends the current session
     * @param now Wall-clock time of this tick
     */
    PollEvents poll(const std::optional<Snapshot>& snapshot, Clock::time_point now);

    SessionState state() const;
    std::optional<PlaySession> currentSession() const;

    void setThresholdPercent(int thresholdPercent);
    int thresholdPercent() const;
    void setCleanup(const CleanupConfig& cleanup);

   private:
    static int clampPercent(int percent);

    const SharedAppFilter& filter_;
    mutable std::mutex mutex_;
    TextNormalizer normalizer_;
    int thresholdPercent_;
    std::optional<PlaySession> session_;
};

}  // namespace scrobble
