#include "scrobble/play_session.h"

#include "core/daemon_constants.h"
#include "logging/logger.h"

#include <algorithm>

namespace scrobble {

const char* sessionStateToString(SessionState state) {
    switch (state) {
    case SessionState::Empty:
        return "empty";
    case SessionState::ActiveUnscrobbled:
        return "active";
    case SessionState::ActiveScrobbled:
        return "scrobbled";
    }
    return "unknown";
}

uint64_t scrobbleThresholdSeconds(uint64_t durationSeconds, int thresholdPercent) {
    // Split so duration * percent cannot overflow
    const uint64_t percent = static_cast<uint64_t>(std::clamp(thresholdPercent, 0, 100));
    const uint64_t byPercent = durationSeconds / 100 * percent + durationSeconds % 100 * percent / 100;
    return std::min(byPercent, DaemonConstants::SCROBBLE_TIME_CEILING_SEC);
}

bool isScrobbleEligible(uint64_t durationSeconds, uint64_t elapsedSeconds, int thresholdPercent) {
    if (durationSeconds < DaemonConstants::MIN_TRACK_DURATION_SEC) {
        return false;
    }
    return elapsedSeconds >= scrobbleThresholdSeconds(durationSeconds, thresholdPercent);
}

uint64_t elapsedSeconds(Clock::time_point startedAt, Clock::time_point now) {
    if (now <= startedAt) {
        return 0;
    }
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now - startedAt).count());
}

PlaySessionMachine::PlaySessionMachine(const SharedAppFilter& filter, int thresholdPercent,
                                       const CleanupConfig& cleanup)
    : filter_(filter), normalizer_(cleanup), thresholdPercent_(clampPercent(thresholdPercent)) {}

int PlaySessionMachine::clampPercent(int percent) {
    return std::clamp(percent, DaemonConstants::MIN_SCROBBLE_THRESHOLD_PERCENT,
                      DaemonConstants::MAX_SCROBBLE_THRESHOLD_PERCENT);
}

PollEvents PlaySessionMachine::poll(const std::optional<Snapshot>& snapshot,
                                    Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    PollEvents events;

    if (!snapshot) {
        if (session_) {
            LOG_INFO("Session ended: {} (no media)", session_->track.displayName());
            session_.reset();
        }
        return events;
    }

    // Paused or unknown playback state keeps the session as it is
    if (!snapshot->isPlaying.value_or(false)) {
        LOG_TRACE("Snapshot not playing, session preserved");
        return events;
    }

    auto track = makeTrack(*snapshot, normalizer_);
    if (!track) {
        LOG_DEBUG("Snapshot without title/artist ignored");
        return events;
    }

    switch (filter_.classify(snapshot->sourceAppId)) {
    case AppFilterAction::Ignore:
        LOG_DEBUG("Ignoring playback from app '{}'", snapshot->sourceAppId.value_or(""));
        return events;
    case AppFilterAction::AskUser:
        events.askUser = AskUserEvent{*snapshot->sourceAppId};
        return events;
    case AppFilterAction::Allow:
        break;
    }

    const bool isNew = !session_ || session_->track != *track ||
                       session_->updateToken != snapshot->updateToken;

    if (isNew) {
        PlaySession next;
        next.track = *track;
        next.sourceAppId = snapshot->sourceAppId;
        next.updateToken = snapshot->updateToken;
        next.startedAt = now;
        next.durationSeconds = track->durationSeconds.value_or(0);
        next.scrobbled = false;
        next.nowPlayingSent = true;
        session_ = std::move(next);

        LOG_INFO("Now playing: {} ({}s, app={})", session_->track.displayName(),
                 session_->durationSeconds, session_->sourceAppId.value_or("unknown"));
        events.nowPlaying = NowPlayingEvent{session_->track, session_->sourceAppId};
        return events;
    }

    const uint64_t elapsed = elapsedSeconds(session_->startedAt, now);
    if (!session_->scrobbled &&
        isScrobbleEligible(session_->durationSeconds, elapsed, thresholdPercent_)) {
        session_->scrobbled = true;
        LOG_INFO("Scrobble: {} after {}s", session_->track.displayName(), elapsed);
        events.scrobble =
            ScrobbleEvent{session_->track, session_->startedAt, session_->sourceAppId};
    } else if (!session_->nowPlayingSent) {
        session_->nowPlayingSent = true;
        events.nowPlaying = NowPlayingEvent{session_->track, session_->sourceAppId};
    }
    return events;
}

SessionState PlaySessionMachine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return SessionState::Empty;
    }
    return session_->scrobbled ? SessionState::ActiveScrobbled : SessionState::ActiveUnscrobbled;
}

std::optional<PlaySession> PlaySessionMachine::currentSession() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

void PlaySessionMachine::setThresholdPercent(int thresholdPercent) {
    std::lock_guard<std::mutex> lock(mutex_);
    thresholdPercent_ = clampPercent(thresholdPercent);
}

int PlaySessionMachine::thresholdPercent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thresholdPercent_;
}

void PlaySessionMachine::setCleanup(const CleanupConfig& cleanup) {
    TextNormalizer normalizer(cleanup);
    std::lock_guard<std::mutex> lock(mutex_);
    normalizer_ = std::move(normalizer);
}

}  // namespace scrobble
