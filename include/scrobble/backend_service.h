/**
 * @file backend_service.h
 * @brief Contract every listen-tracking backend implements
 *
 * One instance per configured account. Calls block on network I/O and are
 * made from the dispatch worker thread only.
 */

#pragma once

#include "core/error_codes.h"
#include "scrobble/track.h"

#include <chrono>
#include <string>

namespace scrobble {

enum class ServiceKind {
    LastFm,
    ListenBrainz,
};

const char* serviceKindToString(ServiceKind kind);

struct ServiceResult {
    ScrobbleEngine::ErrorCode code = ScrobbleEngine::ErrorCode::OK;
    std::string message;

    bool ok() const {
        return code == ScrobbleEngine::ErrorCode::OK;
    }
    bool retryable() const {
        return ScrobbleEngine::isRetryable(code);
    }

    static ServiceResult success() {
        return ServiceResult{};
    }
    static ServiceResult failure(ScrobbleEngine::ErrorCode code, std::string message) {
        return ServiceResult{code, std::move(message)};
    }
};

// One configured listen-tracking account (Last.fm session, ListenBrainz token).
class BackendService {
   public:
    virtual ~BackendService() = default;

    // Stable identifier used in logs and status ("lastfm", "listenbrainz:Primary").
    virtual std::string id() const = 0;

    virtual ServiceKind kind() const = 0;

    virtual ServiceResult updateNowPlaying(const Track& track) = 0;

    // listenedAt is the session start time.
    virtual ServiceResult submitListen(const Track& track,
                                       std::chrono::system_clock::time_point listenedAt) = 0;
};

}  // namespace scrobble
