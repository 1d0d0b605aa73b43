/**
 * @file dispatcher.h
 * @brief Fans one now-playing or scrobble event out to every configured backend service
 */

#pragma once

#include "scrobble/backend_service.h"
#include "scrobble/play_session.h"
#include "scrobble/retry_policy.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scrobble {

using ServiceList = std::vector<std::shared_ptr<BackendService>>;

struct DispatchEvent {
    enum class Type { NowPlaying, Scrobble };

    Type type = Type::NowPlaying;
    Track track;
    Clock::time_point listenedAt;  // Scrobble only
    std::optional<std::string> sourceAppId;

    static DispatchEvent fromNowPlaying(const NowPlayingEvent& event);
    static DispatchEvent fromScrobble(const ScrobbleEvent& event);
};

const char* dispatchEventTypeToString(DispatchEvent::Type type);

struct DispatchOutcome {
    std::string serviceId;
    RetryResult retry;

    bool ok() const {
        return retry.result.ok();
    }
};

class ScrobbleDispatcher {
   public:
    explicit ScrobbleDispatcher(Sleeper sleeper = threadSleeper(),
                                RetryPolicy nowPlayingPolicy = RetryPolicy::nowPlaying(),
                                RetryPolicy scrobblePolicy = RetryPolicy::scrobble());

    /**
     * @brief Deliver event to all services and wait for every outcome
     *
     * Each service runs on its own thread with its own retry budget; one
     * failure never blocks another service. Outcomes keep the order of
     * services. The sleeper is shared across those threads.
     */
    std::vector<DispatchOutcome> dispatch(const DispatchEvent& event,
                                          const ServiceList& services) const;

    const RetryPolicy& policyFor(DispatchEvent::Type type) const;

   private:
    DispatchOutcome deliver(const DispatchEvent& event, BackendService& service) const;

    Sleeper sleeper_;
    RetryPolicy nowPlayingPolicy_;
    RetryPolicy scrobblePolicy_;
};

}  // namespace scrobble
