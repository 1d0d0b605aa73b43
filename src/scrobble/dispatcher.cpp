#include "scrobble/dispatcher.h"

#include "logging/logger.h"

#include <exception>
#include <thread>

namespace scrobble {

DispatchEvent DispatchEvent::fromNowPlaying(const NowPlayingEvent& event) {
    DispatchEvent out;
    out.type = Type::NowPlaying;
    out.track = event.track;
    out.sourceAppId = event.sourceAppId;
    return out;
}

DispatchEvent DispatchEvent::fromScrobble(const ScrobbleEvent& event) {
    DispatchEvent out;
    out.type = Type::Scrobble;
    out.track = event.track;
    out.listenedAt = event.startedAt;
    out.sourceAppId = event.sourceAppId;
    return out;
}

const char* dispatchEventTypeToString(DispatchEvent::Type type) {
    return type == DispatchEvent::Type::Scrobble ? "scrobble" : "now_playing";
}

ScrobbleDispatcher::ScrobbleDispatcher(Sleeper sleeper, RetryPolicy nowPlayingPolicy,
                                       RetryPolicy scrobblePolicy)
    : sleeper_(std::move(sleeper)),
      nowPlayingPolicy_(nowPlayingPolicy),
      scrobblePolicy_(scrobblePolicy) {}

const RetryPolicy& ScrobbleDispatcher::policyFor(DispatchEvent::Type type) const {
    return type == DispatchEvent::Type::Scrobble ? scrobblePolicy_ : nowPlayingPolicy_;
}

DispatchOutcome ScrobbleDispatcher::deliver(const DispatchEvent& event,
                                            BackendService& service) const {
    DispatchOutcome outcome;
    outcome.serviceId = service.id();

    auto call = [&event, &service]() -> ServiceResult {
        try {
            if (event.type == DispatchEvent::Type::Scrobble) {
                return service.submitListen(event.track, event.listenedAt);
            }
            return service.updateNowPlaying(event.track);
        } catch (const std::exception& e) {
            return ServiceResult::failure(ScrobbleEngine::ErrorCode::INTERNAL_UNKNOWN, e.what());
        }
    };

    outcome.retry = retryWithBackoff(policyFor(event.type), call, sleeper_);

    const char* kind = dispatchEventTypeToString(event.type);
    if (outcome.ok()) {
        LOG_INFO("[{}] {} delivered: {} (attempts={})", outcome.serviceId, kind,
                 event.track.displayName(), outcome.retry.attempts);
    } else if (outcome.retry.interrupted) {
        LOG_WARN("[{}] {} abandoned on shutdown: {}", outcome.serviceId, kind,
                 event.track.displayName());
    } else {
        LOG_ERROR("[{}] {} failed after {} attempts: {} ({})", outcome.serviceId, kind,
                  outcome.retry.attempts, outcome.retry.result.message,
                  ScrobbleEngine::errorCodeToString(outcome.retry.result.code));
    }
    return outcome;
}

std::vector<DispatchOutcome> ScrobbleDispatcher::dispatch(const DispatchEvent& event,
                                                          const ServiceList& services) const {
    std::vector<DispatchOutcome> outcomes(services.size());
    if (services.empty()) {
        return outcomes;
    }

    if (services.size() == 1) {
        outcomes[0] = deliver(event, *services[0]);
        return outcomes;
    }

    std::vector<std::thread> threads;
    threads.reserve(services.size());
    for (size_t i = 0; i < services.size(); ++i) {
        threads.emplace_back(
            [this, &event, &services, &outcomes, i]() {
                outcomes[i] = deliver(event, *services[i]);
            });
    }
    for (auto& t : threads) {
        t.join();
    }
    return outcomes;
}

}  // namespace scrobble
