#include "scrobble/retry_policy.h"

#include "core/daemon_constants.h"
#include "logging/logger.h"

#include <algorithm>
#include <thread>

namespace scrobble {

using std::chrono::milliseconds;

RetryPolicy RetryPolicy::nowPlaying() {
    RetryPolicy policy;
    policy.maxElapsed = milliseconds(DaemonConstants::NOW_PLAYING_RETRY_BUDGET_MS);
    policy.baseDelay = milliseconds(DaemonConstants::RETRY_BASE_DELAY_MS);
    policy.multiplier = DaemonConstants::RETRY_MULTIPLIER;
    policy.maxDelay = milliseconds(DaemonConstants::NOW_PLAYING_MAX_DELAY_MS);
    return policy;
}

RetryPolicy RetryPolicy::scrobble() {
    RetryPolicy policy;
    policy.maxElapsed = milliseconds(DaemonConstants::SCROBBLE_RETRY_BUDGET_MS);
    policy.baseDelay = milliseconds(DaemonConstants::RETRY_BASE_DELAY_MS);
    policy.multiplier = DaemonConstants::RETRY_MULTIPLIER;
    policy.maxDelay = milliseconds(DaemonConstants::SCROBBLE_MAX_DELAY_MS);
    return policy;
}

RetryResult retryWithBackoff(const RetryPolicy& policy,
                             const std::function<ServiceResult()>& operation,
                             const Sleeper& sleeper) {
    RetryResult out;
    milliseconds elapsed{0};
    milliseconds delay = policy.baseDelay;

    while (true) {
        auto callStart = std::chrono::steady_clock::now();
        out.result = operation();
        ++out.attempts;
        elapsed += std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() -
                                                            callStart);

        if (out.result.ok()) {
            return out;
        }

        milliseconds next = std::min(delay, policy.maxDelay);
        if (elapsed + next > policy.maxElapsed) {
            return out;
        }

        LOG_DEBUG("Attempt {} failed ({}: {}), retrying in {}ms", out.attempts,
                  ScrobbleEngine::errorCodeToString(out.result.code), out.result.message,
                  next.count());
        if (!sleeper(next)) {
            out.interrupted = true;
            return out;
        }
        elapsed += next;

        auto scaled = static_cast<milliseconds::rep>(static_cast<double>(delay.count()) *
                                                     policy.multiplier);
        delay = std::min(milliseconds(std::max<milliseconds::rep>(scaled, 1)), policy.maxDelay);
    }
}

Sleeper threadSleeper() {
    return [](milliseconds delay) {
        std::this_thread::sleep_for(delay);
        return true;
    };
}

}  // namespace scrobble
