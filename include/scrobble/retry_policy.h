/**
 * @file retry_policy.h
 * @brief Exponential backoff policy and the combinator that applies it to one service call
 */

#pragma once

#include "scrobble/backend_service.h"

#include <chrono>
#include <functional>

namespace scrobble {

struct RetryPolicy {
    std::chrono::milliseconds maxElapsed{10000};
    std::chrono::milliseconds baseDelay{500};
    double multiplier = 2.0;
    std::chrono::milliseconds maxDelay{5000};

    // ~10s budget for now-playing notices
    static RetryPolicy nowPlaying();
    // ~30s budget for listen submissions
    static RetryPolicy scrobble();
};

/**
 * @brief Waits for the given delay
 *
 * Returns false when the wait was interrupted (shutdown); the combinator
 * then stops retrying.
 */
using Sleeper = std::function<bool(std::chrono::milliseconds)>;

struct RetryResult {
    ServiceResult result;
    int attempts = 0;
    bool interrupted = false;
};

/**
 * @brief Run operation until it succeeds or the policy budget is spent
 *
 * Elapsed time is the measured time spent inside operation plus the delays
 * requested from sleeper. A retry is skipped when elapsed + next delay would
 * exceed maxElapsed. Every failure is retried regardless of its category.
 */
RetryResult retryWithBackoff(const RetryPolicy& policy,
                             const std::function<ServiceResult()>& operation,
                             const Sleeper& sleeper);

/**
 * @brief Sleeper backed by std::this_thread::sleep_for (never interrupted)
 */
Sleeper threadSleeper();

}  // namespace scrobble
