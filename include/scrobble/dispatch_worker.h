/**
 * @file dispatch_worker.h
 * @brief Background thread that runs dispatches so the poll loop never waits on the network
 *
 * Features:
 * - FIFO delivery: events reach the dispatcher in the order they were posted
 * - Bounded queue; now-playing notices are dropped before scrobbles
 * - shutdown() interrupts backoff sleeps and abandons queued events
 */

#pragma once

#include "scrobble/dispatcher.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace scrobble {

using OutcomeCallback =
    std::function<void(const DispatchEvent& event, const std::vector<DispatchOutcome>& outcomes)>;

class DispatchWorker {
   public:
    struct Stats {
        uint64_t posted{0};
        uint64_t completed{0};
        uint64_t dropped{0};
    };

    DispatchWorker(RetryPolicy nowPlayingPolicy = RetryPolicy::nowPlaying(),
                   RetryPolicy scrobblePolicy = RetryPolicy::scrobble(),
                   size_t capacity = 256);
    ~DispatchWorker();

    DispatchWorker(const DispatchWorker&) = delete;
    DispatchWorker& operator=(const DispatchWorker&) = delete;

    /**
     * @brief Start the worker thread
     *
     * @param callback Invoked on the worker thread after each dispatch
     * @return false if already running
     */
    bool initialize(OutcomeCallback callback);

    /**
     * @brief Stop the worker thread
     *
     * Wakes any retry sleep, lets the in-flight dispatch return and discards
     * queued events. Safe to call more than once.
     */
    void shutdown();

    /**
     * @brief Queue an event for the given services (non-blocking)
     *
     * @return false if the worker is not running or the event was dropped
     */
    bool post(DispatchEvent event, ServiceList services);

    /**
     * @brief Block until the queue is empty and no dispatch is running
     *
     * @return false on timeout
     */
    bool waitIdle(std::chrono::milliseconds timeout);

    bool isRunning() const {
        return running_.load();
    }
    size_t queueSize() const;
    Stats getStats() const;

   private:
    struct Job {
        DispatchEvent event;
        ServiceList services;
    };

    void workerThread();
    bool interruptibleSleep(std::chrono::milliseconds delay);

    ScrobbleDispatcher dispatcher_;
    const size_t capacity_;
    OutcomeCallback callback_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
    std::deque<Job> queue_;
    bool stopping_ = false;
    bool busy_ = false;
    Stats stats_;

    std::atomic<bool> running_{false};
    std::thread thread_;
};

}  // namespace scrobble
