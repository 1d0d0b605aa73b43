#include "scrobble/dispatch_worker.h"

#include "logging/logger.h"

#include <algorithm>

namespace scrobble {

DispatchWorker::DispatchWorker(RetryPolicy nowPlayingPolicy, RetryPolicy scrobblePolicy,
                               size_t capacity)
    : dispatcher_([this](std::chrono::milliseconds delay) { return interruptibleSleep(delay); },
                  nowPlayingPolicy, scrobblePolicy),
      capacity_(std::max<size_t>(capacity, 1)) {}

DispatchWorker::~DispatchWorker() {
    shutdown();
}

bool DispatchWorker::initialize(OutcomeCallback callback) {
    if (running_.load()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
        stopping_ = false;
        queue_.clear();
    }
    running_.store(true);
    thread_ = std::thread(&DispatchWorker::workerThread, this);
    LOG_INFO("Dispatch worker started (queue capacity {})", capacity_);
    return true;
}

void DispatchWorker::shutdown() {
    if (!running_.load()) {
        return;
    }

    size_t abandoned = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        abandoned = queue_.size();
        stats_.dropped += abandoned;
        queue_.clear();
    }
    cv_.notify_all();
    idleCv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false);
    LOG_INFO("Dispatch worker stopped ({} queued events abandoned)", abandoned);
}

bool DispatchWorker::post(DispatchEvent event, ServiceList services) {
    if (!running_.load()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }

        if (queue_.size() >= capacity_) {
            auto victim = std::find_if(queue_.begin(), queue_.end(), [](const Job& job) {
                return job.event.type == DispatchEvent::Type::NowPlaying;
            });
            if (victim != queue_.end()) {
                LOG_WARN("Dispatch queue full, dropping now-playing for {}",
                         victim->event.track.displayName());
                queue_.erase(victim);
            } else if (event.type == DispatchEvent::Type::NowPlaying) {
                LOG_WARN("Dispatch queue full of scrobbles, dropping now-playing for {}",
                         event.track.displayName());
                ++stats_.dropped;
                return false;
            } else {
                LOG_ERROR("Dispatch queue full, dropping oldest scrobble {}",
                          queue_.front().event.track.displayName());
                queue_.pop_front();
            }
            ++stats_.dropped;
        }

        queue_.push_back(Job{std::move(event), std::move(services)});
        ++stats_.posted;
    }
    cv_.notify_all();
    return true;
}

bool DispatchWorker::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCv_.wait_for(lock, timeout,
                            [this]() { return stopping_ || (queue_.empty() && !busy_); });
}

size_t DispatchWorker::queueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

DispatchWorker::Stats DispatchWorker::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

bool DispatchWorker::interruptibleSleep(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, delay, [this]() { return stopping_; });
}

void DispatchWorker::workerThread() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                break;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        auto outcomes = dispatcher_.dispatch(job.event, job.services);

        // Callback runs outside the lock
        if (callback_) {
            callback_(job.event, outcomes);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
            ++stats_.completed;
        }
        idleCv_.notify_all();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        busy_ = false;
    }
    idleCv_.notify_all();
}

}  // namespace scrobble
