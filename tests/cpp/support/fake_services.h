/**
 * @file fake_services.h
 * @brief In-memory HttpTransport and BackendService doubles shared by the tests
 */

#pragma once

#include "scrobble/backend_service.h"
#include "services/http_client.h"

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace test_support {

// Replays queued responses (or a handler) and records every request.
class FakeTransport : public scrobble_services::HttpTransport {
   public:
    using Handler =
        std::function<scrobble_services::HttpResponse(const scrobble_services::HttpRequest&)>;

    scrobble_services::HttpResponse execute(
        const scrobble_services::HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (handler_) {
            return handler_(request);
        }
        if (responses_.empty()) {
            return ok("{}");
        }
        auto response = responses_.front();
        responses_.pop_front();
        return response;
    }

    void enqueue(scrobble_services::HttpResponse response) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back(std::move(response));
    }

    void setHandler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    std::vector<scrobble_services::HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    static scrobble_services::HttpResponse ok(const std::string& body) {
        return reply(200, body);
    }

    static scrobble_services::HttpResponse reply(long status, const std::string& body) {
        scrobble_services::HttpResponse response;
        response.status = status;
        response.body = body;
        return response;
    }

    static scrobble_services::HttpResponse transportFailure(ScrobbleEngine::ErrorCode code) {
        scrobble_services::HttpResponse response;
        response.transportError = code;
        response.error = "connection refused";
        return response;
    }

   private:
    mutable std::mutex mutex_;
    std::deque<scrobble_services::HttpResponse> responses_;
    std::vector<scrobble_services::HttpRequest> requests_;
    Handler handler_;
};

// Records calls; each call's result comes from the configured function.
class FakeService : public scrobble::BackendService {
   public:
    using ResultFn = std::function<scrobble::ServiceResult(int attempt)>;

    explicit FakeService(std::string id,
                         scrobble::ServiceKind kind = scrobble::ServiceKind::ListenBrainz)
        : id_(std::move(id)), kind_(kind) {}

    std::string id() const override {
        return id_;
    }
    scrobble::ServiceKind kind() const override {
        return kind_;
    }

    scrobble::ServiceResult updateNowPlaying(const scrobble::Track& track) override {
        int attempt = ++nowPlayingCalls_;
        record(track);
        return nowPlayingResult_ ? nowPlayingResult_(attempt) : scrobble::ServiceResult::success();
    }

    scrobble::ServiceResult submitListen(const scrobble::Track& track,
                                         std::chrono::system_clock::time_point) override {
        int attempt = ++scrobbleCalls_;
        record(track);
        return scrobbleResult_ ? scrobbleResult_(attempt) : scrobble::ServiceResult::success();
    }

    void setNowPlayingResult(ResultFn fn) {
        nowPlayingResult_ = std::move(fn);
    }
    void setScrobbleResult(ResultFn fn) {
        scrobbleResult_ = std::move(fn);
    }

    int nowPlayingCalls() const {
        return nowPlayingCalls_.load();
    }
    int scrobbleCalls() const {
        return scrobbleCalls_.load();
    }
    std::vector<std::string> seenTracks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return seen_;
    }

    static ResultFn alwaysFail(ScrobbleEngine::ErrorCode code) {
        return [code](int) { return scrobble::ServiceResult::failure(code, "forced failure"); };
    }

   private:
    void record(const scrobble::Track& track) {
        std::lock_guard<std::mutex> lock(mutex_);
        seen_.push_back(track.displayName());
    }

    std::string id_;
    scrobble::ServiceKind kind_;
    ResultFn nowPlayingResult_;
    ResultFn scrobbleResult_;
    std::atomic<int> nowPlayingCalls_{0};
    std::atomic<int> scrobbleCalls_{0};
    mutable std::mutex mutex_;
    std::vector<std::string> seen_;
};

}  // namespace test_support
