/**
 * @file listenbrainz_service.h
 * @brief ListenBrainz submit-listens adapter (one instance per configured token)
 */

#pragma once

#include "core/config_loader.h"
#include "scrobble/backend_service.h"
#include "services/http_client.h"

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace scrobble_services {

/**
 * @brief Build the submit-listens document
 *
 * listenedAtUnix absent -> "playing_now"; present -> "single" with listened_at.
 */
nlohmann::json buildListenPayload(const scrobble::Track& track,
                                  std::optional<int64_t> listenedAtUnix);

/**
 * @brief 401 -> AUTH_INVALID_TOKEN, 429 -> SERVICE_RATE_LIMITED,
 *        5xx -> SERVICE_UNAVAILABLE, other non-2xx -> SERVICE_REJECTED
 */
scrobble::ServiceResult mapListenBrainzResponse(const HttpResponse& response);

class ListenBrainzService : public scrobble::BackendService {
   public:
    ListenBrainzService(ListenBrainzConfig config, std::shared_ptr<HttpTransport> http);

    std::string id() const override {
        return "listenbrainz:" + config_.name;
    }
    scrobble::ServiceKind kind() const override {
        return scrobble::ServiceKind::ListenBrainz;
    }

    scrobble::ServiceResult updateNowPlaying(const scrobble::Track& track) override;
    scrobble::ServiceResult submitListen(const scrobble::Track& track,
                                         std::chrono::system_clock::time_point listenedAt) override;

    /**
     * @brief GET /1/validate-token
     *
     * AUTH_INVALID_TOKEN when the server answers "valid": false.
     */
    scrobble::ServiceResult validateToken();

   private:
    scrobble::ServiceResult post(const nlohmann::json& payload);
    std::string endpoint(const char* path) const;

    ListenBrainzConfig config_;
    std::shared_ptr<HttpTransport> http_;
};

}  // namespace scrobble_services
