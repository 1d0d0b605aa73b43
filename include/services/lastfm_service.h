/**
 * @file lastfm_service.h
 * @brief Last.fm Web API 2.0 adapter (track.updateNowPlaying, track.scrobble)
 */

#pragma once

#include "core/config_loader.h"
#include "scrobble/backend_service.h"
#include "services/http_client.h"

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace scrobble_services {

// Sorted by key, which is the order the API signature requires.
using LastfmParams = std::map<std::string, std::string>;

/**
 * @brief api_sig: md5 hex of concatenated key+value pairs (sorted) followed by the secret
 *
 * "format" and "callback" are excluded.
 */
std::string lastfmSignature(const LastfmParams& params, const std::string& secret);

/**
 * @brief Map an API response to a ServiceResult
 *
 * HTTP 5xx -> SERVICE_UNAVAILABLE; "error" 9 -> AUTH_INVALID_SESSION;
 * 11/16 -> SERVICE_UNAVAILABLE; 29 -> SERVICE_RATE_LIMITED;
 * 4/10/26 -> AUTH_INVALID_TOKEN; other errors -> SERVICE_REJECTED;
 * unparseable 2xx body -> SERVICE_BAD_RESPONSE.
 *
 * @param parsed Receives the decoded body when it is valid JSON
 */
scrobble::ServiceResult mapLastfmResponse(const HttpResponse& response, nlohmann::json& parsed);

class LastfmService : public scrobble::BackendService {
   public:
    LastfmService(LastfmConfig config, std::shared_ptr<HttpTransport> http);

    std::string id() const override {
        return "lastfm";
    }
    scrobble::ServiceKind kind() const override {
        return scrobble::ServiceKind::LastFm;
    }

    scrobble::ServiceResult updateNowPlaying(const scrobble::Track& track) override;
    scrobble::ServiceResult submitListen(const scrobble::Track& track,
                                         std::chrono::system_clock::time_point listenedAt) override;

    /**
     * @brief Signed POST of an arbitrary API method
     *
     * Adds method, api_key, api_sig and format=json. The session key is not
     * added; callers that need it put "sk" into params.
     */
    scrobble::ServiceResult callMethod(const std::string& method, LastfmParams params,
                                       nlohmann::json& response);

    const LastfmConfig& config() const {
        return config_;
    }

   private:
    LastfmParams trackParams(const scrobble::Track& track) const;

    LastfmConfig config_;
    std::shared_ptr<HttpTransport> http_;
};

}  // namespace scrobble_services
