#include "services/service_factory.h"

#include "logging/logger.h"
#include "services/lastfm_service.h"
#include "services/listenbrainz_service.h"

namespace scrobble_services {

scrobble::ServiceList createBackendServices(const AppConfig& config,
                                            const std::shared_ptr<HttpTransport>& http,
                                            bool validateTokens) {
    scrobble::ServiceList services;

    if (config.lastfm.enabled) {
        if (config.lastfm.sessionKey.empty()) {
            LOG_WARN("Last.fm enabled but not authorized; run with --lastfm-auth");
        } else {
            services.push_back(std::make_shared<LastfmService>(config.lastfm, http));
            LOG_INFO("Service enabled: lastfm (session {})",
                     np_scrobbler::logging::redact(config.lastfm.sessionKey));
        }
    }

    for (const auto& lbConfig : config.listenbrainz) {
        if (!lbConfig.enabled) {
            continue;
        }
        auto lb = std::make_shared<ListenBrainzService>(lbConfig, http);

        if (validateTokens) {
            auto check = lb->validateToken();
            if (ScrobbleEngine::isAuthError(check.code)) {
                LOG_ERROR("[{}] token rejected, service disabled: {}", lb->id(), check.message);
                continue;
            }
            if (!check.ok()) {
                LOG_WARN("[{}] could not validate token ({}), keeping service", lb->id(),
                         check.message);
            }
        }

        LOG_INFO("Service enabled: {} ({})", lb->id(), lbConfig.apiUrl);
        services.push_back(std::move(lb));
    }

    if (services.empty()) {
        LOG_WARN("No scrobbling services active");
    }
    return services;
}

}  // namespace scrobble_services
