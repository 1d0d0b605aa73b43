#pragma once

#include "core/config_loader.h"
#include "scrobble/dispatcher.h"
#include "services/http_client.h"

#include <memory>

namespace scrobble_services {

/**
 * @brief Instantiate every enabled backend service
 *
 * At most one Last.fm instance (skipped while it has no session key) and one
 * ListenBrainz instance per enabled entry. With validateTokens set, each
 * ListenBrainz token is checked: an invalid token drops that instance, a
 * transport failure keeps it.
 */
scrobble::ServiceList createBackendServices(const AppConfig& config,
                                            const std::shared_ptr<HttpTransport>& http,
                                            bool validateTokens);

}  // namespace scrobble_services
