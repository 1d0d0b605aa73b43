/**
 * @file lastfm_auth.h
 * @brief Desktop authorization flow that obtains a Last.fm session key
 *
 * auth.getToken -> user approves the token in a browser -> auth.getSession.
 * Driven from the command line with --lastfm-auth.
 */

#pragma once

#include "core/config_loader.h"
#include "services/lastfm_service.h"

#include <filesystem>
#include <iosfwd>
#include <string>

namespace scrobble_services {

struct LastfmSession {
    std::string username;
    std::string key;
};

class LastfmAuthFlow {
   public:
    explicit LastfmAuthFlow(LastfmService& service);

    scrobble::ServiceResult requestToken(std::string& token);
    scrobble::ServiceResult fetchSession(const std::string& token, LastfmSession& session);

    static std::string authorizationUrl(const std::string& apiKey, const std::string& token);

   private:
    LastfmService& service_;
};

/**
 * @brief Interactive flow: prints the URL, waits for Enter on in, saves the key
 *
 * On success config.lastfm.sessionKey is set, Last.fm is enabled and the
 * config is written to configPath.
 *
 * @return false with error set on any failure
 */
bool runLastfmAuth(const std::filesystem::path& configPath, AppConfig& config,
                   std::shared_ptr<HttpTransport> http, std::istream& in, std::ostream& out,
                   std::string& error);

}  // namespace scrobble_services
