#include "services/lastfm_auth.h"

#include "core/daemon_constants.h"
#include "logging/logger.h"

#include <istream>
#include <ostream>

namespace scrobble_services {

using scrobble::ServiceResult;
using ScrobbleEngine::ErrorCode;

LastfmAuthFlow::LastfmAuthFlow(LastfmService& service) : service_(service) {}

ServiceResult LastfmAuthFlow::requestToken(std::string& token) {
    nlohmann::json response;
    auto result = service_.callMethod("auth.getToken", {}, response);
    if (!result.ok()) {
        return result;
    }
    if (!response.contains("token") || !response["token"].is_string()) {
        return ServiceResult::failure(ErrorCode::SERVICE_BAD_RESPONSE, "no token in response");
    }
    token = response["token"].get<std::string>();
    return result;
}

ServiceResult LastfmAuthFlow::fetchSession(const std::string& token, LastfmSession& session) {
    nlohmann::json response;
    auto result = service_.callMethod("auth.getSession", {{"token", token}}, response);
    if (!result.ok()) {
        return result;
    }

    if (!response.contains("session") || !response["session"].is_object()) {
        return ServiceResult::failure(ErrorCode::SERVICE_BAD_RESPONSE, "no session in response");
    }
    const auto& s = response["session"];
    session.key = s.value("key", std::string());
    session.username = s.value("name", std::string());
    if (session.key.empty()) {
        return ServiceResult::failure(ErrorCode::SERVICE_BAD_RESPONSE, "empty session key");
    }
    return result;
}

std::string LastfmAuthFlow::authorizationUrl(const std::string& apiKey, const std::string& token) {
    return std::string(DaemonConstants::LASTFM_AUTH_URL) + "?api_key=" + apiKey +
           "&token=" + token;
}

bool runLastfmAuth(const std::filesystem::path& configPath, AppConfig& config,
                   std::shared_ptr<HttpTransport> http, std::istream& in, std::ostream& out,
                   std::string& error) {
    if (config.lastfm.apiKey.empty() || config.lastfm.apiSecret.empty()) {
        error = "lastfm.apiKey and lastfm.apiSecret must be set in " + configPath.string();
        return false;
    }

    LastfmService service(config.lastfm, std::move(http));
    LastfmAuthFlow flow(service);

    std::string token;
    auto result = flow.requestToken(token);
    if (!result.ok()) {
        error = "auth.getToken failed: " + result.message;
        return false;
    }

    out << "Open this URL in a browser and allow access:\n"
        << "  " << LastfmAuthFlow::authorizationUrl(config.lastfm.apiKey, token) << "\n"
        << "Press Enter when done..." << std::endl;
    std::string line;
    std::getline(in, line);

    LastfmSession session;
    result = flow.fetchSession(token, session);
    if (!result.ok()) {
        error = "auth.getSession failed: " + result.message;
        return false;
    }

    config.lastfm.sessionKey = session.key;
    config.lastfm.enabled = true;
    if (!saveAppConfig(configPath, config, error)) {
        return false;
    }

    LOG_INFO("Last.fm authorized as '{}' (session {})", session.username,
             np_scrobbler::logging::redact(session.key));
    out << "Authorized as " << session.username << std::endl;
    return true;
}

}  // namespace scrobble_services
