#include "core/config_loader.h"

#include "logging/logger.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <system_error>

namespace {

void readStringList(const nlohmann::json& j, const char* key, std::vector<std::string>& out) {
    if (!j.contains(key)) {
        return;
    }
    out = j[key].get<std::vector<std::string>>();
}

void parseCleanup(const nlohmann::json& j, scrobble::CleanupConfig& cleanup) {
    if (j.contains("enabled")) {
        cleanup.enabled = j["enabled"].get<bool>();
    }
    readStringList(j, "patterns", cleanup.patterns);
}

void parseAppFiltering(const nlohmann::json& j, scrobble::AppFilterConfig& filter) {
    if (j.contains("promptForNewApps")) {
        filter.promptForNewApps = j["promptForNewApps"].get<bool>();
    }
    if (j.contains("scrobbleUnknown")) {
        filter.scrobbleUnknown = j["scrobbleUnknown"].get<bool>();
    }
    readStringList(j, "allowedApps", filter.allowedApps);
    readStringList(j, "ignoredApps", filter.ignoredApps);
}

void parseLastfm(const nlohmann::json& j, LastfmConfig& lastfm) {
    if (j.contains("enabled")) {
        lastfm.enabled = j["enabled"].get<bool>();
    }
    if (j.contains("apiKey")) {
        lastfm.apiKey = j["apiKey"].get<std::string>();
    }
    if (j.contains("apiSecret")) {
        lastfm.apiSecret = j["apiSecret"].get<std::string>();
    }
    if (j.contains("sessionKey")) {
        lastfm.sessionKey = j["sessionKey"].get<std::string>();
    }
    if (j.contains("apiUrl")) {
        lastfm.apiUrl = j["apiUrl"].get<std::string>();
    }
}

ListenBrainzConfig parseListenBrainzEntry(const nlohmann::json& j) {
    ListenBrainzConfig lb;
    if (j.contains("enabled")) {
        lb.enabled = j["enabled"].get<bool>();
    }
    if (j.contains("name")) {
        lb.name = j["name"].get<std::string>();
    }
    if (j.contains("token")) {
        lb.token = j["token"].get<std::string>();
    }
    if (j.contains("apiUrl")) {
        lb.apiUrl = j["apiUrl"].get<std::string>();
    }
    return lb;
}

void parseRetry(const nlohmann::json& j, RetryConfig& retry) {
    if (j.contains("nowPlayingBudgetMs")) {
        retry.nowPlayingBudgetMs = j["nowPlayingBudgetMs"].get<int>();
    }
    if (j.contains("scrobbleBudgetMs")) {
        retry.scrobbleBudgetMs = j["scrobbleBudgetMs"].get<int>();
    }
    if (j.contains("baseDelayMs")) {
        retry.baseDelayMs = j["baseDelayMs"].get<int>();
    }
    if (j.contains("multiplier")) {
        retry.multiplier = j["multiplier"].get<double>();
    }
}

}  // namespace

std::filesystem::path defaultConfigPath() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".config";
    } else {
        base = ".";
    }
    return base / DaemonConstants::CONFIG_DIR_NAME / DaemonConstants::CONFIG_FILE_NAME;
}

bool parseAppConfig(const nlohmann::json& j, AppConfig& outConfig, std::string& error) {
    if (!j.is_object()) {
        error = "config root must be a JSON object";
        return false;
    }

    try {
        if (j.contains("refreshInterval")) {
            outConfig.refreshIntervalSec = j["refreshInterval"].get<int>();
        }
        if (j.contains("scrobbleThreshold")) {
            outConfig.scrobbleThreshold = j["scrobbleThreshold"].get<int>();
        }
        if (j.contains("cleanup") && j["cleanup"].is_object()) {
            parseCleanup(j["cleanup"], outConfig.cleanup);
        }
        if (j.contains("appFiltering") && j["appFiltering"].is_object()) {
            parseAppFiltering(j["appFiltering"], outConfig.appFiltering);
        }
        if (j.contains("lastfm") && j["lastfm"].is_object()) {
            parseLastfm(j["lastfm"], outConfig.lastfm);
        }
        if (j.contains("listenbrainz")) {
            const auto& lbSection = j["listenbrainz"];
            outConfig.listenbrainz.clear();
            if (lbSection.is_array()) {
                for (const auto& entry : lbSection) {
                    outConfig.listenbrainz.push_back(parseListenBrainzEntry(entry));
                }
            } else if (lbSection.is_object()) {
                // Single-account shorthand
                outConfig.listenbrainz.push_back(parseListenBrainzEntry(lbSection));
            } else {
                error = "listenbrainz must be an array or an object";
                return false;
            }
        }
        if (j.contains("retry") && j["retry"].is_object()) {
            parseRetry(j["retry"], outConfig.retry);
        }
        if (j.contains("control") && j["control"].is_object()) {
            const auto& control = j["control"];
            if (control.contains("enabled")) {
                outConfig.control.enabled = control["enabled"].get<bool>();
            }
            if (control.contains("endpoint")) {
                outConfig.control.endpoint = control["endpoint"].get<std::string>();
            }
        }
        if (j.contains("statusFile")) {
            outConfig.statusFile = j["statusFile"].get<std::string>();
        }
        if (j.contains("httpTimeoutMs")) {
            outConfig.httpTimeoutMs = j["httpTimeoutMs"].get<int>();
        }
    } catch (const nlohmann::json::exception& e) {
        error = std::string("invalid config value: ") + e.what();
        return false;
    }
    return true;
}

bool validateAppConfig(const AppConfig& config, std::string& error,
                       std::vector<std::string>* warnings) {
    if (config.refreshIntervalSec <= 0) {
        error = "refreshInterval must be greater than 0";
        return false;
    }
    if (config.scrobbleThreshold < DaemonConstants::MIN_SCROBBLE_THRESHOLD_PERCENT ||
        config.scrobbleThreshold > DaemonConstants::MAX_SCROBBLE_THRESHOLD_PERCENT) {
        error = "scrobbleThreshold must be between 1 and 100";
        return false;
    }
    if (config.httpTimeoutMs <= 0) {
        error = "httpTimeoutMs must be greater than 0";
        return false;
    }
    if (config.retry.baseDelayMs <= 0 || config.retry.multiplier < 1.0 ||
        config.retry.nowPlayingBudgetMs < 0 || config.retry.scrobbleBudgetMs < 0) {
        error = "retry settings out of range";
        return false;
    }

    bool anyEnabled = false;
    if (config.lastfm.enabled) {
        anyEnabled = true;
        if (config.lastfm.apiKey.empty() || config.lastfm.apiSecret.empty()) {
            error = "Last.fm is enabled but apiKey or apiSecret is empty";
            return false;
        }
        if (config.lastfm.sessionKey.empty() && warnings) {
            warnings->push_back("Last.fm is enabled but not authorized (run --lastfm-auth)");
        }
    }

    for (const auto& lb : config.listenbrainz) {
        if (!lb.enabled) {
            continue;
        }
        anyEnabled = true;
        if (lb.token.empty()) {
            error = "ListenBrainz '" + lb.name + "' is enabled but token is empty";
            return false;
        }
        if (lb.apiUrl.empty()) {
            error = "ListenBrainz '" + lb.name + "' is enabled but apiUrl is empty";
            return false;
        }
    }

    if (!anyEnabled && warnings) {
        warnings->push_back("No scrobbling service is enabled");
    }

    return scrobble::validateAppFilterConfig(config.appFiltering, error);
}

nlohmann::json appConfigToJson(const AppConfig& config) {
    nlohmann::json j;
    j["refreshInterval"] = config.refreshIntervalSec;
    j["scrobbleThreshold"] = config.scrobbleThreshold;
    j["cleanup"] = {{"enabled", config.cleanup.enabled}, {"patterns", config.cleanup.patterns}};
    j["appFiltering"] = {{"promptForNewApps", config.appFiltering.promptForNewApps},
                         {"scrobbleUnknown", config.appFiltering.scrobbleUnknown},
                         {"allowedApps", config.appFiltering.allowedApps},
                         {"ignoredApps", config.appFiltering.ignoredApps}};
    j["lastfm"] = {{"enabled", config.lastfm.enabled},
                   {"apiKey", config.lastfm.apiKey},
                   {"apiSecret", config.lastfm.apiSecret},
                   {"sessionKey", config.lastfm.sessionKey},
                   {"apiUrl", config.lastfm.apiUrl}};

    nlohmann::json lbArray = nlohmann::json::array();
    for (const auto& lb : config.listenbrainz) {
        lbArray.push_back({{"enabled", lb.enabled},
                           {"name", lb.name},
                           {"token", lb.token},
                           {"apiUrl", lb.apiUrl}});
    }
    j["listenbrainz"] = lbArray;

    j["retry"] = {{"nowPlayingBudgetMs", config.retry.nowPlayingBudgetMs},
                  {"scrobbleBudgetMs", config.retry.scrobbleBudgetMs},
                  {"baseDelayMs", config.retry.baseDelayMs},
                  {"multiplier", config.retry.multiplier}};
    j["control"] = {{"enabled", config.control.enabled}, {"endpoint", config.control.endpoint}};
    j["statusFile"] = config.statusFile;
    j["httpTimeoutMs"] = config.httpTimeoutMs;
    return j;
}

bool saveAppConfig(const std::filesystem::path& configPath, const AppConfig& config,
                   std::string& error) {
    nlohmann::json document = nlohmann::json::object();

    // Keep sections owned by other components (logging)
    {
        std::ifstream existing(configPath);
        if (existing.is_open()) {
            try {
                existing >> document;
            } catch (const nlohmann::json::exception& e) {
                LOG_WARN("Config: overwriting unparseable {}: {}", configPath.string(), e.what());
                document = nlohmann::json::object();
            }
            if (!document.is_object()) {
                document = nlohmann::json::object();
            }
        }
    }
    document.update(appConfigToJson(config));
    if (!document.contains("logging")) {
        document["logging"] = {{"level", "info"}, {"filePath", ""}};
    }

    std::error_code ec;
    if (configPath.has_parent_path()) {
        std::filesystem::create_directories(configPath.parent_path(), ec);
        if (ec) {
            error = "cannot create " + configPath.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    const std::string target = configPath.string();
    const std::string tmpPath = target + ".tmp";
    {
        std::ofstream ofs(tmpPath);
        if (!ofs) {
            error = "cannot write " + tmpPath;
            return false;
        }
        ofs << document.dump(2) << '\n';
        if (!ofs.good()) {
            error = "write failed for " + tmpPath;
            return false;
        }
    }
    if (std::rename(tmpPath.c_str(), target.c_str()) != 0) {
        std::filesystem::remove(tmpPath, ec);
        error = "cannot replace " + target;
        return false;
    }
    return true;
}

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   std::string& error, bool createIfMissing) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (!createIfMissing) {
            error = "config file not found: " + configPath.string();
            return false;
        }
        LOG_INFO("Config: {} not found, writing defaults", configPath.string());
        if (!saveAppConfig(configPath, outConfig, error)) {
            return false;
        }
        return true;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        error = "failed to parse " + configPath.string() + ": " + e.what();
        return false;
    }

    AppConfig parsed;
    if (!parseAppConfig(j, parsed, error)) {
        return false;
    }

    std::vector<std::string> warnings;
    if (!validateAppConfig(parsed, error, &warnings)) {
        return false;
    }
    for (const auto& warning : warnings) {
        LOG_WARN("Config: {}", warning);
    }

    outConfig = std::move(parsed);
    LOG_DEBUG("Config: loaded {} (refresh={}s, threshold={}%)", configPath.string(),
              outConfig.refreshIntervalSec, outConfig.scrobbleThreshold);
    return true;
}
