#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "core/daemon_constants.h"
#include "scrobble/app_filter.h"
#include "scrobble/text_normalizer.h"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct LastfmConfig {
    bool enabled = false;
    std::string apiKey;
    std::string apiSecret;
    std::string sessionKey;  // Filled by the --lastfm-auth flow
    std::string apiUrl = DaemonConstants::LASTFM_API_URL;
};

struct ListenBrainzConfig {
    bool enabled = false;
    std::string name = DaemonConstants::DEFAULT_LISTENBRAINZ_NAME;
    std::string token;
    std::string apiUrl = DaemonConstants::LISTENBRAINZ_API_URL;
};

struct RetryConfig {
    int nowPlayingBudgetMs = DaemonConstants::NOW_PLAYING_RETRY_BUDGET_MS;
    int scrobbleBudgetMs = DaemonConstants::SCROBBLE_RETRY_BUDGET_MS;
    int baseDelayMs = DaemonConstants::RETRY_BASE_DELAY_MS;
    double multiplier = DaemonConstants::RETRY_MULTIPLIER;
};

struct ControlConfig {
    bool enabled = true;
    std::string endpoint = DaemonConstants::ZEROMQ_IPC_PATH;
};

struct AppConfig {
    int refreshIntervalSec = DaemonConstants::DEFAULT_REFRESH_INTERVAL_SEC;
    int scrobbleThreshold = DaemonConstants::DEFAULT_SCROBBLE_THRESHOLD_PERCENT;  // Percent
    scrobble::CleanupConfig cleanup;
    scrobble::AppFilterConfig appFiltering;
    LastfmConfig lastfm;
    std::vector<ListenBrainzConfig> listenbrainz{ListenBrainzConfig{}};
    RetryConfig retry;
    ControlConfig control;
    std::string statusFile;  // Empty = no status file
    int httpTimeoutMs = DaemonConstants::DEFAULT_HTTP_TIMEOUT_MS;
};

/**
 * @brief Default config path: $XDG_CONFIG_HOME/np_scrobbler/config.json,
 *        falling back to ~/.config/np_scrobbler/config.json
 */
std::filesystem::path defaultConfigPath();

/**
 * @brief Load and validate the config file
 *
 * A missing file is created with defaults when createIfMissing is set.
 * Malformed JSON or a config that fails validateAppConfig() is rejected and
 * outConfig keeps the defaults.
 *
 * @param error Reason for failure
 * @return true on success
 */
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   std::string& error, bool createIfMissing = true);

/**
 * @brief Parse a config document (no validation)
 */
bool parseAppConfig(const nlohmann::json& j, AppConfig& outConfig, std::string& error);

/**
 * @brief Check semantic constraints
 *
 * Errors: refreshInterval <= 0, threshold outside [1,100], enabled Last.fm
 * without key/secret, enabled ListenBrainz without token/apiUrl, app present
 * in both filter lists.
 *
 * @param warnings Optional sink for non-fatal findings (no service enabled,
 *                 Last.fm not yet authorized)
 */
bool validateAppConfig(const AppConfig& config, std::string& error,
                       std::vector<std::string>* warnings = nullptr);

nlohmann::json appConfigToJson(const AppConfig& config);

/**
 * @brief Write config atomically (temp file + rename)
 *
 * Sections this loader does not own (e.g. "logging") are preserved from the
 * existing file.
 */
bool saveAppConfig(const std::filesystem::path& configPath, const AppConfig& config,
                   std::string& error);

#endif  // CONFIG_LOADER_H
