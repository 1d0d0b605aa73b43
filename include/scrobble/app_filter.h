/**
 * @file app_filter.h
 * @brief Per-application allow/ignore decisions for the now-playing source
 */

#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace scrobble {

enum class AppFilterAction { Allow, Ignore, AskUser };

const char* appFilterActionToString(AppFilterAction action);

struct AppFilterConfig {
    bool promptForNewApps = true;
    bool scrobbleUnknown = true;
    std::vector<std::string> allowedApps;
    std::vector<std::string> ignoredApps;
};

/**
 * @brief Classify a source application.
 *
 * Order: absent/empty id -> scrobbleUnknown; allowed list; ignored list;
 * otherwise AskUser when prompting is enabled, else Allow.
 */
AppFilterAction classify(const std::optional<std::string>& appId, const AppFilterConfig& config);

/**
 * @brief Reject configs that list the same app as allowed and ignored
 *
 * @param error Set to a message naming the first conflicting app
 * @return true if the lists are disjoint
 */
bool validateAppFilterConfig(const AppFilterConfig& config, std::string& error);

/**
 * @brief AppFilterConfig shared between the poll loop and the control plane.
 *
 * classify() holds a shared lock; recordDecision() holds the exclusive lock
 * only for the in-place list update. Neither is ever held across I/O.
 */
class SharedAppFilter {
   public:
    SharedAppFilter() = default;
    explicit SharedAppFilter(AppFilterConfig config);

    AppFilterAction classify(const std::optional<std::string>& appId) const;

    /**
     * @brief Persist a user choice in memory
     *
     * Adds appId to the chosen list and removes it from the other one.
     * Only Allow and Ignore are accepted.
     *
     * @return false if appId is empty or decision is AskUser
     */
    bool recordDecision(const std::string& appId, AppFilterAction decision);

    void replace(AppFilterConfig config);
    AppFilterConfig snapshot() const;

   private:
    mutable std::shared_mutex mutex_;
    AppFilterConfig config_;
};

}  // namespace scrobble
