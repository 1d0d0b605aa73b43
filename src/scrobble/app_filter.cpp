#include "scrobble/app_filter.h"

#include <algorithm>
#include <mutex>

namespace scrobble {

namespace {

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

void eraseValue(std::vector<std::string>& list, const std::string& value) {
    list.erase(std::remove(list.begin(), list.end(), value), list.end());
}

}  // namespace

const char* appFilterActionToString(AppFilterAction action) {
    switch (action) {
    case AppFilterAction::Allow:
        return "allow";
    case AppFilterAction::Ignore:
        return "ignore";
    case AppFilterAction::AskUser:
        return "ask_user";
    }
    return "unknown";
}

AppFilterAction classify(const std::optional<std::string>& appId, const AppFilterConfig& config) {
    if (!appId || appId->empty()) {
        return config.scrobbleUnknown ? AppFilterAction::Allow : AppFilterAction::Ignore;
    }
    if (contains(config.allowedApps, *appId)) {
        return AppFilterAction::Allow;
    }
    if (contains(config.ignoredApps, *appId)) {
        return AppFilterAction::Ignore;
    }
    return config.promptForNewApps ? AppFilterAction::AskUser : AppFilterAction::Allow;
}

bool validateAppFilterConfig(const AppFilterConfig& config, std::string& error) {
    for (const auto& app : config.allowedApps) {
        if (contains(config.ignoredApps, app)) {
            error = "App '" + app + "' cannot be in both allowedApps and ignoredApps";
            return false;
        }
    }
    return true;
}

SharedAppFilter::SharedAppFilter(AppFilterConfig config) : config_(std::move(config)) {}

AppFilterAction SharedAppFilter::classify(const std::optional<std::string>& appId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return scrobble::classify(appId, config_);
}

bool SharedAppFilter::recordDecision(const std::string& appId, AppFilterAction decision) {
    if (appId.empty() || decision == AppFilterAction::AskUser) {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& target = decision == AppFilterAction::Allow ? config_.allowedApps : config_.ignoredApps;
    auto& other = decision == AppFilterAction::Allow ? config_.ignoredApps : config_.allowedApps;
    eraseValue(other, appId);
    if (!contains(target, appId)) {
        target.push_back(appId);
    }
    return true;
}

void SharedAppFilter::replace(AppFilterConfig config) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    config_ = std::move(config);
}

AppFilterConfig SharedAppFilter::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return config_;
}

}  // namespace scrobble
