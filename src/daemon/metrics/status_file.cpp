#include "daemon/metrics/status_file.h"

#include "logging/logger.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace daemon_metrics {

StatusFile::StatusFile(std::string path) : path_(std::move(path)) {}

const std::string& StatusFile::path() const {
    return path_;
}

bool StatusFile::update(const StatusSnapshot& status) {
    if (path_.empty()) {
        return false;
    }

    nlohmann::json payload = statusToJson(status);
    // last_poll changes every tick; compare without it
    nlohmann::json comparable = payload;
    comparable.erase("last_poll");
    std::string fingerprint = comparable.dump();
    if (fingerprint == lastWritten_) {
        return true;
    }

    if (!writeJsonAtomically(payload)) {
        LOG_EVERY_N(WARN, 20, "Cannot write status file {}", path_);
        return false;
    }
    lastWritten_ = std::move(fingerprint);
    return true;
}

void StatusFile::removeIfExists() const {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

bool StatusFile::writeJsonAtomically(const nlohmann::json& payload) const {
    if (path_.empty()) {
        return false;
    }

    std::string tmpPath = path_ + ".tmp";
    {
        std::ofstream ofs(tmpPath);
        if (!ofs) {
            return false;
        }
        ofs << payload.dump(2) << '\n';
        if (!ofs.good()) {
            return false;
        }
    }
    return (std::rename(tmpPath.c_str(), path_.c_str()) == 0);
}

}  // namespace daemon_metrics
