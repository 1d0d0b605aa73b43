#pragma once

#include "daemon/metrics/status_tracker.h"

#include <nlohmann/json.hpp>
#include <string>

namespace daemon_metrics {

// Status JSON mirrored to disk for tray applets and scripts. Rewritten only
// when the content changes.
class StatusFile {
   public:
    explicit StatusFile(std::string path);

    StatusFile(const StatusFile&) = delete;
    StatusFile& operator=(const StatusFile&) = delete;

    const std::string& path() const;
    bool enabled() const {
        return !path_.empty();
    }

    // true if written or unchanged; false on I/O error or when disabled
    bool update(const StatusSnapshot& status);

    void removeIfExists() const;
    bool writeJsonAtomically(const nlohmann::json& payload) const;

   private:
    std::string path_;
    std::string lastWritten_;
};

}  // namespace daemon_metrics
