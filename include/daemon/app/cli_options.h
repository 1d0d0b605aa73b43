#pragma once

#include <string>

namespace daemon_app {

struct CliOptions {
    std::string configPath;  // Empty = defaultConfigPath()
    std::string logLevel;    // Empty = value from config
    std::string pidFile;     // Empty = defaultPidFilePath()
    bool lastfmAuth = false;
    bool once = false;
    bool disableControl = false;
};

// NP_SCROBBLER_CONFIG, NP_SCROBBLER_LOG_LEVEL, NP_SCROBBLER_PID_FILE,
// NP_SCROBBLER_DISABLE_CONTROL. Command line arguments parsed afterwards win.
bool applyEnvOverrides(CliOptions& options, std::string& error);

// showHelp=true means help was requested (return value false, error empty).
bool parseArgs(int argc, char** argv, CliOptions& options, bool& showHelp, std::string& error);

void printHelp(const char* exeName);

}  // namespace daemon_app
