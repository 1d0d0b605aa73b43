#include "daemon/app/cli_options.h"

#include "logging/logger.h"

#include <cstdlib>
#include <iostream>

namespace daemon_app {

namespace {

bool parseBool(const std::string& value, bool& out) {
    if (value == "1" || value == "true" || value == "TRUE" || value == "on" || value == "yes") {
        out = true;
        return true;
    }
    if (value == "0" || value == "false" || value == "FALSE" || value == "off" || value == "no") {
        out = false;
        return true;
    }
    return false;
}

bool checkLevel(const std::string& level, const std::string& origin, std::string& error) {
    if (!np_scrobbler::logging::isValidLevelName(level)) {
        error = origin + ": unknown log level '" + level + "'";
        return false;
    }
    return true;
}

}  // namespace

bool applyEnvOverrides(CliOptions& options, std::string& error) {
    if (const char* config = std::getenv("NP_SCROBBLER_CONFIG"); config && *config) {
        options.configPath = config;
    }
    if (const char* level = std::getenv("NP_SCROBBLER_LOG_LEVEL"); level && *level) {
        if (!checkLevel(level, "NP_SCROBBLER_LOG_LEVEL", error)) {
            return false;
        }
        options.logLevel = level;
    }
    if (const char* pidFile = std::getenv("NP_SCROBBLER_PID_FILE"); pidFile && *pidFile) {
        options.pidFile = pidFile;
    }
    if (const char* disable = std::getenv("NP_SCROBBLER_DISABLE_CONTROL")) {
        bool disabled = false;
        if (!parseBool(disable, disabled)) {
            error = "NP_SCROBBLER_DISABLE_CONTROL must be true or false";
            return false;
        }
        options.disableControl = disabled;
    }
    return true;
}

void printHelp(const char* exeName) {
    std::cout << "np_scrobblerd - scrobble MPRIS playback to Last.fm and ListenBrainz\n";
    std::cout << "Usage: " << exeName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <path>     Config file (default: "
                 "$XDG_CONFIG_HOME/np_scrobbler/config.json)\n";
    std::cout << "  -l, --log-level <lvl>   trace/debug/info/warn/error (default: from config)\n";
    std::cout << "  --pid-file <path>       PID lock file\n";
    std::cout << "  --lastfm-auth           Authorize Last.fm and store the session key\n";
    std::cout << "  --once                  Poll once, print the status and exit\n";
    std::cout << "  --disable-control       Do not start the ZeroMQ control socket\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << std::endl;
}

bool parseArgs(int argc, char** argv, CliOptions& options, bool& showHelp, std::string& error) {
    showHelp = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        auto requireValue = [&](std::string& target) -> bool {
            if (i + 1 >= argc) {
                error = arg + " requires a value";
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            showHelp = true;
            return false;
        } else if (arg == "-c" || arg == "--config") {
            if (!requireValue(options.configPath)) {
                return false;
            }
        } else if (arg == "-l" || arg == "--log-level") {
            if (!requireValue(options.logLevel) ||
                !checkLevel(options.logLevel, "--log-level", error)) {
                return false;
            }
        } else if (arg == "--pid-file") {
            if (!requireValue(options.pidFile)) {
                return false;
            }
        } else if (arg == "--lastfm-auth") {
            options.lastfmAuth = true;
        } else if (arg == "--once") {
            options.once = true;
        } else if (arg == "--disable-control") {
            options.disableControl = true;
        } else {
            error = "unknown option: " + arg;
            return false;
        }
    }
    return true;
}

}  // namespace daemon_app
