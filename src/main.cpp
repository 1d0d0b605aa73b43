#include "core/config_loader.h"
#include "daemon/app/app.h"
#include "daemon/app/cli_options.h"
#include "daemon/core/pid_lock.h"
#include "graceful_shutdown.h"
#include "logging/logger.h"
#include "services/http_client.h"
#include "services/lastfm_auth.h"

#include <chrono>
#include <iostream>
#include <string>

namespace {

int runLastfmAuthorization(const std::filesystem::path& configPath, AppConfig& config) {
    auto http = std::make_shared<scrobble_services::CurlHttpClient>(
        std::chrono::milliseconds(config.httpTimeoutMs));
    std::string error;
    if (!scrobble_services::runLastfmAuth(configPath, config, http, std::cin, std::cout, error)) {
        LOG_ERROR("Last.fm authorization failed: {}", error);
        return 1;
    }
    return 0;
}

int runOnce(const daemon_app::AppOptions& options, const AppConfig& config) {
    daemon_app::AppOptions onceOptions = options;
    onceOptions.enableControl = false;

    daemon_app::App app(onceOptions, config, daemon_app::AppDependencies{});
    std::string error;
    if (!app.initialize(error)) {
        LOG_ERROR("Startup failed: {}", error);
        return 1;
    }

    app.tick(scrobble::Clock::now());
    auto budget = std::chrono::milliseconds(config.retry.nowPlayingBudgetMs +
                                            config.retry.scrobbleBudgetMs);
    if (!app.waitForDeliveries(budget)) {
        LOG_WARN("Deliveries still pending after {} ms", budget.count());
    }

    auto status = daemon_metrics::statusToJson(app.status().snapshot());
    app.shutdown();
    std::cout << status.dump(2) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    np_scrobbler::logging::initializeEarly();

    daemon_app::CliOptions cli;
    std::string error;
    if (!daemon_app::applyEnvOverrides(cli, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }
    bool showHelp = false;
    if (!daemon_app::parseArgs(argc, argv, cli, showHelp, error)) {
        if (showHelp) {
            daemon_app::printHelp(argv[0]);
            return 0;
        }
        std::cerr << "Error: " << error << std::endl;
        daemon_app::printHelp(argv[0]);
        return 1;
    }

    std::filesystem::path configPath =
        cli.configPath.empty() ? defaultConfigPath() : std::filesystem::path(cli.configPath);

    scrobble_services::CurlGlobal curl;
    if (!curl.ok()) {
        LOG_CRITICAL("libcurl initialization failed");
        return 1;
    }

    AppConfig config;
    if (!loadAppConfig(configPath, config, error)) {
        LOG_ERROR("Config {}: {}", configPath.string(), error);
        return 1;
    }
    np_scrobbler::logging::initializeFromConfig(configPath.string(), cli.logLevel);

    if (cli.lastfmAuth) {
        return runLastfmAuthorization(configPath, config);
    }

    daemon_app::AppOptions options;
    options.configPath = configPath;
    options.logLevelOverride = cli.logLevel;
    options.enableControl = !cli.disableControl;

    if (cli.once) {
        return runOnce(options, config);
    }

    std::string pidPath = cli.pidFile.empty() ? daemon_core::defaultPidFilePath() : cli.pidFile;
    auto pidLock = daemon_core::PidLock::tryAcquire(pidPath, error);
    if (!pidLock) {
        LOG_ERROR("{}", error);
        return 1;
    }

    if (!GracefulShutdown::installSignalHandlers()) {
        LOG_ERROR("Cannot install signal handlers");
        return 1;
    }
    GracefulShutdown::Controller controller;
    controller.setSignalState(&GracefulShutdown::getGlobalSignalState());
    controller.setShutdownCallback([]() { LOG_INFO("Stopping scrobbler"); });

    daemon_app::App app(options, config, daemon_app::AppDependencies{});
    if (!app.initialize(error)) {
        LOG_ERROR("Startup failed: {}", error);
        return 1;
    }

    int rc = app.run(controller);
    np_scrobbler::logging::shutdown();
    return rc;
}
