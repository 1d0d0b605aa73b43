/**
 * @file logger.cpp
 * @brief spdlog-backed implementation of np_scrobbler::logging
 */

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace np_scrobbler {
namespace logging {

namespace {

constexpr const char* kLoggerName = "np_scrobbler";

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;
std::atomic<bool> g_initialized{false};

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    default:
        return spdlog::level::info;
    }
}

LogLevel fromSpdlogLevel(spdlog::level::level_enum level) {
    switch (level) {
    case spdlog::level::trace:
        return LogLevel::Trace;
    case spdlog::level::debug:
        return LogLevel::Debug;
    case spdlog::level::info:
        return LogLevel::Info;
    case spdlog::level::warn:
        return LogLevel::Warn;
    case spdlog::level::err:
        return LogLevel::Error;
    case spdlog::level::critical:
        return LogLevel::Critical;
    case spdlog::level::off:
        return LogLevel::Off;
    default:
        return LogLevel::Info;
    }
}

std::string toLower(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lower;
}

// Caller holds g_init_mutex
bool installLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel level,
                   const std::string& pattern) {
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(toSpdlogLevel(level));
    logger->set_pattern(pattern);
    logger->flush_on(spdlog::level::warn);

    if (g_logger) {
        g_logger->flush();
        spdlog::drop(kLoggerName);
    }
    g_logger = logger;
    spdlog::set_default_logger(g_logger);
    g_initialized.store(true, std::memory_order_release);
    return true;
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.consoleOutput) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            if (!config.coloredOutput) {
                console_sink->set_color_mode(spdlog::color_mode::never);
            }
            sinks.push_back(console_sink);
        }

        if (!config.filePath.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxBackups));
        }

        installLogger(std::move(sinks), config.level, config.pattern);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }

    SPDLOG_LOGGER_DEBUG(g_logger, "Logging initialized (level={})", levelToString(config.level));
    if (!config.filePath.empty()) {
        SPDLOG_LOGGER_INFO(g_logger, "Log file: {} (max {}MB x {} backups)", config.filePath,
                           config.maxFileSize / (1024 * 1024), config.maxBackups);
    }
    return true;
}

bool initializeEarly() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_initialized.load(std::memory_order_acquire)) {
        return true;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks{
            std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
        return installLogger(std::move(sinks), LogLevel::Info, LogConfig{}.pattern);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Early logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

bool initializeFromConfig(const std::string& configPath, std::string_view levelOverride) {
    LogConfig config;

    try {
        std::ifstream file(configPath);
        if (file.is_open()) {
            nlohmann::json json;
            file >> json;

            if (json.contains("logging") && json["logging"].is_object()) {
                const auto& logSection = json["logging"];

                if (logSection.contains("level")) {
                    config.level = stringToLevel(logSection["level"].get<std::string>());
                }
                if (logSection.contains("filePath")) {
                    config.filePath = logSection["filePath"].get<std::string>();
                }
                if (logSection.contains("maxFileSize")) {
                    config.maxFileSize = logSection["maxFileSize"].get<size_t>();
                }
                if (logSection.contains("maxBackups")) {
                    config.maxBackups = logSection["maxBackups"].get<size_t>();
                }
                if (logSection.contains("consoleOutput")) {
                    config.consoleOutput = logSection["consoleOutput"].get<bool>();
                }
                if (logSection.contains("coloredOutput")) {
                    config.coloredOutput = logSection["coloredOutput"].get<bool>();
                }
                if (logSection.contains("pattern")) {
                    config.pattern = logSection["pattern"].get<std::string>();
                }
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "Failed to parse logging config: " << ex.what() << std::endl;
    }

    if (!levelOverride.empty()) {
        config.level = stringToLevel(levelOverride);
    }

    return initialize(config);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_logger) {
        SPDLOG_LOGGER_INFO(g_logger, "Logging shutdown");
        g_logger->flush();
    }

    g_initialized.store(false, std::memory_order_release);
    spdlog::shutdown();
    g_logger.reset();
}

void setLevel(LogLevel level) {
    if (g_logger) {
        g_logger->set_level(toSpdlogLevel(level));
        LOG_INFO("Log level changed to {}", levelToString(level));
    }
}

LogLevel getLevel() {
    if (g_logger) {
        return fromSpdlogLevel(g_logger->level());
    }
    return LogLevel::Info;
}

void flush() {
    if (g_logger) {
        g_logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (g_initialized.load(std::memory_order_acquire)) {
        return g_logger;
    }
    initializeEarly();
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Critical:
        return "critical";
    case LogLevel::Off:
        return "off";
    default:
        return "info";
    }
}

LogLevel stringToLevel(std::string_view str) {
    const std::string lower = toLower(str);

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error" || lower == "err")
        return LogLevel::Error;
    if (lower == "critical" || lower == "fatal")
        return LogLevel::Critical;
    if (lower == "off" || lower == "none")
        return LogLevel::Off;

    return LogLevel::Info;
}

bool isValidLevelName(std::string_view str) {
    static const char* const kNames[] = {"trace", "debug",    "info",  "warn", "warning", "error",
                                         "err",   "critical", "fatal", "off",  "none"};
    const std::string lower = toLower(str);
    return std::any_of(std::begin(kNames), std::end(kNames),
                       [&lower](const char* name) { return lower == name; });
}

std::string redact(std::string_view secret) {
    if (secret.empty()) {
        return "<empty>";
    }
    std::string shown(secret.substr(0, std::min<size_t>(4, secret.size())));
    return shown + "****";
}

}  // namespace logging
}  // namespace np_scrobbler
