/**
 * @file logger.h
 * @brief Structured logging API for the np_scrobbler daemon
 *
 * Thin wrapper around one process-wide spdlog logger with console and
 * rotating-file sinks. Call sites use the LOG_* macros below.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

// Forward declare spdlog logger
namespace spdlog {
class logger;
}  // namespace spdlog

namespace np_scrobbler {
namespace logging {

enum class LogLevel : std::uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * @brief Logging configuration ("logging" section of config.json)
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath = "";                                   // Empty = no file output
    size_t maxFileSize = static_cast<size_t>(10 * 1024 * 1024);  // 10 MB
    size_t maxBackups = 5;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

/**
 * @brief Initialize (or reconfigure) the logging system
 *
 * A second call after a successful initialization rebuilds the sinks so a
 * config reload can move the log file or change the level.
 *
 * @return true if initialization succeeded, false otherwise
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Early initialization with stderr output only
 *
 * Used before the config file has been located and parsed.
 */
bool initializeEarly();

/**
 * @brief Initialize logging from the JSON config file
 *
 * Reads the "logging" section. A missing file or section means defaults.
 *
 * @param configPath Path to JSON config file
 * @param levelOverride Non-empty value replaces the configured level (CLI/env)
 */
bool initializeFromConfig(const std::string& configPath, std::string_view levelOverride = {});

/**
 * @brief Flush pending messages and drop the logger
 */
void shutdown();

void setLevel(LogLevel level);
LogLevel getLevel();
void flush();

/**
 * @brief Get the underlying spdlog logger (lazily initialized)
 */
std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

/**
 * @brief Convert string to LogLevel
 *
 * @param str Level name (case-insensitive)
 * @return Corresponding LogLevel, defaults to Info if unknown
 */
LogLevel stringToLevel(std::string_view str);

/**
 * @brief Check whether a string names a log level
 */
bool isValidLevelName(std::string_view str);

/**
 * @brief Mask a credential for log output ("abcd****")
 *
 * Keeps at most the first four characters; empty input gives "<empty>".
 */
std::string redact(std::string_view secret);

}  // namespace logging
}  // namespace np_scrobbler

#include <spdlog/spdlog.h>

#define LOG_TRACE(...)                                    \
    do {                                                  \
        auto logger = np_scrobbler::logging::getLogger(); \
        if (logger)                                       \
            SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__);     \
    } while (0)

#define LOG_DEBUG(...)                                    \
    do {                                                  \
        auto logger = np_scrobbler::logging::getLogger(); \
        if (logger)                                       \
            SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__);     \
    } while (0)

#define LOG_INFO(...)                                     \
    do {                                                  \
        auto logger = np_scrobbler::logging::getLogger(); \
        if (logger)                                       \
            SPDLOG_LOGGER_INFO(logger, __VA_ARGS__);      \
    } while (0)

#define LOG_WARN(...)                                     \
    do {                                                  \
        auto logger = np_scrobbler::logging::getLogger(); \
        if (logger)                                       \
            SPDLOG_LOGGER_WARN(logger, __VA_ARGS__);      \
    } while (0)

#define LOG_ERROR(...)                                    \
    do {                                                  \
        auto logger = np_scrobbler::logging::getLogger(); \
        if (logger)                                       \
            SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__);     \
    } while (0)

#define LOG_CRITICAL(...)                                 \
    do {                                                  \
        auto logger = np_scrobbler::logging::getLogger(); \
        if (logger)                                       \
            SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__);  \
    } while (0)

/**
 * @brief Log if condition is true
 */
#define LOG_IF(level, condition, ...) \
    do {                              \
        if (condition)                \
            LOG_##level(__VA_ARGS__); \
    } while (0)

/**
 * @brief Log every N occurrences (rate limit for the poll loop)
 */
#define LOG_EVERY_N(level, n, ...)                            \
    do {                                                      \
        static std::atomic<uint64_t> log_count_##__LINE__{0}; \
        if (log_count_##__LINE__.fetch_add(1) % (n) == 0) {   \
            LOG_##level(__VA_ARGS__);                         \
        }                                                     \
    } while (0)

/**
 * @brief Log at most once per call site
 */
#define LOG_ONCE(level, ...)                                             \
    do {                                                                 \
        static std::atomic<bool> logged_##__LINE__{false};               \
        bool expected = false;                                           \
        if (logged_##__LINE__.compare_exchange_strong(expected, true)) { \
            LOG_##level(__VA_ARGS__);                                    \
        }                                                                \
    } while (0)
