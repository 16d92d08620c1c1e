// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Log.h
 * @brief Thread-safe leveled logger shared by the daemon, sources and store.
 *
 * Usage:
 *   linkwatch::Logger::init({ .level = LogLevel::INFO,
 *                             .mode  = LogMode::Console });
 *
 *   LWLOG_INFO("[store] link %s %s -> %s", id, from, to);
 *
 * Levels: TRACE < DEBUG < INFO < WARN < ERROR
 * Modes : Console, File, Silent
 */

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>

namespace linkwatch {

/**
 * @brief Logging severity levels in increasing order.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4
};

/**
 * @brief Output backends supported by the logger.
 */
enum class LogMode {
    Console,  ///< Log to stderr with ANSI colours.
    File,     ///< Append to a configured file.
    Silent    ///< Discard all log messages.
};

/**
 * @brief Initial configuration passed to Logger::init().
 */
struct LoggerConfig {
    LogLevel level = LogLevel::INFO;      ///< Minimum severity to emit.
    LogMode  mode  = LogMode::Console;    ///< Output backend.
    std::string file_path{};              ///< Used when mode == File.
};

/**
 * @brief Parse "trace|debug|info|warn|error" (case-insensitive).
 */
std::optional<LogLevel> parse_log_level(const std::string& text);

/**
 * @brief Parse "console|file|silent" (case-insensitive).
 */
std::optional<LogMode> parse_log_mode(const std::string& text);

/**
 * @brief Process-wide leveled printf-style logger.
 *
 * The minimum level lives in an atomic so the macros can filter without
 * locking; emission itself is serialised by a mutex so lines from the
 * discovery, sweeper and gRPC threads never interleave.
 */
class Logger {
public:
    /**
     * @brief Initialise the backend and minimum level.
     *
     * Calling init() again reconfigures the logger. If File mode cannot open
     * its path the logger falls back to Console.
     */
    static void init(const LoggerConfig& cfg);

    static void set_level(LogLevel lvl);
    static LogLevel level();

    /**
     * @brief Emit a formatted log line (printf-style, newline appended).
     */
    static void log(LogLevel lvl, const char* fmt, ...)
        __attribute__((format(printf, 2, 3)));

private:
    static void vlog(LogLevel lvl, const char* fmt, va_list ap);
    static const char* level_str(LogLevel lvl);

    static std::mutex mtx_;            ///< Serialises writes to the backend.
    static std::atomic<int> level_;    ///< Current minimum level as an int.
    static LogMode mode_;              ///< Current output mode.
    static FILE* file_;                ///< Owned FILE* when mode == File.
};

// -----------------------------------------------------------------------------
// Convenience macros
// -----------------------------------------------------------------------------

/**
 * @brief Cheap level check so arguments are not evaluated for filtered lines.
 */
#define LWLOG_ENABLED(lvl) \
    (static_cast<int>(linkwatch::Logger::level()) <= static_cast<int>(linkwatch::LogLevel::lvl))

#define LWLOG_AT(lvl, fmt, ...) \
    do { \
        if (LWLOG_ENABLED(lvl)) { \
            linkwatch::Logger::log(linkwatch::LogLevel::lvl, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define LWLOG_TRACE(fmt, ...) LWLOG_AT(TRACE, fmt, ##__VA_ARGS__)
#define LWLOG_DEBUG(fmt, ...) LWLOG_AT(DEBUG, fmt, ##__VA_ARGS__)
#define LWLOG_INFO(fmt, ...)  LWLOG_AT(INFO, fmt, ##__VA_ARGS__)
#define LWLOG_WARN(fmt, ...)  LWLOG_AT(WARN, fmt, ##__VA_ARGS__)
#define LWLOG_ERROR(fmt, ...) LWLOG_AT(ERROR, fmt, ##__VA_ARGS__)

} // namespace linkwatch
