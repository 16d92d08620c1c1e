// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/log/Log.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>

namespace linkwatch {

std::mutex Logger::mtx_{};
std::atomic<int> Logger::level_{static_cast<int>(LogLevel::INFO)};
LogMode Logger::mode_ = LogMode::Console;
FILE* Logger::file_ = nullptr;

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

const char* level_color(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::TRACE: return "\033[37m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
    }
    return "\033[0m";
}

} // namespace

std::optional<LogLevel> parse_log_level(const std::string& text) {
    const auto lvl = lowercase(text);
    if (lvl == "trace") return LogLevel::TRACE;
    if (lvl == "debug") return LogLevel::DEBUG;
    if (lvl == "info") return LogLevel::INFO;
    if (lvl == "warn" || lvl == "warning") return LogLevel::WARN;
    if (lvl == "error") return LogLevel::ERROR;
    return std::nullopt;
}

std::optional<LogMode> parse_log_mode(const std::string& text) {
    const auto mode = lowercase(text);
    if (mode == "console") return LogMode::Console;
    if (mode == "file") return LogMode::File;
    if (mode == "silent") return LogMode::Silent;
    return std::nullopt;
}

void Logger::init(const LoggerConfig& cfg) {
    std::lock_guard<std::mutex> lk(mtx_);

    level_.store(static_cast<int>(cfg.level), std::memory_order_relaxed);
    mode_ = cfg.mode;

    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }

    if (mode_ == LogMode::File) {
        file_ = std::fopen(cfg.file_path.c_str(), "a");
        if (!file_) {
            mode_ = LogMode::Console;
        }
    }
}

void Logger::set_level(LogLevel lvl) {
    level_.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel Logger::level() {
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

const char* Logger::level_str(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

void Logger::log(LogLevel lvl, const char* fmt, ...) {
    if (static_cast<int>(lvl) < level_.load(std::memory_order_relaxed)) {
        return;
    }
    va_list ap;
    va_start(ap, fmt);
    vlog(lvl, fmt, ap);
    va_end(ap);
}

/**
 * Render one line: "YYYY-MM-DD HH:MM:SS.mmm [LEVEL] message".
 */
void Logger::vlog(LogLevel lvl, const char* fmt, va_list ap) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);

    char ts[40];
    std::snprintf(ts, sizeof(ts), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));

    std::lock_guard<std::mutex> lk(mtx_);
    if (mode_ == LogMode::Silent) {
        return;
    }
    FILE* out = (mode_ == LogMode::File && file_) ? file_ : stderr;

    const bool colored = mode_ == LogMode::Console;
    std::fprintf(out, "%s %s[%s]%s ", ts,
                 colored ? level_color(lvl) : "",
                 level_str(lvl),
                 colored ? "\033[0m" : "");
    std::vfprintf(out, fmt, ap);

    const std::size_t len = std::strlen(fmt);
    if (len == 0 || fmt[len - 1] != '\n') {
        std::fputc('\n', out);
    }
    std::fflush(out);
}

} // namespace linkwatch
