#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace sonar {
namespace logging {

std::atomic<Level> Logger::threshold_{Level::LVL_INFO};
std::mutex Logger::write_mutex_;

namespace {

// Small sequential id per thread, assigned on first log line ("t0" is usually main)
unsigned thread_tag() {
    static std::atomic<unsigned> next{0};
    thread_local const unsigned tag = next.fetch_add(1);
    return tag;
}

const char *basename_of(const char *path) {
    const char *slash = std::strrchr(path, '/');
    return slash == nullptr ? path : slash + 1;
}

}  // namespace

const char *level_to_string(Level level) {
    switch (level) {
        case Level::LVL_DEBUG:
            return "DEBUG";
        case Level::LVL_INFO:
            return "INFO";
        case Level::LVL_WARN:
            return "WARN";
        case Level::LVL_ERROR:
            return "ERROR";
        default:
            return "NONE";
    }
}

void Logger::log(Level level, const char *file, int line, const std::string &message) {
    if (!enabled(level)) {
        return;
    }

    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::ostringstream out;
    out << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3)
        << ms.count() << "] [" << std::left << std::setfill(' ') << std::setw(5) << level_to_string(level) << "] [t"
        << thread_tag() << "] " << message;
    // Source location only helps when chasing probe behaviour at debug level
    if (level == Level::LVL_DEBUG) {
        out << " (" << basename_of(file) << ":" << line << ")";
    }
    out << "\n";

    std::lock_guard<std::mutex> lock(write_mutex_);
    std::cerr << out.str();
    if (level >= Level::LVL_WARN) {
        std::cerr.flush();
    }
}

Level string_to_level(const std::string &level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;

    return Level::LVL_INFO;
}

}  // namespace logging
}  // namespace sonar
