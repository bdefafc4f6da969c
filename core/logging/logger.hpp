#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace sonar {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

/**
 * @brief Process-wide line logger writing to stderr.
 *
 * stdout is reserved for the one-shot scan envelope. Each line carries a
 * short tag for the emitting thread, since probes log from worker threads
 * and several scans can run at once. The level check is a relaxed atomic
 * load so disabled LOG_DEBUG calls cost nothing on the probe paths.
 */
class Logger {
public:
    static void set_level(Level level) { threshold_.store(level, std::memory_order_relaxed); }
    static Level level() { return threshold_.load(std::memory_order_relaxed); }
    static bool enabled(Level level) {
        return level != Level::LVL_NONE && level >= threshold_.load(std::memory_order_relaxed);
    }

    static void log(Level level, const char *file, int line, const std::string &message);

private:
    static std::atomic<Level> threshold_;
    static std::mutex write_mutex_;
};

// Parses debug/info/warn/error (any case); anything else maps to INFO
Level string_to_level(const std::string &level_str);

const char *level_to_string(Level level);

}  // namespace logging
}  // namespace sonar

#define SONAR_LOG_INTERNAL(level, msg)                                            \
    do {                                                                          \
        if (sonar::logging::Logger::enabled(level)) {                             \
            std::ostringstream sonar_log_stream_;                                 \
            sonar_log_stream_ << msg;                                             \
            sonar::logging::Logger::log(level, __FILE__, __LINE__, sonar_log_stream_.str()); \
        }                                                                         \
    } while (0)

#define LOG_DEBUG(msg) SONAR_LOG_INTERNAL(sonar::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) SONAR_LOG_INTERNAL(sonar::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) SONAR_LOG_INTERNAL(sonar::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) SONAR_LOG_INTERNAL(sonar::logging::Level::LVL_ERROR, msg)
