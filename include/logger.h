#pragma once

#include <string>
#include <memory>

namespace polyglot {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Parse a level name ("debug", "info", "warn", "error"); unknown names map to INFO
 */
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Thread-safe, process-wide logger
 *
 * Lines read "[LEVEL] timestamp [Component] message"; messages without a
 * component drop the tag. ERROR goes to stderr, everything else to stdout,
 * and every line is appended to the log file when one is configured. Until
 * initialize() is called, messages go to the console untimestamped and
 * unfiltered.
 *
 * The LOG_* macros check enabled() first, so filtered debug lines from the
 * buffer loop and dispatch workers cost no string building.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     *
     * Does nothing if already initialized; call shutdown() first to reconfigure.
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                          const std::string& output_file = "");

    /**
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /**
     * @brief Log a message tagged with a component name (nullptr = untagged)
     */
    static void write(LogLevel level, const char* component, const std::string& message);

    /**
     * @brief True if a message at level would be output
     */
    static bool enabled(LogLevel level);

    static void set_level(LogLevel level);
    static LogLevel get_level();

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;
};

#define POLYGLOT_LOG(level, component, msg) \
    do { \
        if (polyglot::Logger::enabled(level)) { \
            polyglot::Logger::write(level, component, (msg)); \
        } \
    } while (0)

#define LOG_DEBUG(msg) POLYGLOT_LOG(polyglot::LogLevel::DEBUG, nullptr, \
    std::string(__FILE__) + ":" + std::to_string(__LINE__) + " " + (msg))
#define LOG_INFO(msg) POLYGLOT_LOG(polyglot::LogLevel::INFO, nullptr, msg)
#define LOG_WARN(msg) POLYGLOT_LOG(polyglot::LogLevel::WARN, nullptr, msg)
#define LOG_ERROR(msg) POLYGLOT_LOG(polyglot::LogLevel::ERROR, nullptr, msg)

// Component-specific logging macros
#define LOG_BUFFER(msg) POLYGLOT_LOG(polyglot::LogLevel::DEBUG, "Buffer", msg)
#define LOG_STT(msg) POLYGLOT_LOG(polyglot::LogLevel::DEBUG, "STT", msg)
#define LOG_ROUTING(msg) POLYGLOT_LOG(polyglot::LogLevel::INFO, "Routing", msg)
#define LOG_AGENT(msg) POLYGLOT_LOG(polyglot::LogLevel::INFO, "Agent", msg)
#define LOG_COORD(msg) POLYGLOT_LOG(polyglot::LogLevel::INFO, "Coord", msg)
#define LOG_TRANSLATE(msg) POLYGLOT_LOG(polyglot::LogLevel::INFO, "Translate", msg)
#define LOG_TTS(msg) POLYGLOT_LOG(polyglot::LogLevel::INFO, "TTS", msg)

/// One line per pipeline stage of a segment: submit, dispatch, translate, complete, deliver, play
#define LOG_TRACE(segment_id, stage, data) POLYGLOT_LOG(polyglot::LogLevel::INFO, "trace", \
    std::string("segment_id=") + (segment_id) + " stage=" + (stage) + " " + (data))

} // namespace polyglot
