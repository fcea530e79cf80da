#pragma once

#include <string>
#include <memory>

namespace voice_relay {

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
 * @brief Parse a level name ("debug", "info", "warn", "error"), case-insensitive
 * @return Parsed level, or INFO when the name is not recognized
 */
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Provides leveled logging with optional file output.
 * Thread-safe for concurrent use from the sender, receiver and server threads.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
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
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);

    static LogLevel get_level();

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
    static const char* level_string(LogLevel level);
};

#define LOG_DEBUG(msg) voice_relay::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) voice_relay::Logger::info(msg)
#define LOG_WARN(msg) voice_relay::Logger::warn(msg)
#define LOG_ERROR(msg) voice_relay::Logger::error(msg)

// Component-specific logging macros
#define LOG_REGISTRY(msg) voice_relay::Logger::info(std::string("[Registry] ") + (msg))
#define LOG_TOOL(msg) voice_relay::Logger::info(std::string("[Tool] ") + (msg))
#define LOG_UPSTREAM(msg) voice_relay::Logger::info(std::string("[Upstream] ") + (msg))
#define LOG_SERVER(msg) voice_relay::Logger::info(std::string("[Server] ") + (msg))
#define LOG_RELAY(connection_id, msg) voice_relay::Logger::info(std::string("[connection_id=") + (connection_id) + "] " + (msg))

} // namespace voice_relay
