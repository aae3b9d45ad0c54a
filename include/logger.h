#pragma once

#include <string>
#include <ostream>
#include <memory>

namespace voxlink {

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
 * @brief Process-wide, thread-safe logger
 *
 * Called from the caller's thread, the transport reader thread and the
 * audio callback thread; every write is serialized by one mutex.
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
    
    /**
     * @brief Log a message at DEBUG level
     */
    static void debug(const std::string& message);
    
    /**
     * @brief Log a message at INFO level
     */
    static void info(const std::string& message);
    
    /**
     * @brief Log a message at WARN level
     */
    static void warn(const std::string& message);
    
    /**
     * @brief Log a message at ERROR level
     */
    static void error(const std::string& message);
    
    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);
    
    /**
     * @brief Get current minimum log level
     */
    static LogLevel get_level();

    /**
     * @brief Parse "debug", "info", "warn" or "error" (case-insensitive); INFO otherwise
     */
    static LogLevel parse_level(const std::string& name);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;
    
    static void log(LogLevel level, const std::string& message);
    static const char* level_string(LogLevel level);
};

// Convenience macros for component-specific logging
#define LOG_DEBUG(msg) voxlink::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) voxlink::Logger::info(msg)
#define LOG_WARN(msg) voxlink::Logger::warn(msg)
#define LOG_ERROR(msg) voxlink::Logger::error(msg)

// Component-specific logging macros
#define LOG_WS(msg) voxlink::Logger::debug(std::string("[WS] ") + (msg))
#define LOG_CONN(msg) voxlink::Logger::info(std::string("[Conn] ") + (msg))
#define LOG_ROUTER(msg) voxlink::Logger::debug(std::string("[Router] ") + (msg))
#define LOG_SETTINGS(msg) voxlink::Logger::info(std::string("[Settings] ") + (msg))
#define LOG_AUDIO(msg) voxlink::Logger::debug(std::string("[Audio] ") + (msg))

} // namespace voxlink
