#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <functional>

// Log level enumeration for conditional logging
enum class LogLevel {
    DEBUG = 0,     // Every message (most verbose)
    INFO = 1,      // Important events
    WARNING = 2,   // Problems only
    ERROR = 3,     // Errors only
    NONE = 4,      // Disable all logging
};

// Tag prepended to every line (e.g. the transfer id of the active upload session)
void setSessionTag(const std::string& tag);
void nativeLog(LogLevel level, const std::string& message);

// Route log lines to a custom sink instead of stderr (nullptr restores stderr)
void setLogCallback(std::function<void(const std::string&)> callback);

// Global log level. Default: INFO (skips debug messages)
void set_log_level(LogLevel level);
LogLevel get_log_level();

// "debug" | "info" | "warn" | "warning" | "error" | "none"; unknown values map to INFO
LogLevel parse_log_level(const std::string& value);
const char* log_level_name(LogLevel level);

// Async logging: lines go to a queue drained by a background thread.
// disable_async_logging() flushes whatever is still queued.
void enable_async_logging();
void disable_async_logging();
bool is_async_logging_enabled();

#define LOG_DEBUG(msg) if (get_log_level() <= LogLevel::DEBUG) nativeLog(LogLevel::DEBUG, msg)
#define LOG_INFO(msg)  if (get_log_level() <= LogLevel::INFO) nativeLog(LogLevel::INFO, msg)
#define LOG_WARN(msg)  if (get_log_level() <= LogLevel::WARNING) nativeLog(LogLevel::WARNING, msg)
#define LOG_ERROR(msg) if (get_log_level() <= LogLevel::ERROR) nativeLog(LogLevel::ERROR, msg)

#endif // LOGGER_H
