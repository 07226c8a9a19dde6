#ifndef DROPROOM_LOGGER_H
#define DROPROOM_LOGGER_H

#include <functional>
#include <string>

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    NONE = 4,      // filter only, never a line's level
};

// Lines are formatted "[tag] LEVEL message". The tag is the peer id on a
// peer process and "server" on the coordinator.
void set_log_tag(const std::string& tag);

// Formats and emits one line. Does not consult the level filter; use the
// LOG_* macros for filtered logging.
void write_log(LogLevel level, const std::string& message);

// Replaces stderr as the destination of formatted lines (the terminal CLI
// routes them into its output pane). An empty sink restores stderr.
using LogSink = std::function<void(LogLevel, const std::string&)>;
void set_log_sink(LogSink sink);

// Default: INFO
void set_log_level(LogLevel level);
LogLevel get_log_level();
const char* log_level_name(LogLevel level);

// Accepts debug|info|warn|warning|error|none in any case.
LogLevel parse_log_level(const std::string& value, LogLevel fallback = LogLevel::INFO);

// Lines are queued and written by a background thread until disabled.
// disable_async_logging() drains the queue before returning.
void enable_async_logging();
void disable_async_logging();
bool is_async_logging_enabled();

#define DROPROOM_LOG_AT(level, msg) \
    do { \
        if (get_log_level() <= (level)) write_log((level), (msg)); \
    } while (0)

#define LOG_DEBUG(msg) DROPROOM_LOG_AT(LogLevel::DEBUG, msg)
#define LOG_INFO(msg)  DROPROOM_LOG_AT(LogLevel::INFO, msg)
#define LOG_WARN(msg)  DROPROOM_LOG_AT(LogLevel::WARNING, msg)
#define LOG_ERROR(msg) DROPROOM_LOG_AT(LogLevel::ERROR, msg)

#endif // DROPROOM_LOGGER_H
