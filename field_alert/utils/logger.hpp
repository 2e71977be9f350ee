#ifndef FIELD_ALERT_LOGGER_HPP
#define FIELD_ALERT_LOGGER_HPP

#include <cstdarg>
#include <esp_log.h>

// Fixed-size formatting buffer to avoid heap usage
#ifndef FIELD_ALERT_LOG_MAX_MESSAGE_LEN
#define FIELD_ALERT_LOG_MAX_MESSAGE_LEN 256
#endif

enum class LogLevel {
    ERROR = 0,
    WARN  = 1,
    INFO  = 2,
    DEBUG = 3
};

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool isEnabled(LogLevel level);

    // "error", "warn", "info", "debug"; returns false and leaves out_level untouched otherwise
    static bool parseLevel(const char* name, LogLevel& out_level);
    static const char* levelName(LogLevel level);

    static void log(LogLevel level, const char* tag, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    static void error(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    static void warn(const char* tag, const char* fmt, ...)  __attribute__((format(printf, 2, 3)));
    static void info(const char* tag, const char* fmt, ...)  __attribute__((format(printf, 2, 3)));
    static void debug(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

    // Align ESP-IDF's own gate for a tag ("*" for all) with our level
    static void syncEspLogLevel(const char* tag);

private:
    static void logFormatted(LogLevel level, const char* tag, const char* fmt, va_list args);
    static esp_log_level_t toEspLevel(LogLevel level);
    static LogLevel s_level;
};

#define LOG_ERROR(TAG, FMT, ...) Logger::error((TAG), (FMT), ##__VA_ARGS__)
#define LOG_WARN(TAG, FMT, ...)  Logger::warn((TAG),  (FMT), ##__VA_ARGS__)
#define LOG_INFO(TAG, FMT, ...)  Logger::info((TAG),  (FMT), ##__VA_ARGS__)
#define LOG_DEBUG(TAG, FMT, ...) Logger::debug((TAG), (FMT), ##__VA_ARGS__)

#endif // FIELD_ALERT_LOGGER_HPP
