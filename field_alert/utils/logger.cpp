#include <field_alert/utils/logger.hpp>
#include <cstdio>
#include <cstring>

LogLevel Logger::s_level = LogLevel::INFO;

void Logger::setLevel(LogLevel level) {
    s_level = level;
}

LogLevel Logger::getLevel() {
    return s_level;
}

bool Logger::isEnabled(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(s_level);
}

bool Logger::parseLevel(const char* name, LogLevel& out_level) {
    if (name == nullptr) {
        return false;
    }
    if (std::strcmp(name, "error") == 0) { out_level = LogLevel::ERROR; return true; }
    if (std::strcmp(name, "warn") == 0)  { out_level = LogLevel::WARN;  return true; }
    if (std::strcmp(name, "info") == 0)  { out_level = LogLevel::INFO;  return true; }
    if (std::strcmp(name, "debug") == 0) { out_level = LogLevel::DEBUG; return true; }
    return false;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "error";
        case LogLevel::WARN:  return "warn";
        case LogLevel::INFO:  return "info";
        case LogLevel::DEBUG: return "debug";
    }
    return "info";
}

void Logger::syncEspLogLevel(const char* tag) {
    esp_log_level_set(tag, toEspLevel(s_level));
}

esp_log_level_t Logger::toEspLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return ESP_LOG_ERROR;
        case LogLevel::WARN:  return ESP_LOG_WARN;
        case LogLevel::INFO:  return ESP_LOG_INFO;
        case LogLevel::DEBUG: return ESP_LOG_DEBUG;
    }
    return ESP_LOG_INFO;
}

void Logger::logFormatted(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (!isEnabled(level)) {
        return;
    }
    char buffer[FIELD_ALERT_LOG_MAX_MESSAGE_LEN];
    const char* text = buffer;
    int n = vsnprintf(buffer, sizeof(buffer), fmt, args);
    if (n < 0) {
        text = "formatting error";
    } else {
        buffer[sizeof(buffer) - 1] = '\0';
    }

    switch (level) {
        case LogLevel::ERROR: ESP_LOGE(tag, "%s", text); break;
        case LogLevel::WARN:  ESP_LOGW(tag, "%s", text); break;
        case LogLevel::INFO:  ESP_LOGI(tag, "%s", text); break;
        case LogLevel::DEBUG: ESP_LOGD(tag, "%s", text); break;
    }
}

void Logger::log(LogLevel level, const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(level, tag, fmt, args);
    va_end(args);
}

void Logger::error(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::ERROR, tag, fmt, args);
    va_end(args);
}

void Logger::warn(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::WARN, tag, fmt, args);
    va_end(args);
}

void Logger::info(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::INFO, tag, fmt, args);
    va_end(args);
}

void Logger::debug(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::DEBUG, tag, fmt, args);
    va_end(args);
}
