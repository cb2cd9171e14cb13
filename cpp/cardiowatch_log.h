// Tagged printf-style logging shared by the monitoring core
#pragma once

namespace cardiowatch {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, SILENT = 4 };

// Process-wide minimum level (default INFO). Thread-safe.
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Routes to __android_log_vprint on Android, os_log on iOS, stderr elsewhere.
void cw_log(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

} // namespace cardiowatch

#define CW_LOGD(tag, fmt, ...) ::cardiowatch::cw_log(::cardiowatch::LogLevel::DEBUG, tag, fmt, ##__VA_ARGS__)
#define CW_LOGI(tag, fmt, ...) ::cardiowatch::cw_log(::cardiowatch::LogLevel::INFO, tag, fmt, ##__VA_ARGS__)
#define CW_LOGW(tag, fmt, ...) ::cardiowatch::cw_log(::cardiowatch::LogLevel::WARN, tag, fmt, ##__VA_ARGS__)
#define CW_LOGE(tag, fmt, ...) ::cardiowatch::cw_log(::cardiowatch::LogLevel::ERROR, tag, fmt, ##__VA_ARGS__)
