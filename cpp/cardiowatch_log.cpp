#include "cardiowatch_log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#if defined(__ANDROID__)
#include <android/log.h>
#endif
#if defined(__APPLE__)
#include <TargetConditionals.h>
#if TARGET_OS_IPHONE || TARGET_OS_SIMULATOR
#include <os/log.h>
#endif
#endif

namespace cardiowatch {

namespace {

static std::atomic<int> g_minLevel{static_cast<int>(LogLevel::INFO)};

static const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "D";
        case LogLevel::INFO:  return "I";
        case LogLevel::WARN:  return "W";
        case LogLevel::ERROR: return "E";
        default:              return "?";
    }
}

#if defined(__ANDROID__)
static int androidPriority(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return ANDROID_LOG_DEBUG;
        case LogLevel::INFO:  return ANDROID_LOG_INFO;
        case LogLevel::WARN:  return ANDROID_LOG_WARN;
        default:              return ANDROID_LOG_ERROR;
    }
}
#endif

} // namespace

void setLogLevel(LogLevel level) {
    g_minLevel.store(static_cast<int>(level));
}

LogLevel getLogLevel() {
    return static_cast<LogLevel>(g_minLevel.load());
}

void cw_log(LogLevel level, const char* tag, const char* fmt, ...) {
    if (level == LogLevel::SILENT) return;
    if (static_cast<int>(level) < g_minLevel.load()) return;
    if (!tag) tag = "CardioWatch";
    va_list args;
    va_start(args, fmt);
#if defined(__ANDROID__)
    __android_log_vprint(androidPriority(level), tag, fmt, args);
#elif defined(__APPLE__) && (TARGET_OS_IPHONE || TARGET_OS_SIMULATOR)
    char buffer[512];
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    os_log_with_type(OS_LOG_DEFAULT,
                     level >= LogLevel::ERROR ? OS_LOG_TYPE_ERROR : OS_LOG_TYPE_DEBUG,
                     "[%{public}s] %{public}s", tag, buffer);
#else
    std::fprintf(stderr, "[%s][%s] ", tag, levelName(level));
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
    std::fflush(stderr);
#endif
    va_end(args);
}

} // namespace cardiowatch
