#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

#include <featureprobe/logging.hpp>

namespace fp {

static std::mutex globalLoggerLock;
static Logger globalLogger = basicLogger;
static std::atomic<LogLevel> globalLogLevel{LogLevel::Info};

static std::mutex basicLoggerLock;

const char *
logLevelToString(const LogLevel level)
{
    switch (level) {
        case LogLevel::Fatal:    return "FATAL";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Trace:    return "TRACE";
    }

    return "UNKNOWN";
}

void
basicLogger(const LogLevel level, const char *const text)
{
    char timestamp[32];
    const std::time_t now = std::time(nullptr);
    struct tm parts{};

    localtime_r(&now, &parts);

    if (std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &parts) == 0) {
        timestamp[0] = '\0';
    }

    std::lock_guard<std::mutex> guard(basicLoggerLock);
    std::fprintf(stderr, "%s [%s] %s\n", timestamp, logLevelToString(level), text);
}

void
configureGlobalLogger(const LogLevel level, const Logger logger)
{
    std::lock_guard<std::mutex> guard(globalLoggerLock);
    globalLogLevel.store(level);
    globalLogger = logger;
}

void
log(const LogLevel level, const char *const format, ...)
{
    char buffer[4096];
    std::va_list args;

    if (level > globalLogLevel.load()) {
        return;
    }

    va_start(args, format);
    const int written = std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    if (written < 0) {
        return;
    }

    std::lock_guard<std::mutex> guard(globalLoggerLock);
    if (globalLogger) {
        globalLogger(level, buffer);
    }
}

} // namespace fp
