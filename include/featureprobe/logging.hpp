/*!
 * @file logging.hpp
 * @brief Public API Interface for Logging.
 */

#pragma once

#include <featureprobe/export.hpp>

namespace fp {

enum class LogLevel {
    Fatal = 0,
    Critical,
    Error,
    Warning,
    Info,
    Debug,
    Trace
};

/** @brief Signature of a log sink. `text` is only valid for the duration of
 * the call. */
using Logger = void (*)(LogLevel level, const char *text);

FP_EXPORT void log(LogLevel level, const char *format, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

/** @brief Writes `text` to stderr prefixed with a timestamp and level.
 * Safe to call from multiple threads. */
FP_EXPORT void basicLogger(LogLevel level, const char *text);

/** @brief Replace the process wide logger. Messages above `level` are
 * discarded before formatting. Defaults to `basicLogger` at `Info`. */
FP_EXPORT void configureGlobalLogger(LogLevel level, Logger logger);

FP_EXPORT const char *logLevelToString(LogLevel level);

} // namespace fp

#define FP_LOG(level, format, ...) \
    ::fp::log(level, "[%s, %d] " format, __FILE__, __LINE__, ##__VA_ARGS__)
