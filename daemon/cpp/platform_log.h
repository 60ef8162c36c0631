// daemon/cpp/platform_log.h
#ifndef HUSH_PLATFORM_LOG_H
#define HUSH_PLATFORM_LOG_H

// Printf-style diagnostic log. Each source file defines its own LOG_TAG and
// LOGx macros on top of platform_log_print().
enum PlatformLogPriority {
    PLATFORM_LOG_DEBUG = 3,
    PLATFORM_LOG_INFO = 4,
    PLATFORM_LOG_WARN = 5,
    PLATFORM_LOG_ERROR = 6
};

#if defined(__GNUC__) || defined(__clang__)
#define HUSH_PRINTF_FORMAT(fmt_idx, args_idx) __attribute__((format(printf, fmt_idx, args_idx)))
#else
#define HUSH_PRINTF_FORMAT(fmt_idx, args_idx)
#endif

void platform_log_print(PlatformLogPriority priority, const char* tag, const char* fmt, ...)
    HUSH_PRINTF_FORMAT(3, 4);

void platform_log_set_min_priority(PlatformLogPriority priority);

#endif // HUSH_PLATFORM_LOG_H
