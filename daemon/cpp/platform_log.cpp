// daemon/cpp/platform_log.cpp
#include "platform_log.h"
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace {

std::atomic<int> g_min_priority{PLATFORM_LOG_INFO};
std::mutex g_stderr_mutex;

const char* priority_letter(PlatformLogPriority priority) {
    switch (priority) {
        case PLATFORM_LOG_DEBUG: return "D";
        case PLATFORM_LOG_INFO:  return "I";
        case PLATFORM_LOG_WARN:  return "W";
        case PLATFORM_LOG_ERROR: return "E";
    }
    return "?";
}

} // namespace

void platform_log_set_min_priority(PlatformLogPriority priority) {
    g_min_priority = priority;
}

void platform_log_print(PlatformLogPriority priority, const char* tag, const char* fmt, ...) {
    if (priority < g_min_priority.load()) return;

    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    std::string line = std::string(priority_letter(priority)) + "/" + (tag ? tag : "hushd") + ": " + buffer + "\n";

#ifdef _WIN32
    OutputDebugStringA(line.c_str());
#endif
    std::lock_guard<std::mutex> lock(g_stderr_mutex);
    std::fputs(line.c_str(), stderr);
}
