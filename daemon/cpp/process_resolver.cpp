// daemon/cpp/process_resolver.cpp
#include "process_resolver.h"
#include "platform_log.h"
#include <algorithm>
#include <cctype>
#include <unordered_set>

#define LOG_TAG "hushd_resolver"
#define LOGD(...) platform_log_print(PLATFORM_LOG_DEBUG, LOG_TAG, __VA_ARGS__)
#define LOGW(...) platform_log_print(PLATFORM_LOG_WARN, LOG_TAG, __VA_ARGS__)

const char* const kSystemSoundsName = "System Sounds";

std::string to_lower_ascii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string base_name(const std::string& path) {
    size_t pos = path.find_last_of("\\/");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

bool is_system_sounds_process(const std::string& process_name) {
    static const std::unordered_set<std::string> system_names = {
        "audiodg.exe", "svchost.exe", "system", "system idle process", "system sounds"
    };
    return system_names.count(to_lower_ascii(process_name)) > 0;
}

ProcessIdentityResolver::ProcessIdentityResolver(std::vector<std::unique_ptr<ProcessNameStrategy>> strategies)
    : strategies_(std::move(strategies)) {}

std::string ProcessIdentityResolver::placeholder_name(uint32_t pid) {
    return "Process " + std::to_string(pid);
}

std::string ProcessIdentityResolver::resolve(uint32_t pid) {
    if (pid == 0) return kSystemSoundsName;

    for (const auto& strategy : strategies_) {
        auto result = strategy->lookup(pid);
        if (!result || result->empty()) {
            LOGD("Strategy '%s' could not resolve pid %u.", strategy->name(), pid);
            continue;
        }
        std::string name = base_name(*result);
        if (name.empty()) continue;
        if (is_system_sounds_process(name)) return kSystemSoundsName;
        return name;
    }

    LOGW("All strategies failed for pid %u.", pid);
    return placeholder_name(pid);
}
