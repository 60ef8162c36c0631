// daemon/cpp/process_resolver.h
#ifndef HUSH_PROCESS_RESOLVER_H
#define HUSH_PROCESS_RESOLVER_H

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>

extern const char* const kSystemSoundsName;

// One way of turning a pid into an executable path or name.
class ProcessNameStrategy {
public:
    virtual ~ProcessNameStrategy() = default;
    virtual std::optional<std::string> lookup(uint32_t pid) = 0;
    virtual const char* name() const = 0;
};

// Tries each strategy in order; the first non-empty answer wins.
class ProcessIdentityResolver {
public:
    explicit ProcessIdentityResolver(std::vector<std::unique_ptr<ProcessNameStrategy>> strategies);

    std::string resolve(uint32_t pid);

    static std::string placeholder_name(uint32_t pid);

private:
    std::vector<std::unique_ptr<ProcessNameStrategy>> strategies_;
};

std::string to_lower_ascii(std::string s);
// Final path component, accepting both separators.
std::string base_name(const std::string& path);
// audiodg.exe, svchost.exe and friends: rendered as System Sounds.
bool is_system_sounds_process(const std::string& process_name);

#endif //HUSH_PROCESS_RESOLVER_H
