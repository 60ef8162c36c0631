// daemon/cpp/win_process_strategies.cpp
#include "win_process_strategies.h"
#include "win_util.h"
#include <windows.h>
#include <psapi.h>

namespace {
struct HandleCloser {
    void operator()(HANDLE h) const { if (h) CloseHandle(h); }
};
using ProcessHandle = std::unique_ptr<void, HandleCloser>;
}

std::optional<std::string> ModuleFileNameStrategy::lookup(uint32_t pid) {
    ProcessHandle process(OpenProcess(PROCESS_QUERY_INFORMATION | PROCESS_VM_READ, FALSE, pid));
    if (!process) return std::nullopt;

    wchar_t buffer[MAX_PATH] = {0};
    DWORD length = GetModuleFileNameExW(process.get(), nullptr, buffer, MAX_PATH);
    if (length == 0) return std::nullopt;
    return wide_to_utf8(std::wstring(buffer, length));
}

std::optional<std::string> ImageNameStrategy::lookup(uint32_t pid) {
    ProcessHandle process(OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid));
    if (!process) return std::nullopt;

    wchar_t buffer[MAX_PATH] = {0};
    DWORD size = MAX_PATH;
    if (!QueryFullProcessImageNameW(process.get(), 0, buffer, &size)) return std::nullopt;
    return wide_to_utf8(std::wstring(buffer, size));
}

std::unique_ptr<ProcessIdentityResolver> make_windows_process_resolver() {
    std::vector<std::unique_ptr<ProcessNameStrategy>> strategies;
    strategies.push_back(std::make_unique<ModuleFileNameStrategy>());
    strategies.push_back(std::make_unique<ImageNameStrategy>());
    return std::make_unique<ProcessIdentityResolver>(std::move(strategies));
}
