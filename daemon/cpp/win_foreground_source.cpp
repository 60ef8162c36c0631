// daemon/cpp/win_foreground_source.cpp
#include "win_foreground_source.h"
#include "platform_log.h"
#include <windows.h>
#include <tlhelp32.h>
#include <vector>

#define LOG_TAG "hushd_foreground"
#define LOGD(...) platform_log_print(PLATFORM_LOG_DEBUG, LOG_TAG, __VA_ARGS__)
#define LOGW(...) platform_log_print(PLATFORM_LOG_WARN, LOG_TAG, __VA_ARGS__)

std::optional<uint32_t> WinForegroundSource::query_foreground_pid() {
    HWND window = GetForegroundWindow();
    if (window == nullptr) return std::nullopt;

    DWORD pid = 0;
    GetWindowThreadProcessId(window, &pid);
    if (pid == 0) return std::nullopt;
    return static_cast<uint32_t>(pid);
}

namespace {

std::optional<uint64_t> process_creation_time(uint32_t pid) {
    HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid);
    if (process == nullptr) return std::nullopt;

    FILETIME created, exited, kernel, user;
    std::optional<uint64_t> result;
    if (GetProcessTimes(process, &created, &exited, &kernel, &user)) {
        ULARGE_INTEGER value;
        value.LowPart = created.dwLowDateTime;
        value.HighPart = created.dwHighDateTime;
        result = value.QuadPart;
    }
    CloseHandle(process);
    return result;
}

} // namespace

std::set<uint32_t> WinProcessFamilySource::family_of(uint32_t pid) {
    HANDLE snapshot = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
    if (snapshot == INVALID_HANDLE_VALUE) {
        LOGW("CreateToolhelp32Snapshot failed: %lu", GetLastError());
        return {};
    }

    std::vector<ProcessEntry> processes;
    uint32_t parent_pid = 0;
    PROCESSENTRY32W entry = {};
    entry.dwSize = sizeof(entry);
    if (Process32FirstW(snapshot, &entry)) {
        do {
            processes.push_back(ProcessEntry{
                .pid = entry.th32ProcessID,
                .parent_pid = entry.th32ParentProcessID
            });
            if (entry.th32ProcessID == pid) parent_pid = entry.th32ParentProcessID;
        } while (Process32NextW(snapshot, &entry));
    }
    CloseHandle(snapshot);

    // Only the candidates need their creation time.
    for (auto& process : processes) {
        if (process.pid == pid || process.pid == parent_pid || process.parent_pid == pid) {
            process.created = process_creation_time(process.pid);
        }
    }

    std::set<uint32_t> family = collect_family(pid, processes);
    LOGD("Family of pid %u has %zu member(s).", pid, family.size());
    return family;
}
