// daemon/cpp/startup_manager.cpp
#include "startup_manager.h"
#include "platform_log.h"
#include <windows.h>

#define LOG_TAG "hushd_startup"
#define LOGI(...) platform_log_print(PLATFORM_LOG_INFO, LOG_TAG, __VA_ARGS__)
#define LOGE(...) platform_log_print(PLATFORM_LOG_ERROR, LOG_TAG, __VA_ARGS__)

static const wchar_t* kRunKey = L"Software\\Microsoft\\Windows\\CurrentVersion\\Run";
static const wchar_t* kValueName = L"Hush";

std::wstring current_executable_path() {
    wchar_t buffer[MAX_PATH] = {0};
    DWORD length = GetModuleFileNameW(nullptr, buffer, MAX_PATH);
    return std::wstring(buffer, length);
}

bool set_run_at_startup(bool enabled) {
    HKEY key = nullptr;
    LSTATUS status = RegOpenKeyExW(HKEY_CURRENT_USER, kRunKey, 0, KEY_SET_VALUE, &key);
    if (status != ERROR_SUCCESS) {
        LOGE("Cannot open Run key: %ld", static_cast<long>(status));
        return false;
    }

    if (enabled) {
        std::wstring command = L"\"" + current_executable_path() + L"\"";
        status = RegSetValueExW(key, kValueName, 0, REG_SZ,
                                reinterpret_cast<const BYTE*>(command.c_str()),
                                static_cast<DWORD>((command.size() + 1) * sizeof(wchar_t)));
    } else {
        status = RegDeleteValueW(key, kValueName);
        if (status == ERROR_FILE_NOT_FOUND) status = ERROR_SUCCESS;
    }
    RegCloseKey(key);

    if (status != ERROR_SUCCESS) {
        LOGE("Failed to %s Run entry: %ld", enabled ? "write" : "delete", static_cast<long>(status));
        return false;
    }
    LOGI("Run at startup %s.", enabled ? "enabled" : "disabled");
    return true;
}

bool is_run_at_startup_enabled() {
    HKEY key = nullptr;
    if (RegOpenKeyExW(HKEY_CURRENT_USER, kRunKey, 0, KEY_QUERY_VALUE, &key) != ERROR_SUCCESS) return false;
    LSTATUS status = RegQueryValueExW(key, kValueName, nullptr, nullptr, nullptr, nullptr);
    RegCloseKey(key);
    return status == ERROR_SUCCESS;
}
