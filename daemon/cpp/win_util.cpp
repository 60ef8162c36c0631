// daemon/cpp/win_util.cpp
#include "win_util.h"
#include "platform_log.h"
#include <windows.h>
#include <objbase.h>

#define LOG_TAG "hushd_com"
#define LOGW(...) platform_log_print(PLATFORM_LOG_WARN, LOG_TAG, __VA_ARGS__)

std::string wide_to_utf8(const std::wstring& wide) {
    if (wide.empty()) return std::string();
    int size = WideCharToMultiByte(CP_UTF8, 0, wide.c_str(), static_cast<int>(wide.size()), nullptr, 0, nullptr, nullptr);
    if (size <= 0) return std::string();
    std::string result(size, '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide.c_str(), static_cast<int>(wide.size()), &result[0], size, nullptr, nullptr);
    return result;
}

ComScope::ComScope() {
    HRESULT hr = CoInitializeEx(nullptr, COINIT_MULTITHREADED);
    if (hr == RPC_E_CHANGED_MODE) {
        // Someone already picked an apartment for this thread; COM is usable.
        ok_ = true;
        return;
    }
    if (FAILED(hr)) {
        LOGW("CoInitializeEx failed: 0x%08lx", static_cast<unsigned long>(hr));
        return;
    }
    ok_ = true;
    should_uninit_ = true;
}

ComScope::~ComScope() {
    if (should_uninit_) CoUninitialize();
}
