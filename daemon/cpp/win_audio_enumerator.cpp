// daemon/cpp/win_audio_enumerator.cpp
#include "win_audio_enumerator.h"
#include "win_util.h"
#include "platform_log.h"
#include <objbase.h>
#include <algorithm>
#include <set>
#include <stdexcept>

#define LOG_TAG "hushd_wasapi"
#define LOGD(...) platform_log_print(PLATFORM_LOG_DEBUG, LOG_TAG, __VA_ARGS__)
#define LOGW(...) platform_log_print(PLATFORM_LOG_WARN, LOG_TAG, __VA_ARGS__)

using Microsoft::WRL::ComPtr;

CompositeMuteControl::CompositeMuteControl(std::vector<ComPtr<ISimpleAudioVolume>> volumes)
    : volumes_(std::move(volumes)) {}

void CompositeMuteControl::add(ComPtr<ISimpleAudioVolume> volume) {
    volumes_.push_back(std::move(volume));
}

bool CompositeMuteControl::set_mute(bool muted) {
    bool all_ok = !volumes_.empty();
    for (const auto& volume : volumes_) {
        HRESULT hr = volume->SetMute(muted ? TRUE : FALSE, nullptr);
        if (FAILED(hr)) {
            LOGD("SetMute failed: 0x%08lx", static_cast<unsigned long>(hr));
            all_ok = false;
        }
    }
    return all_ok;
}

std::optional<bool> CompositeMuteControl::get_mute() const {
    bool any_read = false;
    for (const auto& volume : volumes_) {
        BOOL muted = FALSE;
        if (FAILED(volume->GetMute(&muted))) continue;
        any_read = true;
        if (!muted) return false;
    }
    if (!any_read) return std::nullopt;
    return true;
}

WinAudioEnumerator::WinAudioEnumerator(std::shared_ptr<ProcessIdentityResolver> resolver)
    : resolver_(std::move(resolver)) {
    HRESULT hr = CoCreateInstance(__uuidof(MMDeviceEnumerator), nullptr, CLSCTX_ALL,
                                  IID_PPV_ARGS(&device_enumerator_));
    if (FAILED(hr) || !device_enumerator_) {
        throw std::runtime_error("Cannot create MMDeviceEnumerator (hr=" + std::to_string(static_cast<long>(hr)) + ")");
    }
}

static std::wstring endpoint_id(IMMDevice* device) {
    LPWSTR raw = nullptr;
    if (FAILED(device->GetId(&raw)) || !raw) return std::wstring();
    std::wstring id(raw);
    CoTaskMemFree(raw);
    return id;
}

std::vector<ComPtr<IMMDevice>> WinAudioEnumerator::collect_endpoints() {
    std::vector<ComPtr<IMMDevice>> endpoints;
    std::set<std::wstring> seen_ids;
    auto add_endpoint = [&](ComPtr<IMMDevice> device) {
        std::wstring id = endpoint_id(device.Get());
        if (id.empty() || !seen_ids.insert(id).second) return;
        endpoints.push_back(std::move(device));
    };

    // Role defaults first; they can differ from each other.
    for (ERole role : {eConsole, eMultimedia, eCommunications}) {
        ComPtr<IMMDevice> device;
        HRESULT hr = device_enumerator_->GetDefaultAudioEndpoint(eRender, role, &device);
        if (FAILED(hr) || !device) {
            LOGD("No default render endpoint for role %d (hr=0x%08lx)", static_cast<int>(role), static_cast<unsigned long>(hr));
            continue;
        }
        add_endpoint(std::move(device));
    }

    ComPtr<IMMDeviceCollection> collection;
    HRESULT hr = device_enumerator_->EnumAudioEndpoints(eRender, DEVICE_STATE_ACTIVE, &collection);
    if (FAILED(hr) || !collection) {
        LOGW("EnumAudioEndpoints failed: 0x%08lx", static_cast<unsigned long>(hr));
        return endpoints;
    }
    UINT count = 0;
    collection->GetCount(&count);
    for (UINT i = 0; i < count; ++i) {
        ComPtr<IMMDevice> device;
        if (SUCCEEDED(collection->Item(i, &device)) && device) add_endpoint(std::move(device));
    }
    return endpoints;
}

void WinAudioEnumerator::collect_sessions(IMMDevice* device, std::vector<EnumeratedSession>& out,
                                          std::vector<std::shared_ptr<CompositeMuteControl>>& controls) {
    ComPtr<IAudioSessionManager2> session_manager;
    HRESULT hr = device->Activate(__uuidof(IAudioSessionManager2), CLSCTX_ALL, nullptr,
                                  reinterpret_cast<void**>(session_manager.GetAddressOf()));
    if (FAILED(hr) || !session_manager) {
        LOGW("Activate(IAudioSessionManager2) failed: 0x%08lx", static_cast<unsigned long>(hr));
        return;
    }

    ComPtr<IAudioSessionEnumerator> session_enumerator;
    hr = session_manager->GetSessionEnumerator(&session_enumerator);
    if (FAILED(hr) || !session_enumerator) {
        LOGW("GetSessionEnumerator failed: 0x%08lx", static_cast<unsigned long>(hr));
        return;
    }

    int session_count = 0;
    session_enumerator->GetCount(&session_count);
    for (int i = 0; i < session_count; ++i) {
        ComPtr<IAudioSessionControl> session_control;
        if (FAILED(session_enumerator->GetSession(i, &session_control)) || !session_control) continue;

        ComPtr<IAudioSessionControl2> session_control2;
        if (FAILED(session_control.As(&session_control2)) || !session_control2) continue;

        AudioSessionState state = AudioSessionStateInactive;
        if (SUCCEEDED(session_control->GetState(&state)) && state == AudioSessionStateExpired) continue;

        ComPtr<ISimpleAudioVolume> volume;
        if (FAILED(session_control.As(&volume)) || !volume) continue;

        DWORD pid = 0;
        session_control2->GetProcessId(&pid);
        bool is_system = session_control2->IsSystemSoundsSession() == S_OK || pid == 0;
        std::string process_name = is_system ? std::string(kSystemSoundsName) : resolver_->resolve(pid);
        // Mixer and service hosts fold into the single System Sounds entry.
        if (process_name == kSystemSoundsName) pid = 0;

        // Same process on several endpoints: one entry, one fan-out control.
        auto existing = std::find_if(out.begin(), out.end(),
                                     [pid](const EnumeratedSession& e) { return e.session.process_id == pid; });
        if (existing != out.end()) {
            size_t index = static_cast<size_t>(existing - out.begin());
            BOOL muted = FALSE;
            if (SUCCEEDED(volume->GetMute(&muted))) existing->session.is_muted = existing->session.is_muted && muted;
            controls[index]->add(volume);
            continue;
        }

        EnumeratedSession entry;
        entry.session.process_id = pid;
        entry.session.process_name = process_name;

        LPWSTR raw_display = nullptr;
        if (SUCCEEDED(session_control->GetDisplayName(&raw_display)) && raw_display) {
            entry.session.display_name = wide_to_utf8(raw_display);
            CoTaskMemFree(raw_display);
        }
        // Indirect resource strings ("@%SystemRoot%\...") are not readable names.
        if (entry.session.display_name.empty() || entry.session.display_name[0] == '@') {
            entry.session.display_name = entry.session.process_name;
        }

        BOOL muted = FALSE;
        entry.session.is_muted = SUCCEEDED(volume->GetMute(&muted)) && muted;

        auto control = std::make_shared<CompositeMuteControl>(std::vector<ComPtr<ISimpleAudioVolume>>{volume});
        entry.control = control;
        controls.push_back(control);
        out.push_back(std::move(entry));
    }
}

std::vector<EnumeratedSession> WinAudioEnumerator::enumerate() {
    std::vector<EnumeratedSession> sessions;
    std::vector<std::shared_ptr<CompositeMuteControl>> controls;
    for (const auto& device : collect_endpoints()) {
        collect_sessions(device.Get(), sessions, controls);
    }
    LOGD("Enumerated %zu session(s).", sessions.size());
    return sessions;
}
