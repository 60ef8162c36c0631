// daemon/cpp/win_audio_enumerator.h
#ifndef HUSH_WIN_AUDIO_ENUMERATOR_H
#define HUSH_WIN_AUDIO_ENUMERATOR_H

#include <windows.h>
#include <mmdeviceapi.h>
#include <audiopolicy.h>
#include <wrl/client.h>
#include <memory>
#include <vector>
#include "audio_session.h"
#include "process_resolver.h"

// Fans mute out to every per-endpoint session of one process.
class CompositeMuteControl : public MuteControl {
public:
    explicit CompositeMuteControl(std::vector<Microsoft::WRL::ComPtr<ISimpleAudioVolume>> volumes);

    bool set_mute(bool muted) override;
    // True only when every merged session is muted.
    std::optional<bool> get_mute() const override;

    void add(Microsoft::WRL::ComPtr<ISimpleAudioVolume> volume);

private:
    std::vector<Microsoft::WRL::ComPtr<ISimpleAudioVolume>> volumes_;
};

// WASAPI session enumeration over every active render endpoint. Must be
// created and used on a thread that has joined the MTA.
class WinAudioEnumerator : public SessionEnumerator {
public:
    // Throws std::runtime_error when the audio subsystem is unreachable.
    explicit WinAudioEnumerator(std::shared_ptr<ProcessIdentityResolver> resolver);

    std::vector<EnumeratedSession> enumerate() override;

private:
    std::vector<Microsoft::WRL::ComPtr<IMMDevice>> collect_endpoints();
    void collect_sessions(IMMDevice* device, std::vector<EnumeratedSession>& out,
                          std::vector<std::shared_ptr<CompositeMuteControl>>& controls);

    Microsoft::WRL::ComPtr<IMMDeviceEnumerator> device_enumerator_;
    std::shared_ptr<ProcessIdentityResolver> resolver_;
};

#endif //HUSH_WIN_AUDIO_ENUMERATOR_H
