// daemon/cpp/audio_session.h
#ifndef HUSH_AUDIO_SESSION_H
#define HUSH_AUDIO_SESSION_H

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>

// One process' playback as seen by a single enumeration pass.
struct AudioSession {
    uint32_t process_id = 0;
    std::string process_name;
    std::string display_name;
    bool is_muted = false;
};

// Mute control over every OS session a process owns. Implementations must
// tolerate being called after the process has exited.
class MuteControl {
public:
    virtual ~MuteControl() = default;
    virtual bool set_mute(bool muted) = 0;
    virtual std::optional<bool> get_mute() const = 0;
};

struct EnumeratedSession {
    AudioSession session;
    std::shared_ptr<MuteControl> control;
};

// Queries the OS for active playback sessions, one entry per process id.
// Never throws once constructed; unreachable devices yield fewer entries.
class SessionEnumerator {
public:
    virtual ~SessionEnumerator() = default;
    virtual std::vector<EnumeratedSession> enumerate() = 0;
};

#endif //HUSH_AUDIO_SESSION_H
