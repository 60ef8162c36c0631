// daemon/cpp/audio_manager.h
#ifndef HUSH_AUDIO_MANAGER_H
#define HUSH_AUDIO_MANAGER_H

#include <map>
#include <mutex>
#include <memory>
#include <vector>
#include <optional>
#include <atomic>
#include <cstdint>
#include "audio_session.h"

enum class MuteResult {
    APPLIED,
    NOT_CACHED,
    FAILED
};

const char* mute_result_name(MuteResult result);

struct CachedSession {
    std::shared_ptr<MuteControl> control;
    std::string process_name;
    std::string display_name;
};

// Keeps mute controls keyed by pid so mute/unmute never re-enumerate.
// The OS is never called with mutex_ held.
class AudioManager {
public:
    explicit AudioManager(std::shared_ptr<SessionEnumerator> enumerator);

    // Enumerates, then swaps the whole map in one lock acquisition. Pids
    // that vanished are kept as retired until release_retired().
    std::vector<AudioSession> refresh();
    // Same, but nullopt when another refresh is already enumerating.
    std::optional<std::vector<AudioSession>> try_refresh();

    // Absent pids are NOT_CACHED, which callers treat as a no-op.
    MuteResult mute(uint32_t pid);
    MuteResult unmute(uint32_t pid);

    // Live OS flag. Gives up on lock contention (UI thread).
    std::optional<bool> is_muted(uint32_t pid) const;
    // Live OS flag, waits for the lock.
    std::optional<bool> read_mute_state(uint32_t pid) const;

    bool contains(uint32_t pid) const;
    bool is_retired(uint32_t pid) const;
    size_t cached_count() const;
    std::vector<uint32_t> cached_pids() const;
    std::optional<CachedSession> get_cached(uint32_t pid) const;
    size_t release_retired();
    uint64_t refresh_count() const { return refresh_count_.load(); }

private:
    std::vector<AudioSession> refresh_locked();
    MuteResult apply_mute(uint32_t pid, bool muted);
    std::shared_ptr<MuteControl> find_control_nolock(uint32_t pid) const;

    std::shared_ptr<SessionEnumerator> enumerator_;
    mutable std::mutex cache_mutex_;
    std::mutex refresh_mutex_;
    std::map<uint32_t, CachedSession> sessions_;
    std::map<uint32_t, CachedSession> retired_;
    std::atomic<uint64_t> refresh_count_{0};
};

#endif //HUSH_AUDIO_MANAGER_H
