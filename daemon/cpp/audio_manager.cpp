// daemon/cpp/audio_manager.cpp
#include "audio_manager.h"
#include "platform_log.h"

#define LOG_TAG "hushd_audio"
#define LOGD(...) platform_log_print(PLATFORM_LOG_DEBUG, LOG_TAG, __VA_ARGS__)
#define LOGW(...) platform_log_print(PLATFORM_LOG_WARN, LOG_TAG, __VA_ARGS__)

const char* mute_result_name(MuteResult result) {
    switch (result) {
        case MuteResult::APPLIED:    return "applied";
        case MuteResult::NOT_CACHED: return "not_cached";
        case MuteResult::FAILED:     return "failed";
    }
    return "unknown";
}

AudioManager::AudioManager(std::shared_ptr<SessionEnumerator> enumerator)
    : enumerator_(std::move(enumerator)) {}

std::vector<AudioSession> AudioManager::refresh() {
    std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);
    return refresh_locked();
}

std::optional<std::vector<AudioSession>> AudioManager::try_refresh() {
    std::unique_lock<std::mutex> refresh_lock(refresh_mutex_, std::try_to_lock);
    if (!refresh_lock.owns_lock()) return std::nullopt;
    return refresh_locked();
}

std::vector<AudioSession> AudioManager::refresh_locked() {
    // Enumeration can take tens of milliseconds; do it unlocked.
    std::vector<EnumeratedSession> enumerated = enumerator_->enumerate();
    refresh_count_++;

    std::map<uint32_t, CachedSession> fresh;
    std::vector<AudioSession> result;
    result.reserve(enumerated.size());
    for (auto& item : enumerated) {
        if (!item.control) continue;
        auto [it, inserted] = fresh.emplace(item.session.process_id, CachedSession{
            .control = item.control,
            .process_name = item.session.process_name,
            .display_name = item.session.display_name
        });
        if (!inserted) {
            LOGD("Duplicate session for pid %u ignored.", item.session.process_id);
            continue;
        }
        result.push_back(item.session);
    }

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        for (auto& [pid, cached] : sessions_) {
            if (!fresh.count(pid)) retired_[pid] = std::move(cached);
        }
        for (const auto& [pid, cached] : fresh) {
            retired_.erase(pid);
        }
        sessions_.swap(fresh);
    }
    // fresh now holds the previous map; its handles are released unlocked.
    return result;
}

std::shared_ptr<MuteControl> AudioManager::find_control_nolock(uint32_t pid) const {
    auto it = sessions_.find(pid);
    if (it != sessions_.end()) return it->second.control;
    auto retired_it = retired_.find(pid);
    if (retired_it != retired_.end()) return retired_it->second.control;
    return nullptr;
}

MuteResult AudioManager::apply_mute(uint32_t pid, bool muted) {
    std::shared_ptr<MuteControl> control;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        control = find_control_nolock(pid);
    }
    if (!control) {
        LOGD("pid %u not cached, %s skipped.", pid, muted ? "mute" : "unmute");
        return MuteResult::NOT_CACHED;
    }
    if (!control->set_mute(muted)) {
        LOGW("Failed to %s pid %u.", muted ? "mute" : "unmute", pid);
        return MuteResult::FAILED;
    }
    return MuteResult::APPLIED;
}

MuteResult AudioManager::mute(uint32_t pid) {
    return apply_mute(pid, true);
}

MuteResult AudioManager::unmute(uint32_t pid) {
    return apply_mute(pid, false);
}

std::optional<bool> AudioManager::is_muted(uint32_t pid) const {
    std::shared_ptr<MuteControl> control;
    {
        std::unique_lock<std::mutex> lock(cache_mutex_, std::try_to_lock);
        if (!lock.owns_lock()) return std::nullopt;
        control = find_control_nolock(pid);
    }
    if (!control) return std::nullopt;
    return control->get_mute();
}

std::optional<bool> AudioManager::read_mute_state(uint32_t pid) const {
    std::shared_ptr<MuteControl> control;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = sessions_.find(pid);
        if (it == sessions_.end()) return std::nullopt;
        control = it->second.control;
    }
    return control->get_mute();
}

bool AudioManager::contains(uint32_t pid) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return sessions_.count(pid) > 0;
}

bool AudioManager::is_retired(uint32_t pid) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return retired_.count(pid) > 0;
}

size_t AudioManager::cached_count() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return sessions_.size();
}

std::vector<uint32_t> AudioManager::cached_pids() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    std::vector<uint32_t> pids;
    pids.reserve(sessions_.size());
    for (const auto& [pid, cached] : sessions_) pids.push_back(pid);
    return pids;
}

std::optional<CachedSession> AudioManager::get_cached(uint32_t pid) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = sessions_.find(pid);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

size_t AudioManager::release_retired() {
    std::map<uint32_t, CachedSession> released;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        released.swap(retired_);
    }
    // Handles are destroyed here, outside the lock.
    return released.size();
}
