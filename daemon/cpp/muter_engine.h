// daemon/cpp/muter_engine.h
#ifndef HUSH_MUTER_ENGINE_H
#define HUSH_MUTER_ENGINE_H

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <chrono>
#include <optional>
#include <functional>
#include <cstdint>
#include "audio_manager.h"
#include "config_store.h"
#include "foreground_tracker.h"
#include "logger.h"

using json = nlohmann::json;

struct AppAudioState {
    uint32_t pid = 0;
    std::string process_name;
    std::string display_name;
    // Only this bit says the engine owns the mute; the OS flag alone never does.
    bool is_muted_by_us = false;
    bool original_mute_state = false;
    std::chrono::steady_clock::time_point last_seen;
    bool is_active = false;
};

struct TickSummary {
    std::optional<uint32_t> foreground_pid;
    bool foreground_changed = false;
    bool refreshed = false;
    size_t active_sessions = 0;
    size_t muted_count = 0;
};

class MuterEngine {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    struct Options {
        std::chrono::milliseconds refresh_interval{2000};
        std::chrono::milliseconds stale_threshold{30000};
        std::optional<uint32_t> own_pid;
        Clock clock;
    };

    MuterEngine(std::shared_ptr<AudioManager> audio_manager,
                std::shared_ptr<ConfigStore> config,
                std::unique_ptr<ForegroundTracker> foreground_tracker,
                std::shared_ptr<Logger> logger,
                Options options);
    // The owner is expected to call shutdown() first; this is the backstop.
    ~MuterEngine();

    MuterEngine(const MuterEngine&) = delete;
    MuterEngine& operator=(const MuterEngine&) = delete;

    TickSummary tick();
    // Immediate reconciliation with a full re-enumeration.
    TickSummary force_refresh();

    void unmute_all();
    // Unmutes everything we muted; later ticks do nothing.
    void shutdown();
    bool is_shut_down() const;

    std::vector<AppAudioState> get_app_states() const;
    std::vector<AppAudioState> get_active_sessions() const;
    // Non-blocking variant for the UI thread; false when the engine is busy.
    bool try_get_active_sessions(std::vector<AppAudioState>& out) const;
    size_t muted_count() const;
    bool is_muted_by_us(uint32_t pid) const;
    std::shared_ptr<AudioManager> audio_manager() const { return audio_manager_; }

    json get_dashboard_payload() const;

private:
    std::chrono::steady_clock::time_point now() const;
    TickSummary tick_nolock(bool force);
    void handle_policy_change_nolock(const PolicySnapshot& policy);
    void refresh_family_nolock(const std::vector<AudioSession>& sessions);
    AppAudioState& upsert_nolock(const AudioSession& session, std::chrono::steady_clock::time_point now);
    void reconcile_nolock(AppAudioState& state, bool os_muted);
    void engage_nolock(AppAudioState& state, bool os_muted, const char* reason);
    void release_nolock(AppAudioState& state, const char* reason);
    void sweep_nolock(const std::set<uint32_t>& seen_pids, std::chrono::steady_clock::time_point now);
    void unmute_all_nolock(const char* reason);
    void clear_muted_flag_nolock(AppAudioState& state);
    bool is_own_process(uint32_t pid) const;
    size_t active_count_nolock() const;
    std::string status_to_string(const AppAudioState& state) const;
    void log_event(LogLevel level, const std::string& category, const std::string& message,
                   const std::string& process_name = "", long long pid = -1);

    std::shared_ptr<AudioManager> audio_manager_;
    std::shared_ptr<ConfigStore> config_;
    std::unique_ptr<ForegroundTracker> foreground_tracker_;
    std::shared_ptr<Logger> logger_;
    Options options_;

    mutable std::mutex state_mutex_;
    std::map<uint32_t, AppAudioState> app_states_;
    std::set<uint32_t> muted_pids_;
    PolicySnapshot policy_;
    std::optional<uint64_t> last_policy_version_;
    std::optional<uint32_t> foreground_pid_;
    std::set<uint32_t> foreground_family_;
    std::optional<std::chrono::steady_clock::time_point> last_refresh_;
    // A due refresh lost the race for the enumerator; retry next tick.
    bool refresh_pending_ = false;
    bool shut_down_ = false;
};

#endif //HUSH_MUTER_ENGINE_H
