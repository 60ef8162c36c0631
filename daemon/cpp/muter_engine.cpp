// daemon/cpp/muter_engine.cpp
#include "muter_engine.h"
#include "platform_log.h"
#include <stdexcept>

#define LOG_TAG "hushd_engine"
#define LOGI(...) platform_log_print(PLATFORM_LOG_INFO, LOG_TAG, __VA_ARGS__)
#define LOGW(...) platform_log_print(PLATFORM_LOG_WARN, LOG_TAG, __VA_ARGS__)
#define LOGD(...) platform_log_print(PLATFORM_LOG_DEBUG, LOG_TAG, __VA_ARGS__)

MuterEngine::MuterEngine(std::shared_ptr<AudioManager> audio_manager,
                         std::shared_ptr<ConfigStore> config,
                         std::unique_ptr<ForegroundTracker> foreground_tracker,
                         std::shared_ptr<Logger> logger,
                         Options options)
    : audio_manager_(std::move(audio_manager)),
      config_(std::move(config)),
      foreground_tracker_(std::move(foreground_tracker)),
      logger_(std::move(logger)),
      options_(std::move(options)) {
    if (!audio_manager_ || !config_ || !foreground_tracker_) {
        throw std::invalid_argument("MuterEngine requires an audio manager, a config store and a foreground tracker");
    }
    policy_ = config_->snapshot();
}

MuterEngine::~MuterEngine() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (shut_down_) return;
    LOGW("Engine destroyed without shutdown(), running fail-safe.");
    unmute_all_nolock("engine teardown");
    shut_down_ = true;
}

std::chrono::steady_clock::time_point MuterEngine::now() const {
    return options_.clock ? options_.clock() : std::chrono::steady_clock::now();
}

void MuterEngine::log_event(LogLevel level, const std::string& category, const std::string& message,
                            const std::string& process_name, long long pid) {
    if (logger_) logger_->log(level, category, message, process_name, pid);
}

bool MuterEngine::is_own_process(uint32_t pid) const {
    return options_.own_pid && *options_.own_pid == pid;
}

TickSummary MuterEngine::tick() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return tick_nolock(false);
}

TickSummary MuterEngine::force_refresh() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return tick_nolock(true);
}

void MuterEngine::handle_policy_change_nolock(const PolicySnapshot& policy) {
    bool was_enabled = policy_.muting_enabled;
    policy_ = policy;
    if (!last_policy_version_) return;

    LOGI("Policy changed (version %llu).", static_cast<unsigned long long>(policy.version));
    if (was_enabled && !policy.muting_enabled) {
        log_event(LogLevel::EVENT, "Policy", "Muting disabled");
        unmute_all_nolock("muting disabled");
    } else if (!was_enabled && policy.muting_enabled) {
        log_event(LogLevel::EVENT, "Policy", "Muting enabled");
    } else {
        log_event(LogLevel::EVENT, "Policy", "Configuration updated");
    }
}

TickSummary MuterEngine::tick_nolock(bool force) {
    TickSummary summary;
    if (shut_down_) return summary;

    PolicySnapshot policy = config_->snapshot();
    bool policy_changed = !last_policy_version_ || *last_policy_version_ != policy.version;
    if (policy_changed) {
        handle_policy_change_nolock(policy);
        last_policy_version_ = policy.version;
    }

    ForegroundSample fg = foreground_tracker_->sample();
    summary.foreground_changed = fg.changed;
    foreground_pid_ = fg.pid;
    foreground_family_ = fg.family;
    summary.foreground_pid = foreground_pid_;

    if (fg.changed && fg.pid) {
        auto it = app_states_.find(*fg.pid);
        std::string name = it != app_states_.end() ? it->second.process_name : "";
        log_event(LogLevel::ACTION_FOCUS, "Focus", "Foreground switched", name, *fg.pid);
    }

    auto current = now();
    bool refresh_due = force || policy_changed || fg.changed || refresh_pending_ || !last_refresh_ ||
                       current - *last_refresh_ >= options_.refresh_interval;

    std::optional<std::vector<AudioSession>> sessions;
    if (force) {
        sessions = audio_manager_->refresh();
    } else if (refresh_due) {
        sessions = audio_manager_->try_refresh();
        if (!sessions) LOGD("Refresh already in progress elsewhere, using the cache.");
    }
    refresh_pending_ = refresh_due && !sessions;

    if (sessions) {
        last_refresh_ = current;
        summary.refreshed = true;

        refresh_family_nolock(*sessions);
        std::set<uint32_t> seen_pids;
        for (const auto& session : *sessions) {
            seen_pids.insert(session.process_id);
            AppAudioState& state = upsert_nolock(session, current);
            reconcile_nolock(state, session.is_muted);
        }
        sweep_nolock(seen_pids, current);
        audio_manager_->release_retired();
    } else if (fg.changed) {
        // Enumeration was skipped but a focus switch is never delayed.
        // Sessions that left the cache since the last refresh are not touched.
        for (auto& [pid, state] : app_states_) {
            if (!state.is_active) continue;
            auto live = audio_manager_->read_mute_state(pid);
            if (!live) {
                LOGD("pid %u no longer cached, waiting for next refresh.", pid);
                continue;
            }
            reconcile_nolock(state, *live);
        }
    }

    summary.active_sessions = active_count_nolock();
    summary.muted_count = muted_pids_.size();
    return summary;
}

void MuterEngine::refresh_family_nolock(const std::vector<AudioSession>& sessions) {
    if (!foreground_pid_) return;
    for (const auto& session : sessions) {
        uint32_t pid = session.process_id;
        if (app_states_.count(pid) || foreground_family_.count(pid)) continue;
        // A helper the foreground app spawned after taking focus.
        foreground_family_ = foreground_tracker_->refresh_family();
        LOGD("New session pid %u, foreground family re-queried (%zu member(s)).", pid, foreground_family_.size());
        return;
    }
}

AppAudioState& MuterEngine::upsert_nolock(const AudioSession& session, std::chrono::steady_clock::time_point now) {
    auto [it, inserted] = app_states_.try_emplace(session.process_id);
    AppAudioState& state = it->second;
    if (inserted) {
        state.pid = session.process_id;
        state.original_mute_state = session.is_muted;
        LOGD("Tracking new session: %s (pid %u)", session.process_name.c_str(), session.process_id);
    }
    state.process_name = session.process_name;
    state.display_name = session.display_name;
    state.last_seen = now;
    state.is_active = true;
    return state;
}

void MuterEngine::reconcile_nolock(AppAudioState& state, bool os_muted) {
    if (!policy_.muting_enabled) {
        if (state.is_muted_by_us) release_nolock(state, "muting disabled");
        return;
    }
    if (is_own_process(state.pid)) {
        if (state.is_muted_by_us) release_nolock(state, "own process");
        return;
    }
    if (policy_.is_excluded(state.process_name)) {
        if (state.is_muted_by_us) release_nolock(state, "excluded");
        return;
    }
    if (policy_.is_always_muted(state.process_name)) {
        engage_nolock(state, os_muted, "always muted");
        return;
    }
    if (foreground_family_.count(state.pid)) {
        if (state.is_muted_by_us) release_nolock(state, "foreground");
        return;
    }
    engage_nolock(state, os_muted, "background");
}

void MuterEngine::engage_nolock(AppAudioState& state, bool os_muted, const char* reason) {
    if (state.is_muted_by_us) return;
    // Already silent for someone else's reason: leave it theirs.
    if (os_muted) return;

    state.original_mute_state = os_muted;
    MuteResult result = audio_manager_->mute(state.pid);
    if (result != MuteResult::APPLIED) {
        LOGW("Mute of %s (pid %u) %s.", state.process_name.c_str(), state.pid, mute_result_name(result));
        return;
    }
    state.is_muted_by_us = true;
    muted_pids_.insert(state.pid);
    log_event(LogLevel::ACTION_MUTE, "Mute", std::string("Muted (") + reason + ")", state.process_name, state.pid);
}

void MuterEngine::release_nolock(AppAudioState& state, const char* reason) {
    MuteResult result = audio_manager_->unmute(state.pid);
    if (result == MuteResult::FAILED) {
        // Keep ownership so the next tick retries.
        LOGW("Unmute of %s (pid %u) failed, will retry.", state.process_name.c_str(), state.pid);
        return;
    }
    clear_muted_flag_nolock(state);
    if (result == MuteResult::APPLIED) {
        log_event(LogLevel::ACTION_UNMUTE, "Unmute", std::string("Unmuted (") + reason + ")", state.process_name, state.pid);
    }
}

void MuterEngine::clear_muted_flag_nolock(AppAudioState& state) {
    state.is_muted_by_us = false;
    muted_pids_.erase(state.pid);
}

void MuterEngine::sweep_nolock(const std::set<uint32_t>& seen_pids, std::chrono::steady_clock::time_point now) {
    for (auto it = app_states_.begin(); it != app_states_.end();) {
        AppAudioState& state = it->second;
        if (seen_pids.count(state.pid)) {
            ++it;
            continue;
        }
        state.is_active = false;
        if (state.is_muted_by_us) {
            MuteResult result = audio_manager_->unmute(state.pid);
            if (result != MuteResult::APPLIED) {
                LOGW("Unmute of vanished %s (pid %u) %s.", state.process_name.c_str(), state.pid, mute_result_name(result));
            }
            clear_muted_flag_nolock(state);
            log_event(LogLevel::ACTION_UNMUTE, "Unmute", "Unmuted (session ended)", state.process_name, state.pid);
        }
        if (now - state.last_seen > options_.stale_threshold) {
            LOGD("Evicting %s (pid %u).", state.process_name.c_str(), state.pid);
            log_event(LogLevel::ACTION_EVICT, "Evict", "Stopped tracking", state.process_name, state.pid);
            it = app_states_.erase(it);
            continue;
        }
        ++it;
    }
}

void MuterEngine::unmute_all_nolock(const char* reason) {
    size_t released = 0;
    for (uint32_t pid : muted_pids_) {
        MuteResult result = audio_manager_->unmute(pid);
        if (result == MuteResult::APPLIED) {
            released++;
        } else {
            LOGW("Fail-safe unmute of pid %u %s.", pid, mute_result_name(result));
        }
    }
    muted_pids_.clear();
    for (auto& [pid, state] : app_states_) state.is_muted_by_us = false;

    LOGI("Unmuted %zu session(s): %s.", released, reason);
    log_event(LogLevel::EVENT, "Fail-safe", std::string("Unmuted all (") + reason + ")");
}

void MuterEngine::unmute_all() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    unmute_all_nolock("requested");
}

void MuterEngine::shutdown() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (shut_down_) return;
    unmute_all_nolock("shutdown");
    shut_down_ = true;
}

bool MuterEngine::is_shut_down() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return shut_down_;
}

size_t MuterEngine::active_count_nolock() const {
    size_t count = 0;
    for (const auto& [pid, state] : app_states_) {
        if (state.is_active) count++;
    }
    return count;
}

std::vector<AppAudioState> MuterEngine::get_app_states() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<AppAudioState> states;
    states.reserve(app_states_.size());
    for (const auto& [pid, state] : app_states_) states.push_back(state);
    return states;
}

std::vector<AppAudioState> MuterEngine::get_active_sessions() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<AppAudioState> states;
    for (const auto& [pid, state] : app_states_) {
        if (state.is_active) states.push_back(state);
    }
    return states;
}

bool MuterEngine::try_get_active_sessions(std::vector<AppAudioState>& out) const {
    std::unique_lock<std::mutex> lock(state_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) return false;
    out.clear();
    for (const auto& [pid, state] : app_states_) {
        if (state.is_active) out.push_back(state);
    }
    return true;
}

size_t MuterEngine::muted_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return muted_pids_.size();
}

bool MuterEngine::is_muted_by_us(uint32_t pid) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return muted_pids_.count(pid) > 0;
}

std::string MuterEngine::status_to_string(const AppAudioState& state) const {
    if (!state.is_active) return "INACTIVE";
    if (state.is_muted_by_us) return "MUTED_BY_US";
    if (policy_.is_excluded(state.process_name)) return "EXCLUDED";
    if (policy_.is_always_muted(state.process_name)) return "ALWAYS_MUTED";
    if (foreground_family_.count(state.pid)) return "FOREGROUND";
    return "PLAYING";
}

json MuterEngine::get_dashboard_payload() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto current = now();
    json payload;
    payload["muting_enabled"] = policy_.muting_enabled;
    payload["foreground_pid"] = foreground_pid_ ? json(*foreground_pid_) : json(nullptr);
    payload["muted_count"] = muted_pids_.size();
    payload["active_sessions"] = active_count_nolock();

    json sessions = json::array();
    for (const auto& [pid, state] : app_states_) {
        json session_json;
        session_json["pid"] = state.pid;
        session_json["process_name"] = state.process_name;
        session_json["display_name"] = state.display_name;
        session_json["is_muted_by_us"] = state.is_muted_by_us;
        session_json["original_mute_state"] = state.original_mute_state;
        session_json["is_active"] = state.is_active;
        session_json["last_seen_ms_ago"] =
            std::chrono::duration_cast<std::chrono::milliseconds>(current - state.last_seen).count();
        session_json["status"] = status_to_string(state);
        sessions.push_back(session_json);
    }
    payload["sessions"] = sessions;
    return payload;
}
