// daemon/cpp/config_store.cpp
#include "config_store.h"
#include "process_resolver.h"
#include "platform_log.h"
#include <algorithm>
#include <mutex>

#define LOG_TAG "hushd_config"
#define LOGI(...) platform_log_print(PLATFORM_LOG_INFO, LOG_TAG, __VA_ARGS__)
#define LOGW(...) platform_log_print(PLATFORM_LOG_WARN, LOG_TAG, __VA_ARGS__)

bool PolicySnapshot::is_excluded(const std::string& process_name) const {
    return excluded_apps.count(to_lower_ascii(process_name)) > 0;
}

bool PolicySnapshot::is_always_muted(const std::string& process_name) const {
    return always_muted_apps.count(to_lower_ascii(process_name)) > 0;
}

ConfigStore::ConfigStore(std::shared_ptr<DatabaseManager> db_manager)
    : db_manager_(std::move(db_manager)) {
    if (db_manager_) {
        last_data_version_ = db_manager_->get_data_version();
        load_from_database();
    }
}

int ConfigStore::clamp_poll_interval(int interval_ms) {
    return std::clamp(interval_ms, MIN_POLL_INTERVAL_MS, MAX_POLL_INTERVAL_MS);
}

void ConfigStore::load_from_database() {
    auto master = db_manager_->get_master_config();
    auto rules = db_manager_->get_all_app_policies();

    std::unique_lock lock(mutex_);
    if (master) {
        policy_.muting_enabled = master->muting_enabled;
        policy_.poll_interval_ms = clamp_poll_interval(master->poll_interval_ms);
        policy_.start_with_windows = master->start_with_windows;
    } else {
        LOGW("Master config unavailable, keeping in-memory values.");
    }
    policy_.excluded_apps.clear();
    policy_.always_muted_apps.clear();
    for (const auto& rule : rules) {
        if (rule.policy == AppPolicy::EXCLUDED) policy_.excluded_apps.insert(to_lower_ascii(rule.process_name));
        else if (rule.policy == AppPolicy::ALWAYS_MUTED) policy_.always_muted_apps.insert(to_lower_ascii(rule.process_name));
    }
    policy_.version++;
    LOGI("Policy loaded: muting %s, interval %d ms, %zu excluded, %zu always muted.",
         policy_.muting_enabled ? "on" : "off", policy_.poll_interval_ms,
         policy_.excluded_apps.size(), policy_.always_muted_apps.size());
}

bool ConfigStore::reload_if_changed() {
    if (!db_manager_) return false;
    auto data_version = db_manager_->get_data_version();
    if (!data_version || data_version == last_data_version_) return false;
    last_data_version_ = data_version;
    load_from_database();
    return true;
}

PolicySnapshot ConfigStore::snapshot() const {
    std::shared_lock lock(mutex_);
    return policy_;
}

uint64_t ConfigStore::version() const {
    std::shared_lock lock(mutex_);
    return policy_.version;
}

MasterConfig ConfigStore::master_config_nolock() const {
    return MasterConfig{
        .muting_enabled = policy_.muting_enabled,
        .poll_interval_ms = policy_.poll_interval_ms,
        .start_with_windows = policy_.start_with_windows
    };
}

void ConfigStore::persist_master_config(const MasterConfig& config) {
    if (db_manager_ && !db_manager_->set_master_config(config)) {
        LOGW("Failed to persist master config.");
    }
}

void ConfigStore::set_muting_enabled(bool enabled) {
    MasterConfig config;
    {
        std::unique_lock lock(mutex_);
        if (policy_.muting_enabled == enabled) return;
        policy_.muting_enabled = enabled;
        policy_.version++;
        config = master_config_nolock();
    }
    persist_master_config(config);
}

bool ConfigStore::toggle_muting() {
    MasterConfig config;
    {
        std::unique_lock lock(mutex_);
        policy_.muting_enabled = !policy_.muting_enabled;
        policy_.version++;
        config = master_config_nolock();
    }
    persist_master_config(config);
    return config.muting_enabled;
}

int ConfigStore::set_poll_interval_ms(int interval_ms) {
    const int clamped = clamp_poll_interval(interval_ms);
    MasterConfig config;
    {
        std::unique_lock lock(mutex_);
        if (policy_.poll_interval_ms == clamped) return clamped;
        policy_.poll_interval_ms = clamped;
        policy_.version++;
        config = master_config_nolock();
    }
    persist_master_config(config);
    return clamped;
}

void ConfigStore::set_start_with_windows(bool enabled) {
    MasterConfig config;
    {
        std::unique_lock lock(mutex_);
        if (policy_.start_with_windows == enabled) return;
        policy_.start_with_windows = enabled;
        policy_.version++;
        config = master_config_nolock();
    }
    persist_master_config(config);
}

bool ConfigStore::set_app_policy_nolock(const std::string& key, AppPolicy policy) {
    bool was_excluded = policy_.excluded_apps.count(key) > 0;
    bool was_always_muted = policy_.always_muted_apps.count(key) > 0;
    bool want_excluded = policy == AppPolicy::EXCLUDED;
    bool want_always_muted = policy == AppPolicy::ALWAYS_MUTED;
    if (was_excluded == want_excluded && was_always_muted == want_always_muted) return false;

    policy_.excluded_apps.erase(key);
    policy_.always_muted_apps.erase(key);
    if (want_excluded) policy_.excluded_apps.insert(key);
    if (want_always_muted) policy_.always_muted_apps.insert(key);
    policy_.version++;
    return true;
}

void ConfigStore::set_app_policy(const std::string& process_name, AppPolicy policy) {
    const std::string key = to_lower_ascii(process_name);
    if (key.empty()) return;
    {
        std::unique_lock lock(mutex_);
        if (!set_app_policy_nolock(key, policy)) return;
    }
    LOGI("Policy for '%s' set to %s.", key.c_str(), app_policy_name(policy));
    if (db_manager_ && !db_manager_->set_app_policy(key, policy)) {
        LOGW("Failed to persist policy for '%s'.", key.c_str());
    }
}

AppPolicy ConfigStore::get_app_policy(const std::string& process_name) const {
    const std::string key = to_lower_ascii(process_name);
    std::shared_lock lock(mutex_);
    if (policy_.excluded_apps.count(key)) return AppPolicy::EXCLUDED;
    if (policy_.always_muted_apps.count(key)) return AppPolicy::ALWAYS_MUTED;
    return AppPolicy::STANDARD;
}

void ConfigStore::add_excluded_app(const std::string& process_name) {
    set_app_policy(process_name, AppPolicy::EXCLUDED);
}

void ConfigStore::remove_excluded_app(const std::string& process_name) {
    if (get_app_policy(process_name) == AppPolicy::EXCLUDED) set_app_policy(process_name, AppPolicy::STANDARD);
}

void ConfigStore::add_always_muted_app(const std::string& process_name) {
    set_app_policy(process_name, AppPolicy::ALWAYS_MUTED);
}

void ConfigStore::remove_always_muted_app(const std::string& process_name) {
    if (get_app_policy(process_name) == AppPolicy::ALWAYS_MUTED) set_app_policy(process_name, AppPolicy::STANDARD);
}
