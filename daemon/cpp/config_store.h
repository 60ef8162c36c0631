// daemon/cpp/config_store.h
#ifndef HUSH_CONFIG_STORE_H
#define HUSH_CONFIG_STORE_H

#include <string>
#include <set>
#include <memory>
#include <shared_mutex>
#include <optional>
#include <cstdint>
#include "database_manager.h"

const int MIN_POLL_INTERVAL_MS = 100;
const int MAX_POLL_INTERVAL_MS = 2000;

struct PolicySnapshot {
    bool muting_enabled = true;
    std::set<std::string> excluded_apps;
    std::set<std::string> always_muted_apps;
    int poll_interval_ms = 500;
    bool start_with_windows = false;
    uint64_t version = 0;

    bool is_excluded(const std::string& process_name) const;
    bool is_always_muted(const std::string& process_name) const;
};

// In-memory policy shared between the polling thread and the front end.
// A null DatabaseManager keeps everything in memory.
class ConfigStore {
public:
    explicit ConfigStore(std::shared_ptr<DatabaseManager> db_manager = nullptr);

    PolicySnapshot snapshot() const;
    uint64_t version() const;

    void set_muting_enabled(bool enabled);
    bool toggle_muting();
    int set_poll_interval_ms(int interval_ms);
    void set_start_with_windows(bool enabled);

    void set_app_policy(const std::string& process_name, AppPolicy policy);
    void add_excluded_app(const std::string& process_name);
    void remove_excluded_app(const std::string& process_name);
    void add_always_muted_app(const std::string& process_name);
    void remove_always_muted_app(const std::string& process_name);
    AppPolicy get_app_policy(const std::string& process_name) const;

    // Re-reads the database when another connection committed to it.
    bool reload_if_changed();

    static int clamp_poll_interval(int interval_ms);

private:
    void load_from_database();
    void persist_master_config(const MasterConfig& config);
    bool set_app_policy_nolock(const std::string& key, AppPolicy policy);
    MasterConfig master_config_nolock() const;

    std::shared_ptr<DatabaseManager> db_manager_;
    mutable std::shared_mutex mutex_;
    PolicySnapshot policy_;
    std::optional<long long> last_data_version_;
};

#endif //HUSH_CONFIG_STORE_H
