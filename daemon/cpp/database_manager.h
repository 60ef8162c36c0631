// daemon/cpp/database_manager.h
#ifndef HUSH_DATABASE_MANAGER_H
#define HUSH_DATABASE_MANAGER_H

#include <string>
#include <vector>
#include <optional>
#include <SQLiteCpp/Database.h>
#include <SQLiteCpp/Statement.h>
#include <SQLiteCpp/Transaction.h>

// Bump when the schema changes and add a step to the migration ladder.
const int DATABASE_VERSION = 1;

enum class AppPolicy {
    STANDARD = 0,
    EXCLUDED = 1,
    ALWAYS_MUTED = 2
};

const char* app_policy_name(AppPolicy policy);

struct AppPolicyRecord {
    std::string process_name;
    AppPolicy policy = AppPolicy::STANDARD;
};

struct MasterConfig {
    bool muting_enabled = true;
    int poll_interval_ms = 500;
    bool start_with_windows = false;
};

class DatabaseManager {
public:
    // Throws SQLite::Exception when the file cannot be opened.
    explicit DatabaseManager(const std::string& db_path);

    std::optional<MasterConfig> get_master_config();
    bool set_master_config(const MasterConfig& config);

    std::optional<AppPolicy> get_app_policy(const std::string& process_name);
    // STANDARD removes the row.
    bool set_app_policy(const std::string& process_name, AppPolicy policy);
    std::vector<AppPolicyRecord> get_all_app_policies();

    // Changes whenever another connection commits to the file.
    std::optional<long long> get_data_version();

private:
    void initialize_and_migrate_database();
    int get_db_version();
    void set_db_version(int version);

    SQLite::Database db_;
};

#endif //HUSH_DATABASE_MANAGER_H
