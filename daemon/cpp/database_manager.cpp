// daemon/cpp/database_manager.cpp
#include "database_manager.h"
#include "platform_log.h"
#include <algorithm>
#include <cctype>

#define LOG_TAG "hushd_db"
#define LOGI(...) platform_log_print(PLATFORM_LOG_INFO, LOG_TAG, __VA_ARGS__)
#define LOGE(...) platform_log_print(PLATFORM_LOG_ERROR, LOG_TAG, __VA_ARGS__)

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const char* app_policy_name(AppPolicy policy) {
    switch (policy) {
        case AppPolicy::STANDARD:     return "standard";
        case AppPolicy::EXCLUDED:     return "excluded";
        case AppPolicy::ALWAYS_MUTED: return "always_muted";
    }
    return "unknown";
}

DatabaseManager::DatabaseManager(const std::string& db_path)
    : db_(db_path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE) {
    LOGI("Database opened at %s", db_path.c_str());
    db_.setBusyTimeout(2000);
    initialize_and_migrate_database();
}

void DatabaseManager::initialize_and_migrate_database() {
    try {
        int current_version = get_db_version();
        LOGI("Current database version: %d. Target version: %d.", current_version, DATABASE_VERSION);

        if (current_version >= DATABASE_VERSION) {
            LOGI("Database is up to date.");
            return;
        }

        LOGI("Database schema is outdated. Starting migration process...");
        SQLite::Transaction transaction(db_);

        // Fall-through ladder: each case upgrades one version.
        switch (current_version) {
            case 0:
                LOGI("Migrating from v0 -> v1: Creating initial tables.");
                db_.exec(R"(
                    CREATE TABLE IF NOT EXISTS master_config (
                        key TEXT PRIMARY KEY,
                        value INTEGER NOT NULL
                    )
                )");
                db_.exec(R"(
                    CREATE TABLE IF NOT EXISTS app_policies (
                        process_name TEXT PRIMARY KEY,
                        policy INTEGER NOT NULL DEFAULT 0
                    )
                )");
                db_.exec("INSERT OR IGNORE INTO master_config (key, value) VALUES ('muting_enabled', 1)");
                db_.exec("INSERT OR IGNORE INTO master_config (key, value) VALUES ('poll_interval_ms', 500)");
                db_.exec("INSERT OR IGNORE INTO master_config (key, value) VALUES ('start_with_windows', 0)");
        }

        set_db_version(DATABASE_VERSION);
        transaction.commit();
        LOGI("Database migration successful. New version: %d", DATABASE_VERSION);
    } catch (const std::exception& e) {
        LOGE("Database migration failed: %s. Transaction will be rolled back.", e.what());
    }
}

int DatabaseManager::get_db_version() {
    return db_.execAndGet("PRAGMA user_version;").getInt();
}

void DatabaseManager::set_db_version(int version) {
    db_.exec("PRAGMA user_version = " + std::to_string(version));
}

std::optional<long long> DatabaseManager::get_data_version() {
    try {
        return db_.execAndGet("PRAGMA data_version;").getInt64();
    } catch (const std::exception& e) {
        LOGE("Failed to read data_version: %s", e.what());
    }
    return std::nullopt;
}

std::optional<MasterConfig> DatabaseManager::get_master_config() {
    try {
        MasterConfig config;
        SQLite::Statement query(db_, "SELECT key, value FROM master_config");
        while (query.executeStep()) {
            std::string key = query.getColumn(0).getString();
            int value = query.getColumn(1).getInt();
            if (key == "muting_enabled") config.muting_enabled = (value != 0);
            else if (key == "poll_interval_ms") config.poll_interval_ms = value;
            else if (key == "start_with_windows") config.start_with_windows = (value != 0);
        }
        return config;
    } catch (const std::exception& e) {
        LOGE("Failed to get master config: %s", e.what());
    }
    return std::nullopt;
}

bool DatabaseManager::set_master_config(const MasterConfig& config) {
    try {
        SQLite::Transaction transaction(db_);
        SQLite::Statement upsert(db_, "INSERT OR REPLACE INTO master_config (key, value) VALUES (?, ?)");
        const std::pair<const char*, int> rows[] = {
            {"muting_enabled", config.muting_enabled ? 1 : 0},
            {"poll_interval_ms", config.poll_interval_ms},
            {"start_with_windows", config.start_with_windows ? 1 : 0},
        };
        for (const auto& [key, value] : rows) {
            upsert.bind(1, key);
            upsert.bind(2, value);
            upsert.exec();
            upsert.reset();
        }
        transaction.commit();
        return true;
    } catch (const std::exception& e) {
        LOGE("Failed to set master config: %s", e.what());
        return false;
    }
}

std::optional<AppPolicy> DatabaseManager::get_app_policy(const std::string& process_name) {
    try {
        SQLite::Statement query(db_, "SELECT policy FROM app_policies WHERE process_name = ?");
        query.bind(1, lowercase(process_name));
        if (query.executeStep()) {
            return static_cast<AppPolicy>(query.getColumn(0).getInt());
        }
        return AppPolicy::STANDARD;
    } catch (const std::exception& e) {
        LOGE("Failed to get app policy for '%s': %s", process_name.c_str(), e.what());
    }
    return std::nullopt;
}

bool DatabaseManager::set_app_policy(const std::string& process_name, AppPolicy policy) {
    const std::string key = lowercase(process_name);
    if (key.empty()) return false;
    try {
        if (policy == AppPolicy::STANDARD) {
            SQLite::Statement del(db_, "DELETE FROM app_policies WHERE process_name = ?");
            del.bind(1, key);
            del.exec();
            return true;
        }
        SQLite::Statement query(db_, R"(
            INSERT INTO app_policies (process_name, policy) VALUES (?, ?)
            ON CONFLICT(process_name) DO UPDATE SET policy = excluded.policy
        )");
        query.bind(1, key);
        query.bind(2, static_cast<int>(policy));
        return query.exec() > 0;
    } catch (const std::exception& e) {
        LOGE("Failed to set app policy for '%s': %s", key.c_str(), e.what());
        return false;
    }
}

std::vector<AppPolicyRecord> DatabaseManager::get_all_app_policies() {
    std::vector<AppPolicyRecord> records;
    try {
        SQLite::Statement query(db_, "SELECT process_name, policy FROM app_policies ORDER BY process_name");
        while (query.executeStep()) {
            AppPolicyRecord record;
            record.process_name = query.getColumn(0).getString();
            record.policy = static_cast<AppPolicy>(query.getColumn(1).getInt());
            records.push_back(record);
        }
    } catch (const std::exception& e) {
        LOGE("Failed to get all app policies: %s", e.what());
    }
    return records;
}
