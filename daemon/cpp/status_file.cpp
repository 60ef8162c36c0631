// daemon/cpp/status_file.cpp
#include "status_file.h"
#include "platform_log.h"
#include <filesystem>
#include <fstream>

#define LOG_TAG "hushd_status"
#define LOGW(...) platform_log_print(PLATFORM_LOG_WARN, LOG_TAG, __VA_ARGS__)
#define LOGE(...) platform_log_print(PLATFORM_LOG_ERROR, LOG_TAG, __VA_ARGS__)

namespace fs = std::filesystem;

bool write_status_file(const std::string& path, const json& payload) {
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream ofs(tmp_path, std::ios::trunc);
        if (!ofs.is_open()) {
            LOGE("Failed to open '%s' for writing.", tmp_path.c_str());
            return false;
        }
        ofs << payload.dump(2) << '\n';
        if (!ofs.good()) {
            LOGE("Failed to write '%s'.", tmp_path.c_str());
            return false;
        }
    }
    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        LOGE("Failed to replace '%s': %s", path.c_str(), ec.message().c_str());
        fs::remove(tmp_path, ec);
        return false;
    }
    return true;
}

std::optional<json> read_status_file(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) return std::nullopt;
    try {
        return json::parse(ifs);
    } catch (const json::exception& e) {
        LOGW("Corrupt status file '%s': %s", path.c_str(), e.what());
    }
    return std::nullopt;
}

json status_signature(const json& payload) {
    json signature = payload;
    if (signature.contains("sessions") && signature["sessions"].is_array()) {
        for (auto& session : signature["sessions"]) session.erase("last_seen_ms_ago");
    }
    return signature;
}
