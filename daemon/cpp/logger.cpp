// daemon/cpp/logger.cpp
#include "logger.h"
#include "platform_log.h"
#include <fstream>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <algorithm>
#include <map>
#include <vector>
#include <iterator>

#define LOG_TAG "hushd_logger"
#define LOGI(...) platform_log_print(PLATFORM_LOG_INFO, LOG_TAG, __VA_ARGS__)
#define LOGW(...) platform_log_print(PLATFORM_LOG_WARN, LOG_TAG, __VA_ARGS__)
#define LOGE(...) platform_log_print(PLATFORM_LOG_ERROR, LOG_TAG, __VA_ARGS__)
#define LOGD(...) platform_log_print(PLATFORM_LOG_DEBUG, LOG_TAG, __VA_ARGS__)

namespace fs = std::filesystem;

const int MAX_LOG_LINES_PER_FILE = 500;
const size_t MAX_LOG_FILES_PER_DAY = 3;
const size_t MAX_LOG_RETENTION_DAYS = 3;
const char* const LOG_FILE_PREFIX = "hush_";
const char* const LOG_FILE_SUFFIX = ".log";

static bool local_time_now(tm& out) {
    time_t now = time(nullptr);
#ifdef _WIN32
    return localtime_s(&out, &now) == 0;
#else
    return localtime_r(&now, &out) != nullptr;
#endif
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::INFO:          return "INFO";
        case LogLevel::SUCCESS:       return "SUCCESS";
        case LogLevel::WARN:          return "WARN";
        case LogLevel::ERR:           return "ERROR";
        case LogLevel::EVENT:         return "EVENT";
        case LogLevel::ACTION_MUTE:   return "MUTE";
        case LogLevel::ACTION_UNMUTE: return "UNMUTE";
        case LogLevel::ACTION_FOCUS:  return "FOCUS";
        case LogLevel::ACTION_EVICT:  return "EVICT";
        case LogLevel::REPORT:        return "REPORT";
    }
    return "UNKNOWN";
}

json LogEntry::to_json() const {
    json j = {
        {"timestamp", timestamp_ms},
        {"level", static_cast<int>(level)},
        {"level_name", log_level_name(level)},
        {"category", category},
        {"message", message},
    };
    if (!process_name.empty()) j["process_name"] = process_name;
    if (pid != -1) j["pid"] = pid;
    return j;
}

std::shared_ptr<Logger> Logger::instance_ = nullptr;
std::mutex Logger::instance_mutex_;

std::shared_ptr<Logger> Logger::get_instance(const std::string& log_dir_path) {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_) {
        struct make_shared_enabler : public Logger {
            make_shared_enabler(const std::string& path) : Logger(path) {}
        };
        instance_ = std::make_shared<make_shared_enabler>(log_dir_path);
    }
    return instance_;
}

Logger::Logger(const std::string& log_dir_path)
    : log_dir_path_(log_dir_path), is_running_(true) {
    std::error_code ec;
    if (!fs::exists(log_dir_path_, ec)) {
        fs::create_directories(log_dir_path_, ec);
        if (ec) LOGE("Failed to create log dir '%s': %s", log_dir_path_.c_str(), ec.message().c_str());
    }
    writer_thread_ = std::thread(&Logger::writer_thread_func, this);
}

Logger::~Logger() {
    stop();
}

void Logger::stop() {
    if (!is_running_.exchange(false)) return;
    cv_.notify_one();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
}

void Logger::log(LogLevel level, const std::string& category, const std::string& message,
                 const std::string& process_name, long long pid) {
    long long timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
    LogEntry entry{timestamp, level, category, message, process_name, pid};

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        log_queue_.push_back(std::move(entry));
    }
    cv_.notify_one();
}

void Logger::log_batch(const std::vector<LogEntry>& entries) {
    if (entries.empty()) return;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        for (const auto& entry : entries) {
            log_queue_.push_back(entry);
        }
    }
    cv_.notify_one();
}

std::vector<std::string> Logger::get_log_files() const {
    std::vector<std::string> files;
    try {
        for (const auto& entry : fs::directory_iterator(log_dir_path_)) {
            if (!entry.is_regular_file()) continue;
            std::string filename = entry.path().filename().string();
            const std::string suffix = LOG_FILE_SUFFIX;
            if (filename.rfind(LOG_FILE_PREFIX, 0) == 0 && filename.length() >= suffix.length() &&
                filename.compare(filename.length() - suffix.length(), suffix.length(), suffix) == 0) {
                files.push_back(filename);
            }
        }
    } catch (const fs::filesystem_error& e) {
        LOGE("Error listing log files: %s", e.what());
    }
    // hush_YYYY-MM-DD_N.log: sort by date, then numerically by N, newest first.
    std::sort(files.begin(), files.end(), [](const std::string& a, const std::string& b) {
        std::string date_a = a.substr(5, 10), date_b = b.substr(5, 10);
        if (date_a != date_b) return date_a > date_b;
        auto index_of = [](const std::string& f) {
            size_t us = f.rfind('_');
            size_t dot = f.rfind('.');
            try {
                return std::stoi(f.substr(us + 1, dot - us - 1));
            } catch (const std::exception&) {
                return 0;
            }
        };
        return index_of(a) > index_of(b);
    });
    return files;
}

std::vector<LogEntry> Logger::get_logs_from_file(const std::string& filename, int limit,
                                                 std::optional<long long> before_timestamp_ms,
                                                 std::optional<long long> since_timestamp_ms) const {
    std::vector<LogEntry> results;
    fs::path file_path = fs::path(log_dir_path_) / filename;

    if (!fs::exists(file_path)) {
        LOGW("Log file not found: %s", filename.c_str());
    } else {
        std::ifstream log_file(file_path);
        if (log_file.is_open()) {
            std::vector<std::string> lines;
            std::string line;
            while (std::getline(log_file, line)) {
                if (!line.empty()) lines.push_back(line);
            }

            for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
                if (limit > 0 && results.size() >= static_cast<size_t>(limit) && !since_timestamp_ms) break;
                try {
                    json j = json::parse(*it);
                    long long timestamp = j.value("ts", 0LL);
                    if (before_timestamp_ms.has_value() && timestamp >= before_timestamp_ms.value()) continue;
                    if (since_timestamp_ms.has_value() && timestamp <= since_timestamp_ms.value()) {
                        if (!before_timestamp_ms.has_value()) break;
                        else continue;
                    }
                    results.push_back({
                        .timestamp_ms = timestamp,
                        .level = static_cast<LogLevel>(j.value("lvl", 0)),
                        .category = j.value("cat", ""),
                        .message = j.value("msg", ""),
                        .process_name = j.value("proc", ""),
                        .pid = j.value("pid", -1LL)
                    });
                } catch (const json::exception& e) {
                    LOGD("Skipping malformed log line in %s: %s", filename.c_str(), e.what());
                }
            }
        }
    }

    if (since_timestamp_ms.has_value()) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            for (const auto& entry : log_queue_) {
                if (entry.timestamp_ms > since_timestamp_ms.value()) {
                    results.push_back(entry);
                }
            }
        }
        std::sort(results.begin(), results.end(), [](const auto& a, const auto& b) {
            return a.timestamp_ms > b.timestamp_ms;
        });
        if (limit > 0 && results.size() > static_cast<size_t>(limit)) {
            results.resize(limit);
        }
    }

    return results;
}

void Logger::manage_log_files() {
    auto files = get_log_files();
    std::map<std::string, std::vector<std::string>> files_by_day;

    for (const auto& f : files) {
        if (f.size() < 15) continue;
        files_by_day[f.substr(5, 10)].push_back(f);
    }

    std::error_code ec;
    for (auto& [day, day_files] : files_by_day) {
        // get_log_files() order is kept: newest first.
        if (day_files.size() > MAX_LOG_FILES_PER_DAY) {
            for (size_t i = MAX_LOG_FILES_PER_DAY; i < day_files.size(); ++i) {
                fs::remove(fs::path(log_dir_path_) / day_files[i], ec);
                LOGD("Cleaned up excess log file: %s", day_files[i].c_str());
            }
        }
    }

    if (files_by_day.size() > MAX_LOG_RETENTION_DAYS) {
        auto it = files_by_day.begin();
        size_t to_delete_count = files_by_day.size() - MAX_LOG_RETENTION_DAYS;
        for (size_t i = 0; i < to_delete_count; ++i) {
            for (const auto& f : it->second) {
                fs::remove(fs::path(log_dir_path_) / f, ec);
                LOGD("Cleaned up outdated day log file: %s", f.c_str());
            }
            it = files_by_day.erase(it);
        }
    }

    auto latest_files = get_log_files();
    if (latest_files.empty()) {
        current_log_file_path_ = "";
        current_log_line_count_ = 0;
    } else {
        current_log_file_path_ = (fs::path(log_dir_path_) / latest_files[0]).string();
        std::ifstream ifs(current_log_file_path_);
        current_log_line_count_ = std::count(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>(), '\n');
    }
}

void Logger::rotate_log_file_if_needed(size_t new_entries_count) {
    tm ltm = {};
    local_time_now(ltm);
    char date_buf[16];
    strftime(date_buf, sizeof(date_buf), "%Y-%m-%d", &ltm);
    std::string current_date_str(date_buf);

    auto current_file_fits = [&]() {
        return !current_log_file_path_.empty() &&
               current_log_file_path_.find(current_date_str) != std::string::npos &&
               current_log_line_count_ + static_cast<long long>(new_entries_count) <= MAX_LOG_LINES_PER_FILE;
    };

    if (current_file_fits()) return;

    manage_log_files();
    if (current_file_fits()) return;

    auto files = get_log_files();
    int next_index = 1;
    if (!files.empty() && files[0].find(current_date_str) != std::string::npos) {
        const std::string& last_file = files[0];
        size_t underscore_pos = last_file.rfind('_');
        size_t dot_pos = last_file.rfind('.');
        try {
            next_index = std::stoi(last_file.substr(underscore_pos + 1, dot_pos - underscore_pos - 1)) + 1;
        } catch (const std::exception&) {
            next_index = 1;
        }
    }
    std::string new_filename = std::string(LOG_FILE_PREFIX) + current_date_str + "_" + std::to_string(next_index) + LOG_FILE_SUFFIX;
    current_log_file_path_ = (fs::path(log_dir_path_) / new_filename).string();
    current_log_line_count_ = 0;
    LOGI("Rotating to new log file: %s", new_filename.c_str());
}

void Logger::writer_thread_func() {
    manage_log_files();

    while (true) {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        cv_.wait(lock, [this]{ return !log_queue_.empty() || !is_running_; });

        if (!is_running_ && log_queue_.empty()) break;

        std::deque<LogEntry> temp_queue;
        temp_queue.swap(log_queue_);
        lock.unlock();

        // Large drains are split so no file grows past MAX_LOG_LINES_PER_FILE.
        while (!temp_queue.empty()) {
            size_t chunk = std::min(temp_queue.size(), static_cast<size_t>(MAX_LOG_LINES_PER_FILE));
            rotate_log_file_if_needed(chunk);

            std::ofstream log_file(current_log_file_path_, std::ios_base::app);
            if (!log_file.is_open()) {
                LOGE("Failed to open log file for writing: %s", current_log_file_path_.c_str());
                break;
            }

            for (size_t i = 0; i < chunk; ++i) {
                const LogEntry& entry = temp_queue.front();
                json file_json = {
                    {"ts", entry.timestamp_ms}, {"lvl", static_cast<int>(entry.level)},
                    {"cat", entry.category}, {"msg", entry.message}
                };
                if (!entry.process_name.empty()) file_json["proc"] = entry.process_name;
                if (entry.pid != -1) file_json["pid"] = entry.pid;
                log_file << file_json.dump() << '\n';
                temp_queue.pop_front();
            }
            log_file.flush();
            current_log_line_count_ += static_cast<long long>(chunk);
        }
    }
}
