// daemon/cpp/main.cpp
#include "main.h"
#include "audio_manager.h"
#include "config_store.h"
#include "database_manager.h"
#include "foreground_tracker.h"
#include "logger.h"
#include "mute_service.h"
#include "muter_engine.h"
#include "platform_log.h"
#include "startup_manager.h"
#include "status_file.h"
#include "win_audio_enumerator.h"
#include "win_foreground_source.h"
#include "win_process_strategies.h"
#include "win_util.h"
#include <nlohmann/json.hpp>
#include <windows.h>
#include <shlobj.h>
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#define LOG_TAG "hushd_main"
#define LOGI(...) platform_log_print(PLATFORM_LOG_INFO, LOG_TAG, __VA_ARGS__)
#define LOGW(...) platform_log_print(PLATFORM_LOG_WARN, LOG_TAG, __VA_ARGS__)
#define LOGE(...) platform_log_print(PLATFORM_LOG_ERROR, LOG_TAG, __VA_ARGS__)

using json = nlohmann::json;
namespace fs = std::filesystem;

static std::atomic<bool> g_is_running = true;
static std::atomic<DWORD> g_main_thread_id = 0;
static HANDLE g_shutdown_complete = nullptr;
static thread_local std::unique_ptr<ComScope> g_worker_com;

static BOOL WINAPI console_ctrl_handler(DWORD ctrl_type) {
    LOGW("Console event %lu received, shutting down...", ctrl_type);
    g_is_running = false;
    // Wake the message pump; GetMessage would otherwise block forever.
    PostThreadMessageW(g_main_thread_id.load(), WM_QUIT, 0, 0);

    // After close/logoff/shutdown the process dies once this returns, so
    // hold it until the fail-safe has run.
    if (ctrl_type == CTRL_CLOSE_EVENT || ctrl_type == CTRL_LOGOFF_EVENT || ctrl_type == CTRL_SHUTDOWN_EVENT) {
        if (g_shutdown_complete) WaitForSingleObject(g_shutdown_complete, 4500);
    }
    return TRUE;
}

DaemonPaths resolve_daemon_paths() {
    DaemonPaths paths;
    PWSTR appdata = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_RoamingAppData, 0, nullptr, &appdata)) && appdata) {
        paths.data_dir = (fs::path(appdata) / "Hush").string();
    } else {
        paths.data_dir = (fs::temp_directory_path() / "Hush").string();
    }
    CoTaskMemFree(appdata);
    paths.db_path = (fs::path(paths.data_dir) / "hush.db").string();
    paths.log_dir = (fs::path(paths.data_dir) / "logs").string();
    paths.status_path = (fs::path(paths.data_dir) / "status.json").string();
    return paths;
}

static bool ensure_directories(const DaemonPaths& paths) {
    try {
        if (!fs::exists(paths.data_dir)) fs::create_directories(paths.data_dir);
        if (!fs::exists(paths.log_dir)) fs::create_directories(paths.log_dir);
    } catch (const fs::filesystem_error& e) {
        LOGE("Failed to create data dir: %s", e.what());
        return false;
    }
    return true;
}

static std::shared_ptr<ConfigStore> open_config(const DaemonPaths& paths) {
    if (!ensure_directories(paths)) return nullptr;
    try {
        auto db_manager = std::make_shared<DatabaseManager>(paths.db_path);
        return std::make_shared<ConfigStore>(db_manager);
    } catch (const std::exception& e) {
        LOGE("Cannot open database '%s': %s", paths.db_path.c_str(), e.what());
    }
    return nullptr;
}

int run_daemon(const DaemonPaths& paths) {
    LOGI("Hush daemon starting... (PID: %lu)", GetCurrentProcessId());

    HANDLE instance_mutex = CreateMutexW(nullptr, TRUE, L"Local\\hushd_single_instance");
    if (instance_mutex == nullptr || GetLastError() == ERROR_ALREADY_EXISTS) {
        LOGE("Another hushd instance is already running.");
        if (instance_mutex) CloseHandle(instance_mutex);
        return EXIT_FAILURE_FATAL;
    }

    ComScope com;
    if (!com.ok()) {
        CloseHandle(instance_mutex);
        return EXIT_FAILURE_FATAL;
    }

    auto config = open_config(paths);
    if (!config) {
        CloseHandle(instance_mutex);
        return EXIT_FAILURE_FATAL;
    }

    auto logger = Logger::get_instance(paths.log_dir);

    if (config->snapshot().start_with_windows != is_run_at_startup_enabled()) {
        if (!set_run_at_startup(config->snapshot().start_with_windows)) {
            LOGW("Could not apply start_with_windows setting.");
        }
    }

    std::shared_ptr<MuterEngine> engine;
    try {
        std::shared_ptr<ProcessIdentityResolver> resolver = make_windows_process_resolver();
        auto enumerator = std::make_shared<WinAudioEnumerator>(resolver);
        auto audio_manager = std::make_shared<AudioManager>(enumerator);
        auto tracker = std::make_unique<ForegroundTracker>(std::make_unique<WinForegroundSource>(),
                                                           std::make_unique<WinProcessFamilySource>());
        engine = std::make_shared<MuterEngine>(audio_manager, config, std::move(tracker), logger,
                                               MuterEngine::Options{.own_pid = GetCurrentProcessId()});
    } catch (const std::exception& e) {
        LOGE("Audio subsystem unavailable: %s", e.what());
        logger->log(LogLevel::ERR, "Daemon", std::string("Audio subsystem unavailable: ") + e.what());
        logger->stop();
        CloseHandle(instance_mutex);
        return EXIT_FAILURE_FATAL;
    }

    g_main_thread_id = GetCurrentThreadId();
    g_shutdown_complete = CreateEventW(nullptr, TRUE, FALSE, nullptr);
    MSG msg;
    // Creates this thread's message queue before anyone posts to it.
    PeekMessageW(&msg, nullptr, WM_USER, WM_USER, PM_NOREMOVE);
    SetConsoleCtrlHandler(console_ctrl_handler, TRUE);

    json last_signature;
    std::mutex status_mutex;
    MuteService::Hooks hooks;
    hooks.on_thread_start = [] { g_worker_com = std::make_unique<ComScope>(); };
    hooks.on_thread_stop = [] { g_worker_com.reset(); };
    hooks.on_tick = [&](const TickSummary&) {
        json payload = engine->get_dashboard_payload();
        json signature = status_signature(payload);
        std::lock_guard<std::mutex> lock(status_mutex);
        if (signature == last_signature) return;
        if (write_status_file(paths.status_path, payload)) last_signature = signature;
    };

    MuteService service(engine, config, hooks);
    logger->log(LogLevel::EVENT, "Daemon", "Daemon started");
    service.start();

    while (g_is_running && GetMessageW(&msg, nullptr, 0, 0) > 0) {
        TranslateMessage(&msg);
        DispatchMessageW(&msg);
    }
    g_is_running = false;

    service.stop();
    write_status_file(paths.status_path, engine->get_dashboard_payload());
    logger->log(LogLevel::EVENT, "Daemon", "Daemon stopped");
    logger->stop();

    SetEvent(g_shutdown_complete);
    CloseHandle(instance_mutex);
    LOGI("Hush daemon has shut down cleanly.");
    return EXIT_OK;
}

int command_status(const DaemonPaths& paths) {
    auto status = read_status_file(paths.status_path);
    if (!status) {
        std::cerr << "No status available (is hushd running?)" << std::endl;
        return EXIT_FAILURE_FATAL;
    }
    std::cout << status->dump(2) << std::endl;
    return EXIT_OK;
}

int command_sessions() {
    ComScope com;
    if (!com.ok()) return EXIT_FAILURE_FATAL;
    try {
        std::shared_ptr<ProcessIdentityResolver> resolver = make_windows_process_resolver();
        WinAudioEnumerator enumerator(resolver);
        json sessions = json::array();
        for (const auto& item : enumerator.enumerate()) {
            sessions.push_back({
                {"pid", item.session.process_id},
                {"process_name", item.session.process_name},
                {"display_name", item.session.display_name},
                {"is_muted", item.session.is_muted}
            });
        }
        std::cout << sessions.dump(2) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Audio subsystem unavailable: " << e.what() << std::endl;
        return EXIT_FAILURE_FATAL;
    }
    return EXIT_OK;
}

int command_set_muting(const DaemonPaths& paths, const std::string& mode) {
    auto config = open_config(paths);
    if (!config) return EXIT_FAILURE_FATAL;
    bool enabled;
    if (mode == "toggle") {
        enabled = config->toggle_muting();
    } else {
        enabled = (mode == "enable");
        config->set_muting_enabled(enabled);
    }
    std::cout << "Muting " << (enabled ? "enabled" : "disabled") << std::endl;
    return EXIT_OK;
}

int command_set_policy(const DaemonPaths& paths, const std::string& verb, const std::string& process_name) {
    auto config = open_config(paths);
    if (!config) return EXIT_FAILURE_FATAL;
    AppPolicy policy = AppPolicy::STANDARD;
    if (verb == "exclude") policy = AppPolicy::EXCLUDED;
    else if (verb == "always-mute") policy = AppPolicy::ALWAYS_MUTED;
    config->set_app_policy(process_name, policy);
    std::cout << process_name << ": " << app_policy_name(config->get_app_policy(process_name)) << std::endl;
    return EXIT_OK;
}

int command_policies(const DaemonPaths& paths) {
    auto config = open_config(paths);
    if (!config) return EXIT_FAILURE_FATAL;
    PolicySnapshot policy = config->snapshot();
    json out;
    out["muting_enabled"] = policy.muting_enabled;
    out["poll_interval_ms"] = policy.poll_interval_ms;
    out["start_with_windows"] = policy.start_with_windows;
    out["excluded_apps"] = policy.excluded_apps;
    out["always_muted_apps"] = policy.always_muted_apps;
    std::cout << out.dump(2) << std::endl;
    return EXIT_OK;
}

int command_interval(const DaemonPaths& paths, const std::string& value) {
    int interval_ms = 0;
    try {
        interval_ms = std::stoi(value);
    } catch (const std::exception&) {
        std::cerr << "Invalid interval: " << value << std::endl;
        return EXIT_USAGE;
    }
    auto config = open_config(paths);
    if (!config) return EXIT_FAILURE_FATAL;
    std::cout << "Poll interval: " << config->set_poll_interval_ms(interval_ms) << " ms" << std::endl;
    return EXIT_OK;
}

int command_autostart(const DaemonPaths& paths, const std::string& value) {
    if (value != "on" && value != "off") {
        print_usage();
        return EXIT_USAGE;
    }
    auto config = open_config(paths);
    if (!config) return EXIT_FAILURE_FATAL;
    bool enabled = (value == "on");
    config->set_start_with_windows(enabled);
    if (!set_run_at_startup(enabled)) {
        std::cerr << "Setting saved, but the Run entry could not be updated." << std::endl;
        return EXIT_FAILURE_FATAL;
    }
    std::cout << "Start with Windows: " << value << std::endl;
    return EXIT_OK;
}

int command_logs(const DaemonPaths& paths, int count) {
    if (!ensure_directories(paths)) return EXIT_FAILURE_FATAL;
    auto logger = Logger::get_instance(paths.log_dir);
    std::vector<LogEntry> entries;
    for (const auto& file : logger->get_log_files()) {
        int remaining = count - static_cast<int>(entries.size());
        if (remaining <= 0) break;
        auto chunk = logger->get_logs_from_file(file, remaining, std::nullopt, std::nullopt);
        entries.insert(entries.end(), chunk.begin(), chunk.end());
    }
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        std::cout << it->to_json().dump() << std::endl;
    }
    logger->stop();
    return EXIT_OK;
}

void print_usage() {
    std::cerr <<
        "usage: hushd [run [--verbose]]\n"
        "       hushd status | sessions | policies\n"
        "       hushd enable | disable | toggle\n"
        "       hushd exclude <exe> | always-mute <exe> | reset <exe>\n"
        "       hushd interval <ms>\n"
        "       hushd autostart on|off\n"
        "       hushd logs [count]\n";
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string command = args.empty() ? "run" : args[0];
    if (command == "--verbose") command = "run";

    for (const auto& arg : args) {
        if (arg == "--verbose") platform_log_set_min_priority(PLATFORM_LOG_DEBUG);
    }

    DaemonPaths paths = resolve_daemon_paths();

    if (command == "run") return run_daemon(paths);
    if (command == "status") return command_status(paths);
    if (command == "sessions") return command_sessions();
    if (command == "policies") return command_policies(paths);
    if (command == "enable" || command == "disable" || command == "toggle") return command_set_muting(paths, command);
    if (command == "exclude" || command == "always-mute" || command == "reset") {
        if (args.size() < 2 || args[1].empty()) {
            print_usage();
            return EXIT_USAGE;
        }
        return command_set_policy(paths, command, args[1]);
    }
    if (command == "interval") {
        if (args.size() < 2) {
            print_usage();
            return EXIT_USAGE;
        }
        return command_interval(paths, args[1]);
    }
    if (command == "autostart") {
        if (args.size() < 2) {
            print_usage();
            return EXIT_USAGE;
        }
        return command_autostart(paths, args[1]);
    }
    if (command == "logs") {
        int count = 50;
        if (args.size() >= 2) {
            try {
                count = std::stoi(args[1]);
            } catch (const std::exception&) {
                print_usage();
                return EXIT_USAGE;
            }
        }
        return command_logs(paths, count);
    }

    print_usage();
    return EXIT_USAGE;
}
