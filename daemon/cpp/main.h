// daemon/cpp/main.h
#ifndef HUSH_MAIN_H
#define HUSH_MAIN_H

#include <string>
#include <vector>

enum ExitCode {
    EXIT_OK = 0,
    EXIT_FAILURE_FATAL = 1,
    EXIT_USAGE = 2
};

struct DaemonPaths {
    std::string data_dir;
    std::string db_path;
    std::string log_dir;
    std::string status_path;
};

DaemonPaths resolve_daemon_paths();

int run_daemon(const DaemonPaths& paths);
int command_status(const DaemonPaths& paths);
int command_sessions();
int command_set_muting(const DaemonPaths& paths, const std::string& mode);
int command_set_policy(const DaemonPaths& paths, const std::string& verb, const std::string& process_name);
int command_policies(const DaemonPaths& paths);
int command_interval(const DaemonPaths& paths, const std::string& value);
int command_autostart(const DaemonPaths& paths, const std::string& value);
int command_logs(const DaemonPaths& paths, int count);
void print_usage();

#endif //HUSH_MAIN_H
