// daemon/cpp/startup_manager.h
#ifndef HUSH_STARTUP_MANAGER_H
#define HUSH_STARTUP_MANAGER_H

#include <string>

// HKCU\Software\Microsoft\Windows\CurrentVersion\Run\Hush
bool set_run_at_startup(bool enabled);
bool is_run_at_startup_enabled();
std::wstring current_executable_path();

#endif //HUSH_STARTUP_MANAGER_H
