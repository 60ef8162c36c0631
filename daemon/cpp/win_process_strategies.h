// daemon/cpp/win_process_strategies.h
#ifndef HUSH_WIN_PROCESS_STRATEGIES_H
#define HUSH_WIN_PROCESS_STRATEGIES_H

#include "process_resolver.h"

// OpenProcess(QUERY_INFORMATION | VM_READ) + GetModuleFileNameExW.
// Works for ordinary user processes.
class ModuleFileNameStrategy : public ProcessNameStrategy {
public:
    std::optional<std::string> lookup(uint32_t pid) override;
    const char* name() const override { return "module_file_name"; }
};

// OpenProcess(QUERY_LIMITED_INFORMATION) + QueryFullProcessImageNameW.
// Still allowed on protected and elevated processes.
class ImageNameStrategy : public ProcessNameStrategy {
public:
    std::optional<std::string> lookup(uint32_t pid) override;
    const char* name() const override { return "image_name"; }
};

std::unique_ptr<ProcessIdentityResolver> make_windows_process_resolver();

#endif //HUSH_WIN_PROCESS_STRATEGIES_H
