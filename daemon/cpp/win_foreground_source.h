// daemon/cpp/win_foreground_source.h
#ifndef HUSH_WIN_FOREGROUND_SOURCE_H
#define HUSH_WIN_FOREGROUND_SOURCE_H

#include "foreground_tracker.h"

class WinForegroundSource : public ForegroundSource {
public:
    std::optional<uint32_t> query_foreground_pid() override;
};

// Parent and direct children from a Toolhelp32 snapshot.
class WinProcessFamilySource : public ProcessFamilySource {
public:
    std::set<uint32_t> family_of(uint32_t pid) override;
};

#endif //HUSH_WIN_FOREGROUND_SOURCE_H
