// daemon/cpp/foreground_tracker.h
#ifndef HUSH_FOREGROUND_TRACKER_H
#define HUSH_FOREGROUND_TRACKER_H

#include <set>
#include <memory>
#include <optional>
#include <vector>
#include <cstdint>

class ForegroundSource {
public:
    virtual ~ForegroundSource() = default;
    // Pid owning the focused top-level window, if any.
    virtual std::optional<uint32_t> query_foreground_pid() = 0;
};

// Related processes that play audio on behalf of a window owner
// (browser renderers, launcher children).
class ProcessFamilySource {
public:
    virtual ~ProcessFamilySource() = default;
    virtual std::set<uint32_t> family_of(uint32_t pid) = 0;
};

struct ProcessEntry {
    uint32_t pid = 0;
    uint32_t parent_pid = 0;
    // Creation time in any monotonic unit; unset when the process is not
    // accessible.
    std::optional<uint64_t> created;
};

// Parent and direct children of pid. A parent/child link is kept only when
// both creation times are known and the parent is not younger than the
// child, so a pid reused after the real parent exited is never included.
std::set<uint32_t> collect_family(uint32_t pid, const std::vector<ProcessEntry>& processes);

struct ForegroundSample {
    std::optional<uint32_t> pid;
    bool changed = false;
    // pid plus its family; empty when pid is unknown.
    std::set<uint32_t> family;
};

class ForegroundTracker {
public:
    explicit ForegroundTracker(std::unique_ptr<ForegroundSource> source,
                               std::unique_ptr<ProcessFamilySource> family_source = nullptr);

    std::optional<uint32_t> poll();
    // New pid on a transition, nullopt otherwise.
    std::optional<uint32_t> check_change();
    ForegroundSample sample();
    // Re-queries the family of the current owner, for helpers that were
    // spawned after it took focus.
    const std::set<uint32_t>& refresh_family();

    std::optional<uint32_t> last_foreground() const { return last_pid_; }

private:
    void recompute_family();

    std::unique_ptr<ForegroundSource> source_;
    std::unique_ptr<ProcessFamilySource> family_source_;
    std::optional<uint32_t> last_pid_;
    std::set<uint32_t> last_family_;
};

#endif //HUSH_FOREGROUND_TRACKER_H
