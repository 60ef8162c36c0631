// daemon/cpp/foreground_tracker.cpp
#include "foreground_tracker.h"
#include "platform_log.h"
#include <map>

#define LOG_TAG "hushd_foreground"
#define LOGD(...) platform_log_print(PLATFORM_LOG_DEBUG, LOG_TAG, __VA_ARGS__)

ForegroundTracker::ForegroundTracker(std::unique_ptr<ForegroundSource> source,
                                     std::unique_ptr<ProcessFamilySource> family_source)
    : source_(std::move(source)), family_source_(std::move(family_source)) {}

std::optional<uint32_t> ForegroundTracker::poll() {
    return source_->query_foreground_pid();
}

void ForegroundTracker::recompute_family() {
    last_family_.clear();
    if (!last_pid_) return;
    if (family_source_) last_family_ = family_source_->family_of(*last_pid_);
    last_family_.insert(*last_pid_);
}

std::set<uint32_t> collect_family(uint32_t pid, const std::vector<ProcessEntry>& processes) {
    std::map<uint32_t, const ProcessEntry*> by_pid;
    for (const auto& entry : processes) by_pid[entry.pid] = &entry;

    std::set<uint32_t> family;
    auto self = by_pid.find(pid);
    if (self == by_pid.end() || !self->second->created) return family;
    uint64_t self_created = *self->second->created;

    auto parent = by_pid.find(self->second->parent_pid);
    // pids 0 and 4 are the idle and System processes.
    if (self->second->parent_pid > 4 && parent != by_pid.end() && parent->second->created &&
        *parent->second->created <= self_created) {
        family.insert(parent->first);
    }
    for (const auto& entry : processes) {
        if (entry.pid == pid || entry.parent_pid != pid) continue;
        if (entry.created && *entry.created >= self_created) family.insert(entry.pid);
    }
    return family;
}

const std::set<uint32_t>& ForegroundTracker::refresh_family() {
    recompute_family();
    return last_family_;
}

ForegroundSample ForegroundTracker::sample() {
    ForegroundSample result;
    result.pid = poll();
    // An unknown foreground (desktop, lock screen, transient) keeps the last
    // known owner rather than muting it.
    if (result.pid && result.pid != last_pid_) {
        LOGD("Foreground changed: %d -> %u", last_pid_ ? static_cast<int>(*last_pid_) : -1, *result.pid);
        last_pid_ = result.pid;
        recompute_family();
        result.changed = true;
    }
    result.pid = last_pid_;
    result.family = last_family_;
    return result;
}

std::optional<uint32_t> ForegroundTracker::check_change() {
    ForegroundSample s = sample();
    return s.changed ? s.pid : std::nullopt;
}
