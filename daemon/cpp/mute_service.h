// daemon/cpp/mute_service.h
#ifndef HUSH_MUTE_SERVICE_H
#define HUSH_MUTE_SERVICE_H

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include "muter_engine.h"
#include "config_store.h"

// Drives MuterEngine::tick() on a background thread.
class MuteService {
public:
    struct Hooks {
        std::function<void()> on_thread_start;
        std::function<void()> on_thread_stop;
        std::function<void(const TickSummary&)> on_tick;
    };

    MuteService(std::shared_ptr<MuterEngine> engine, std::shared_ptr<ConfigStore> config, Hooks hooks = {});
    ~MuteService();

    MuteService(const MuteService&) = delete;
    MuteService& operator=(const MuteService&) = delete;

    void start();
    // Joins the polling thread, then runs the engine fail-safe.
    void stop();
    // Cuts the current sleep short.
    void wake();

    bool is_running() const { return is_running_.load(); }
    uint64_t tick_count() const { return tick_count_.load(); }

private:
    void worker_thread_func();

    std::shared_ptr<MuterEngine> engine_;
    std::shared_ptr<ConfigStore> config_;
    Hooks hooks_;

    std::thread worker_thread_;
    std::atomic<bool> is_running_{false};
    std::atomic<uint64_t> tick_count_{0};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool wake_requested_ = false;
    bool stopped_ = false;
};

#endif //HUSH_MUTE_SERVICE_H
