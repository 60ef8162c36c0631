// daemon/cpp/mute_service.cpp
#include "mute_service.h"
#include "platform_log.h"
#include <chrono>

#define LOG_TAG "hushd_service"
#define LOGI(...) platform_log_print(PLATFORM_LOG_INFO, LOG_TAG, __VA_ARGS__)
#define LOGE(...) platform_log_print(PLATFORM_LOG_ERROR, LOG_TAG, __VA_ARGS__)
#define LOGD(...) platform_log_print(PLATFORM_LOG_DEBUG, LOG_TAG, __VA_ARGS__)

MuteService::MuteService(std::shared_ptr<MuterEngine> engine, std::shared_ptr<ConfigStore> config, Hooks hooks)
    : engine_(std::move(engine)), config_(std::move(config)), hooks_(std::move(hooks)) {}

MuteService::~MuteService() {
    stop();
}

void MuteService::start() {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    if (is_running_ || stopped_) return;
    is_running_ = true;
    worker_thread_ = std::thread(&MuteService::worker_thread_func, this);
}

void MuteService::wake() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        wake_requested_ = true;
    }
    wake_cv_.notify_all();
}

void MuteService::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (stopped_) return;
        stopped_ = true;
        is_running_ = false;
    }
    wake_cv_.notify_all();
    if (worker_thread_.joinable()) worker_thread_.join();

    // Only after the loop is gone, so nothing can re-mute behind the fail-safe.
    engine_->shutdown();
    LOGI("Mute service stopped.");
}

void MuteService::worker_thread_func() {
    LOGI("Worker thread started.");
    if (hooks_.on_thread_start) hooks_.on_thread_start();

    while (is_running_) {
        try {
            config_->reload_if_changed();
            TickSummary summary = engine_->tick();
            tick_count_++;
            LOGD("Tick: fg=%d changed=%d refreshed=%d active=%zu muted=%zu",
                 summary.foreground_pid ? static_cast<int>(*summary.foreground_pid) : -1,
                 summary.foreground_changed, summary.refreshed,
                 summary.active_sessions, summary.muted_count);
            if (hooks_.on_tick) hooks_.on_tick(summary);
        } catch (const std::exception& e) {
            LOGE("Tick failed: %s", e.what());
        }

        int interval_ms = config_->snapshot().poll_interval_ms;
        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, std::chrono::milliseconds(interval_ms),
                          [this] { return wake_requested_ || !is_running_; });
        wake_requested_ = false;
    }

    if (hooks_.on_thread_stop) hooks_.on_thread_stop();
    LOGI("Worker thread finished.");
}
