
#include "poller.hpp"
#include <spdlog/spdlog.h>

NotificationPoller::NotificationPoller(NotificationManager& manager, NotificationSink& sink,
                                       std::chrono::milliseconds interval)
    : manager_(manager), sink_(sink), interval_(interval) {}

NotificationPoller::~NotificationPoller() {
    stop();
    // Only left joinable when destroyed from inside the loop itself
    if (poller_thread_.joinable()) {
        poller_thread_.detach();
    }
}

size_t NotificationPoller::prime() {
    spdlog::info("Performing initial check...");
    try {
        auto existing = manager_.get_all_notifications();
        manager_.mark_seen(existing);
        spdlog::info("Tracking {} existing notifications", existing.size());
        return existing.size();
    } catch (const std::exception& e) {
        spdlog::error("Initial check failed: {}", e.what());
        return 0;
    } catch (...) {
        spdlog::error("Initial check failed with an unknown exception");
        return 0;
    }
}

void NotificationPoller::start() {
    if (running_) return;
    if (poller_thread_.joinable()) {
        // Restarted from inside the loop: that loop sees running_ again and carries on
        if (poller_thread_.get_id() == std::this_thread::get_id()) {
            running_ = true;
            return;
        }
        // The previous loop was stopped from within and has not been joined yet
        poller_thread_.join();
    }
    if (running_.exchange(true)) return;
    poller_thread_ = std::thread(&NotificationPoller::polling_loop, this);
    spdlog::info("Started notification polling (every {} ms)", interval_.count());
}

void NotificationPoller::run() {
    if (running_.exchange(true)) return;
    spdlog::info("Starting notification polling (every {} ms)", interval_.count());
    polling_loop();
}

void NotificationPoller::stop() {
    bool was_running;
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        was_running = running_.exchange(false);
    }
    wake_cv_.notify_all();

    // A stop() issued from the loop itself is joined by the next outside caller
    if (poller_thread_.joinable() && poller_thread_.get_id() != std::this_thread::get_id()) {
        poller_thread_.join();
    }
    if (was_running) {
        spdlog::info("Stopped notification polling");
    }
}

bool NotificationPoller::is_running() const {
    return running_;
}

NotificationPoller::CycleReport NotificationPoller::run_cycle() {
    CycleReport report;
    spdlog::info("Checking for new notifications...");

    try {
        auto fresh = manager_.get_new_notifications();
        report.new_count = fresh.size();

        if (fresh.empty()) {
            spdlog::info("No new notifications");
        } else {
            spdlog::info("Found {} new notifications, delivering to {}", fresh.size(), sink_.name());
        }

        // Empty batches go through as well; every sink treats them as a no-op
        report.delivered = sink_.deliver(fresh);
        if (!report.delivered) {
            spdlog::error("Failed to deliver {} notifications to {}, they stay marked as seen",
                          fresh.size(), sink_.name());
        }
    } catch (const std::exception& e) {
        report.delivered = false;
        report.error = e.what();
        spdlog::error("Poll cycle failed: {}", e.what());
    } catch (...) {
        report.delivered = false;
        report.error = "unknown exception";
        spdlog::error("Poll cycle failed with an unknown exception");
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.cycles;
    if (!report.delivered) {
        ++stats_.failed_cycles;
    } else {
        stats_.delivered_total += report.new_count;
    }
    stats_.last_cycle = std::chrono::system_clock::now();
    return report;
}

NotificationPoller::Stats NotificationPoller::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void NotificationPoller::polling_loop() {
    while (running_) {
        run_cycle();
        if (!wait_for_next_tick()) {
            break;
        }
    }
    spdlog::info("Notification polling loop finished");
}

bool NotificationPoller::wait_for_next_tick() {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_cv_.wait_for(lock, interval_, [this] { return !running_; });
    return running_;
}
