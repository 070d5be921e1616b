
#pragma once
#include "notification_manager.hpp"
#include "sink.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

class NotificationPoller {
public:
    struct CycleReport {
        size_t new_count = 0;
        bool delivered = true;
        std::string error; // Set when the cycle threw
    };

    struct Stats {
        uint64_t cycles = 0;
        uint64_t failed_cycles = 0;
        uint64_t delivered_total = 0;
        std::optional<std::chrono::system_clock::time_point> last_cycle;
    };

    NotificationPoller(NotificationManager& manager, NotificationSink& sink,
                       std::chrono::milliseconds interval);
    ~NotificationPoller();

    // Marks the current listing as seen so only later arrivals are delivered.
    // Returns the number of notifications recorded.
    size_t prime();

    // Polls on a background thread until stop().
    void start();
    // Polls on the calling thread until stop() is called from elsewhere.
    void run();
    // Lets a cycle in progress finish, then ends the loop.
    void stop();
    bool is_running() const;

    CycleReport run_cycle();
    Stats stats() const;

private:
    void polling_loop();
    bool wait_for_next_tick();

    NotificationManager& manager_;
    NotificationSink& sink_;
    std::chrono::milliseconds interval_;

    std::atomic<bool> running_{false};
    std::thread poller_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};
