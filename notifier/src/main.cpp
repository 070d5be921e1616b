#include "config.hpp"
#include "github_provider.hpp"
#include "health.hpp"
#include "log_sink.hpp"
#include "notification_manager.hpp"
#include "poller.hpp"
#include "printer_sink.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <cstring>
#include <memory>
#include <thread>

// For graceful shutdown
volatile std::sig_atomic_t shutdown_requested = 0;

void signal_handler(int) {
    shutdown_requested = 1;
}

std::unique_ptr<NotificationManager> setup_notification_manager(const Config& config) {
    auto manager = std::make_unique<NotificationManager>();
    manager->add_provider(std::make_shared<GitHubProvider>(config));
    return manager;
}

std::unique_ptr<NotificationSink> setup_sink(const Config& config) {
    if (config.printer_device.empty()) {
        spdlog::info("PRINTER_DEVICE not set, notifications go to the log");
        return std::make_unique<LogSink>();
    }
    spdlog::info("Printing to {}", config.printer_device);
    return std::make_unique<PrinterSink>(
        std::make_unique<DevicePrinterTransport>(config.printer_device),
        config.printer_width,
        config.printer_feed_lines);
}

int print_all_notifications(NotificationManager& manager, NotificationSink& sink) {
    spdlog::info("Fetching notifications from all services...");
    auto notifications = manager.get_all_notifications();
    if (notifications.empty()) {
        spdlog::info("No notifications found");
        return 0;
    }

    spdlog::info("Found {} total notifications", notifications.size());
    if (!sink.deliver(notifications)) {
        spdlog::error("Failed to deliver notifications to {}", sink.name());
        return 1;
    }
    return 0;
}

int poll_notifications(const Config& config, NotificationManager& manager, NotificationSink& sink) {
    NotificationPoller poller(manager, sink, std::chrono::seconds(config.poll_interval_seconds));

    std::unique_ptr<HealthChecker> health;
    if (config.health_port > 0) {
        health = std::make_unique<HealthChecker>(config, manager, poller);
        health->start();
    }

    if (config.prime_on_start) {
        poller.prime();
    }

    poller.start();
    while (!shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Stopping notification polling...");
    poller.stop();
    if (health) {
        health->stop();
    }
    return 0;
}

int main(int argc, char** argv) {
    bool once = argc > 1 && std::strcmp(argv[1], "--once") == 0;
    if (argc > 1 && !once) {
        spdlog::error("Unknown argument '{}'. Usage: {} [--once]", argv[1], argv[0]);
        return 2;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        Config config = Config::from_env();
        util::setup_logging(config.service_name, config.log_level);
        config.validate();
        spdlog::info("Configuration loaded for service: {}", config.service_name);

        auto manager = setup_notification_manager(config);
        if (manager->configured_provider_count() == 0) {
            spdlog::error("No notification services configured!");
            return 0;
        }

        auto sink = setup_sink(config);

        int rc = once ? print_all_notifications(*manager, *sink)
                      : poll_notifications(config, *manager, *sink);
        spdlog::info("{} has shut down. Exiting.", config.service_name);
        return rc;

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred during initialization or runtime: {}", e.what());
        return 1;
    }
}
