
#pragma once
#include "config.hpp"
#include "notification_manager.hpp"
#include "poller.hpp"
#include <memory>
#include <nlohmann/json.hpp>

class HealthChecker {
public:
    HealthChecker(const Config& config, const NotificationManager& manager, const NotificationPoller& poller);
    ~HealthChecker();

    void start();
    void stop();

    // Body served on GET /health
    nlohmann::json snapshot() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
