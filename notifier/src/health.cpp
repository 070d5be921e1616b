
#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <thread>

class HealthChecker::Impl {
public:
    Impl(const Config& config, const NotificationManager& manager, const NotificationPoller& poller)
        : config_(config), manager_(manager), poller_(poller), running_(false) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_.exchange(true)) return;

        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            auto status = snapshot();
            res.status = status["status"] == "healthy" ? 200 : 503;
            res.set_content(status.dump(2), "application/json");
        });

        // Bind before spawning so stop() always finds a socket to close
        if (!server_.bind_to_port(config_.health_host.c_str(), config_.health_port)) {
            spdlog::error("Health check server could not bind {}:{}", config_.health_host, config_.health_port);
            running_ = false;
            return;
        }

        server_thread_ = std::thread([this]() {
            spdlog::info("Health check server listening on {}:{}", config_.health_host, config_.health_port);
            server_.listen_after_bind();
        });

        // httplib ignores stop() until the accept loop is up
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (!server_.is_running() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    void stop() {
        if (running_.exchange(false)) {
            server_.stop();
            if (server_thread_.joinable()) {
                server_thread_.join();
            }
            spdlog::info("Health check server stopped");
        }
    }

    nlohmann::json snapshot() const {
        nlohmann::json status;
        status["service"] = config_.service_name;
        status["timestamp"] = util::current_iso8601();

        size_t configured = 0;
        status["providers"] = nlohmann::json::array();
        for (const auto& provider : manager_.providers()) {
            status["providers"].push_back({
                {"name", provider.name},
                {"configured", provider.configured}
            });
            if (provider.configured) ++configured;
        }
        status["status"] = configured > 0 ? "healthy" : "degraded";

        auto stats = poller_.stats();
        status["seen"] = manager_.seen_count();
        status["cycles"] = stats.cycles;
        status["failed_cycles"] = stats.failed_cycles;
        status["delivered"] = stats.delivered_total;
        if (stats.last_cycle) {
            status["last_cycle"] = util::format_iso8601(*stats.last_cycle);
        } else {
            status["last_cycle"] = nullptr;
        }
        return status;
    }

private:
    Config config_;
    const NotificationManager& manager_;
    const NotificationPoller& poller_;
    httplib::Server server_;
    std::atomic<bool> running_;
    std::thread server_thread_;
};

HealthChecker::HealthChecker(const Config& config, const NotificationManager& manager,
                             const NotificationPoller& poller)
    : pImpl_(std::make_unique<Impl>(config, manager, poller)) {}

HealthChecker::~HealthChecker() = default;

void HealthChecker::start() {
    pImpl_->start();
}

void HealthChecker::stop() {
    pImpl_->stop();
}

nlohmann::json HealthChecker::snapshot() const {
    return pImpl_->snapshot();
}
