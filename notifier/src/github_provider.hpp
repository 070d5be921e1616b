
#pragma once

#include "config.hpp"
#include "provider.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Notifications for the authenticated user from the GitHub REST API.
class GitHubProvider : public NotificationProvider {
public:
    static constexpr const char* kName = "GitHub";

    explicit GitHubProvider(const Config& config);
    ~GitHubProvider() override;

    std::string name() const override;
    bool is_configured() const override;
    FetchResult fetch_notifications() override;

    // Converts one item of the /notifications response. Throws
    // std::runtime_error when the item has no usable id.
    static Notification parse_notification(const nlohmann::json& raw,
                                           std::chrono::system_clock::time_point now);

    // Converts a whole page, skipping items that fail to parse.
    static std::vector<Notification> parse_page(const nlohmann::json& page,
                                                std::chrono::system_clock::time_point now,
                                                int& skipped);

    // Maps a GitHub reason ("review_requested") to a display type ("Review Request").
    static std::string type_for_reason(const std::string& reason);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
