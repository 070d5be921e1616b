
#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>

// A notification normalized from any source. Identity is (source, id);
// every other field is presentation.
struct Notification {
    std::string id;
    std::string title;
    std::string source;
    std::string type = "Unknown";
    std::chrono::system_clock::time_point timestamp;
    std::optional<std::string> repository;
    std::optional<std::string> url;
    std::optional<std::string> reason;
    nlohmann::json raw_data; // null when the source kept nothing

    nlohmann::json to_json() const;
};

enum class FetchError {
    NotConfigured,
    FetchFailed
};

const char* to_string(FetchError error);

// Outcome of one provider fetch. Providers report failure here instead of
// throwing so that one bad source cannot abort a poll cycle.
struct FetchResult {
    std::vector<Notification> notifications;
    std::optional<FetchError> error;
    std::string message;
    int skipped_items = 0;

    bool ok() const { return !error.has_value(); }

    static FetchResult success(std::vector<Notification> notifications, int skipped_items = 0);
    static FetchResult failure(FetchError error, std::string message);
};
