
#include "types.hpp"
#include "util.hpp"

nlohmann::json Notification::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"title", title},
        {"source", source},
        {"type", type},
        {"ts", util::format_iso8601(timestamp)}
    };
    if (repository) j["repository"] = *repository;
    if (url) j["url"] = *url;
    if (reason) j["reason"] = *reason;
    return j;
}

const char* to_string(FetchError error) {
    switch (error) {
        case FetchError::NotConfigured: return "NotConfigured";
        case FetchError::FetchFailed: return "FetchFailed";
    }
    return "Unknown";
}

FetchResult FetchResult::success(std::vector<Notification> notifications, int skipped_items) {
    FetchResult result;
    result.notifications = std::move(notifications);
    result.skipped_items = skipped_items;
    return result;
}

FetchResult FetchResult::failure(FetchError error, std::string message) {
    FetchResult result;
    result.error = error;
    result.message = std::move(message);
    return result;
}
