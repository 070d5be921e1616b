#include "github_provider.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <iterator>
#include <stdexcept>
#include <unordered_map>

namespace {

const nlohmann::json* find_object(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) {
        return nullptr;
    }
    return &*it;
}

std::optional<std::string> find_string(const nlohmann::json* j, const char* key) {
    if (!j) {
        return std::nullopt;
    }
    auto it = j->find(key);
    if (it == j->end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

class GitHubProvider::Impl {
public:
    explicit Impl(const Config& config)
        : token_(util::trim(config.github_token)),
          api_url_(config.github_api_url),
          timeout_ms_(config.github_timeout_ms),
          per_page_(config.github_per_page),
          max_pages_(config.github_max_pages) {
        while (!api_url_.empty() && api_url_.back() == '/') {
            api_url_.pop_back();
        }
    }

    bool is_configured() const {
        return !token_.empty();
    }

    FetchResult fetch_notifications() {
        if (!is_configured()) {
            return FetchResult::failure(FetchError::NotConfigured, "missing GITHUB_TOKEN");
        }

        std::vector<Notification> notifications;
        int skipped = 0;
        auto now = std::chrono::system_clock::now();

        std::optional<std::string> next_url = api_url_ + "/notifications";
        bool first_page = true;
        int pages = 0;

        while (next_url && pages < max_pages_) {
            cpr::Response response;
            if (first_page) {
                response = cpr::Get(
                    cpr::Url{*next_url},
                    headers(),
                    cpr::Parameters{{"per_page", std::to_string(per_page_)}},
                    cpr::Timeout{timeout_ms_}
                );
            } else {
                // The Link URL already carries the query string
                response = cpr::Get(cpr::Url{*next_url}, headers(), cpr::Timeout{timeout_ms_});
            }
            first_page = false;
            ++pages;

            if (response.error) {
                return FetchResult::failure(FetchError::FetchFailed,
                    "request failed: " + response.error.message);
            }
            if (response.status_code != 200) {
                return FetchResult::failure(FetchError::FetchFailed,
                    "HTTP " + std::to_string(response.status_code) + ": " + response.text);
            }

            nlohmann::json page;
            try {
                page = nlohmann::json::parse(response.text);
            } catch (const nlohmann::json::parse_error& e) {
                return FetchResult::failure(FetchError::FetchFailed,
                    std::string("malformed response: ") + e.what());
            }
            if (!page.is_array()) {
                return FetchResult::failure(FetchError::FetchFailed, "response is not a JSON array");
            }

            auto parsed = GitHubProvider::parse_page(page, now, skipped);
            notifications.insert(notifications.end(),
                                 std::make_move_iterator(parsed.begin()),
                                 std::make_move_iterator(parsed.end()));

            next_url.reset();
            auto link = response.header.find("link");
            if (link != response.header.end()) {
                next_url = util::parse_next_link(link->second);
            }
        }

        if (next_url) {
            spdlog::warn("GitHub has more notifications than {} pages, the rest waits for a later poll",
                         max_pages_);
        }

        spdlog::debug("Fetched {} GitHub notifications over {} pages", notifications.size(), pages);
        return FetchResult::success(std::move(notifications), skipped);
    }

private:
    cpr::Header headers() const {
        return cpr::Header{
            {"Authorization", "token " + token_},
            {"Accept", "application/vnd.github.v3+json"},
            {"User-Agent", "GitHub-Notifications-Printer"}
        };
    }

    std::string token_;
    std::string api_url_;
    int timeout_ms_;
    int per_page_;
    int max_pages_;
};

GitHubProvider::GitHubProvider(const Config& config) : pImpl_(std::make_unique<Impl>(config)) {}
GitHubProvider::~GitHubProvider() = default;

std::string GitHubProvider::name() const {
    return kName;
}

bool GitHubProvider::is_configured() const {
    return pImpl_->is_configured();
}

FetchResult GitHubProvider::fetch_notifications() {
    try {
        return pImpl_->fetch_notifications();
    } catch (const std::exception& e) {
        return FetchResult::failure(FetchError::FetchFailed, e.what());
    } catch (...) {
        return FetchResult::failure(FetchError::FetchFailed, "unknown exception");
    }
}

Notification GitHubProvider::parse_notification(const nlohmann::json& raw,
                                                std::chrono::system_clock::time_point now) {
    if (!raw.is_object()) {
        throw std::runtime_error("notification is not a JSON object");
    }

    Notification notification;

    auto id_it = raw.find("id");
    if (id_it != raw.end() && id_it->is_string()) {
        notification.id = id_it->get<std::string>();
    } else if (id_it != raw.end() && id_it->is_number_integer()) {
        notification.id = std::to_string(id_it->get<int64_t>());
    }
    if (notification.id.empty()) {
        throw std::runtime_error("notification has no id");
    }

    const auto* subject = find_object(raw, "subject");
    const auto* repository = find_object(raw, "repository");

    notification.title = find_string(subject, "title").value_or("");
    if (util::trim(notification.title).empty()) {
        notification.title = "No Title";
    }

    notification.source = kName;
    notification.repository = find_string(repository, "full_name").value_or("Unknown Repo");
    notification.url = find_string(subject, "url");

    std::string reason = find_string(&raw, "reason").value_or("unknown");
    notification.reason = reason;
    notification.type = type_for_reason(reason);

    notification.timestamp = now;
    if (auto updated_at = find_string(&raw, "updated_at")) {
        if (auto parsed = util::parse_iso8601(*updated_at)) {
            notification.timestamp = *parsed;
        } else {
            spdlog::debug("Unparsable updated_at '{}' on notification {}", *updated_at, notification.id);
        }
    }

    notification.raw_data = raw;
    return notification;
}

std::vector<Notification> GitHubProvider::parse_page(const nlohmann::json& page,
                                                     std::chrono::system_clock::time_point now,
                                                     int& skipped) {
    std::vector<Notification> notifications;
    for (const auto& raw : page) {
        try {
            notifications.push_back(parse_notification(raw, now));
        } catch (const std::exception& e) {
            spdlog::warn("Error converting GitHub notification: {}", e.what());
            ++skipped;
        }
    }
    return notifications;
}

std::string GitHubProvider::type_for_reason(const std::string& reason) {
    static const std::unordered_map<std::string, std::string> type_mapping = {
        {"assign", "Assignment"},
        {"author", "Author"},
        {"comment", "Comment"},
        {"invitation", "Invitation"},
        {"manual", "Manual"},
        {"mention", "Mention"},
        {"review_requested", "Review Request"},
        {"security_alert", "Security Alert"},
        {"state_change", "State Change"},
        {"subscribed", "Subscription"},
        {"team_mention", "Team Mention"}
    };

    auto it = type_mapping.find(util::to_lower(reason));
    if (it != type_mapping.end()) {
        return it->second;
    }
    std::string type = util::title_case(util::trim(reason));
    return type.empty() ? "Unknown" : type;
}
