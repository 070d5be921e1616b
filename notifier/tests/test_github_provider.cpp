#include <gtest/gtest.h>
#include "github_provider.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

const auto kNow = std::chrono::system_clock::from_time_t(1700000000);

json sample_item() {
    return json::parse(R"({
        "id": "12345",
        "unread": true,
        "reason": "review_requested",
        "updated_at": "2024-01-15T10:30:00Z",
        "subject": {
            "title": "Add receipt width option",
            "url": "https://api.github.com/repos/octo/widgets/pulls/7",
            "type": "PullRequest"
        },
        "repository": {"full_name": "octo/widgets"}
    })");
}

Config config_with_token(const std::string& token) {
    Config config;
    config.github_token = token;
    return config;
}

} // namespace

TEST(GitHubProviderTest, ParsesCompleteItem) {
    auto n = GitHubProvider::parse_notification(sample_item(), kNow);

    EXPECT_EQ(n.id, "12345");
    EXPECT_EQ(n.title, "Add receipt width option");
    EXPECT_EQ(n.source, "GitHub");
    EXPECT_EQ(n.type, "Review Request");
    EXPECT_EQ(n.repository, std::optional<std::string>("octo/widgets"));
    EXPECT_EQ(n.url, std::optional<std::string>("https://api.github.com/repos/octo/widgets/pulls/7"));
    EXPECT_EQ(n.reason, std::optional<std::string>("review_requested"));
    EXPECT_EQ(n.timestamp, std::chrono::system_clock::from_time_t(1705314600));
    EXPECT_EQ(n.raw_data, sample_item());
}

TEST(GitHubProviderTest, FillsDefaultsForMissingFields) {
    auto n = GitHubProvider::parse_notification(json{{"id", "1"}}, kNow);

    EXPECT_EQ(n.title, "No Title");
    EXPECT_EQ(n.repository, std::optional<std::string>("Unknown Repo"));
    EXPECT_EQ(n.reason, std::optional<std::string>("unknown"));
    EXPECT_EQ(n.type, "Unknown");
    EXPECT_FALSE(n.url.has_value());
    EXPECT_EQ(n.timestamp, kNow);
}

TEST(GitHubProviderTest, EmptyTitleFallsBackToPlaceholder) {
    auto item = sample_item();
    item["subject"]["title"] = "   ";
    EXPECT_EQ(GitHubProvider::parse_notification(item, kNow).title, "No Title");
}

TEST(GitHubProviderTest, NullSubjectUrlIsAbsent) {
    auto item = sample_item();
    item["subject"]["url"] = nullptr;
    EXPECT_FALSE(GitHubProvider::parse_notification(item, kNow).url.has_value());
}

TEST(GitHubProviderTest, BadTimestampFallsBackToNow) {
    auto item = sample_item();
    item["updated_at"] = "yesterday";
    EXPECT_EQ(GitHubProvider::parse_notification(item, kNow).timestamp, kNow);
}

TEST(GitHubProviderTest, NumericIdIsAccepted) {
    auto item = sample_item();
    item["id"] = 987;
    EXPECT_EQ(GitHubProvider::parse_notification(item, kNow).id, "987");
}

TEST(GitHubProviderTest, ItemWithoutIdIsMalformed) {
    auto item = sample_item();
    item.erase("id");
    EXPECT_THROW(GitHubProvider::parse_notification(item, kNow), std::runtime_error);

    item["id"] = json::array();
    EXPECT_THROW(GitHubProvider::parse_notification(item, kNow), std::runtime_error);

    EXPECT_THROW(GitHubProvider::parse_notification(json("not an object"), kNow), std::runtime_error);
}

TEST(GitHubProviderTest, PageSkipsMalformedItems) {
    auto second = sample_item();
    second["id"] = "2";
    json page = json::array({sample_item(), json{{"reason", "mention"}}, 42, second});

    int skipped = 0;
    auto notifications = GitHubProvider::parse_page(page, kNow, skipped);

    ASSERT_EQ(notifications.size(), 2u);
    EXPECT_EQ(notifications[0].id, "12345");
    EXPECT_EQ(notifications[1].id, "2");
    EXPECT_EQ(skipped, 2);
}

TEST(GitHubProviderTest, KnownReasonsMapToTypes) {
    EXPECT_EQ(GitHubProvider::type_for_reason("assign"), "Assignment");
    EXPECT_EQ(GitHubProvider::type_for_reason("author"), "Author");
    EXPECT_EQ(GitHubProvider::type_for_reason("comment"), "Comment");
    EXPECT_EQ(GitHubProvider::type_for_reason("invitation"), "Invitation");
    EXPECT_EQ(GitHubProvider::type_for_reason("manual"), "Manual");
    EXPECT_EQ(GitHubProvider::type_for_reason("mention"), "Mention");
    EXPECT_EQ(GitHubProvider::type_for_reason("security_alert"), "Security Alert");
    EXPECT_EQ(GitHubProvider::type_for_reason("state_change"), "State Change");
    EXPECT_EQ(GitHubProvider::type_for_reason("subscribed"), "Subscription");
    EXPECT_EQ(GitHubProvider::type_for_reason("team_mention"), "Team Mention");
    EXPECT_EQ(GitHubProvider::type_for_reason("MENTION"), "Mention");
}

TEST(GitHubProviderTest, UnknownReasonsAreTitleCased) {
    EXPECT_EQ(GitHubProvider::type_for_reason("ci_activity"), "Ci_Activity");
    EXPECT_EQ(GitHubProvider::type_for_reason("approval requested"), "Approval Requested");
    EXPECT_EQ(GitHubProvider::type_for_reason(""), "Unknown");
}

TEST(GitHubProviderTest, BlankTokenIsNotConfigured) {
    EXPECT_FALSE(GitHubProvider(config_with_token("")).is_configured());
    EXPECT_FALSE(GitHubProvider(config_with_token("  \t ")).is_configured());
    EXPECT_TRUE(GitHubProvider(config_with_token("ghp_abc")).is_configured());
}

TEST(GitHubProviderTest, FetchWithoutTokenReportsNotConfigured) {
    GitHubProvider provider(config_with_token(""));

    auto result = provider.fetch_notifications();

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, FetchError::NotConfigured);
    EXPECT_TRUE(result.notifications.empty());
}

TEST(GitHubProviderTest, UnreachableApiReportsFetchFailed) {
    Config config = config_with_token("ghp_abc");
    config.github_api_url = "http://127.0.0.1:1";
    config.github_timeout_ms = 2000;
    GitHubProvider provider(config);

    auto result = provider.fetch_notifications();

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, FetchError::FetchFailed);
    EXPECT_FALSE(result.message.empty());
}

TEST(FetchErrorTest, NamesEachKind) {
    EXPECT_STREQ(to_string(FetchError::NotConfigured), "NotConfigured");
    EXPECT_STREQ(to_string(FetchError::FetchFailed), "FetchFailed");
}
