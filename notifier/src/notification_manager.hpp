#pragma once

#include "provider.hpp"
#include "seen_tracker.hpp"
#include "types.hpp"

#include <mutex>
#include <string>
#include <vector>

/**
 * Owns the provider registry and the seen-set, and runs one fetch across all
 * providers per call.
 *
 * Neither retrieval method ever fails: unconfigured providers are skipped
 * without being asked to fetch, failing providers contribute nothing, and
 * both are reported through the log.
 */
class NotificationManager {
public:
    struct ProviderInfo {
        std::string name;
        bool configured;
    };

    NotificationManager() = default;
    NotificationManager(const NotificationManager&) = delete;
    NotificationManager& operator=(const NotificationManager&) = delete;

    // Appends to the registry. No validation; the same provider may be
    // registered more than once.
    void add_provider(ProviderPtr provider);

    // Every notification from every configured provider, in registration
    // order. Leaves the seen-set untouched.
    std::vector<Notification> get_all_notifications();

    // Same fetch as get_all_notifications(), minus anything already seen.
    // The returned items are recorded as seen once the whole batch has
    // been filtered.
    std::vector<Notification> get_new_notifications();

    // Records a batch as seen without returning it, e.g. the listing that
    // existed before polling started.
    void mark_seen(const std::vector<Notification>& notifications);

    bool has_seen(const std::string& source, const std::string& id) const;
    size_t seen_count() const;

    size_t provider_count() const;
    size_t configured_provider_count() const;
    std::vector<ProviderInfo> providers() const;

private:
    struct ProviderEntry {
        ProviderPtr provider;
        bool warned_unconfigured = false;
    };

    std::vector<Notification> fetch_all();
    void fetch_from(size_t index, NotificationProvider& provider, std::vector<Notification>& out);
    bool check_configured(size_t index, const NotificationProvider& provider);

    mutable std::mutex mutex_;
    std::vector<ProviderEntry> providers_;
    SeenTracker seen_;
};
