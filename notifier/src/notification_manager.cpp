
#include "notification_manager.hpp"
#include <spdlog/spdlog.h>
#include <iterator>

void NotificationManager::add_provider(ProviderPtr provider) {
    if (!provider) {
        spdlog::warn("Ignoring null notification provider");
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::info("Added {} provider", provider->name());
    providers_.push_back(ProviderEntry{std::move(provider)});
}

std::vector<Notification> NotificationManager::get_all_notifications() {
    return fetch_all();
}

std::vector<Notification> NotificationManager::get_new_notifications() {
    auto fetched = fetch_all();

    std::lock_guard<std::mutex> lock(mutex_);
    auto fresh = seen_.filter_unseen(fetched);
    seen_.commit(fresh);

    spdlog::debug("{} fetched, {} new, {} seen in total", fetched.size(), fresh.size(), seen_.size());
    return fresh;
}

void NotificationManager::mark_seen(const std::vector<Notification>& notifications) {
    std::lock_guard<std::mutex> lock(mutex_);
    seen_.commit(notifications);
}

bool NotificationManager::has_seen(const std::string& source, const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.contains(source, id);
}

size_t NotificationManager::seen_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.size();
}

size_t NotificationManager::provider_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.size();
}

size_t NotificationManager::configured_provider_count() const {
    size_t count = 0;
    for (const auto& info : providers()) {
        if (info.configured) {
            ++count;
        }
    }
    return count;
}

std::vector<NotificationManager::ProviderInfo> NotificationManager::providers() const {
    std::vector<ProviderPtr> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : providers_) {
            snapshot.push_back(entry.provider);
        }
    }

    std::vector<ProviderInfo> infos;
    for (const auto& provider : snapshot) {
        bool configured = false;
        try {
            configured = provider->is_configured();
        } catch (const std::exception& e) {
            spdlog::error("Configuration check for {} failed: {}", provider->name(), e.what());
        } catch (...) {
            spdlog::error("Configuration check for {} failed with an unknown error", provider->name());
        }
        infos.push_back(ProviderInfo{provider->name(), configured});
    }
    return infos;
}

std::vector<Notification> NotificationManager::fetch_all() {
    // Providers are called without holding the lock; the registry only grows,
    // so indices stay valid.
    std::vector<ProviderPtr> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : providers_) {
            snapshot.push_back(entry.provider);
        }
    }

    std::vector<Notification> all;
    for (size_t i = 0; i < snapshot.size(); ++i) {
        fetch_from(i, *snapshot[i], all);
    }
    return all;
}

bool NotificationManager::check_configured(size_t index, const NotificationProvider& provider) {
    bool configured = false;
    try {
        configured = provider.is_configured();
    } catch (const std::exception& e) {
        spdlog::error("Configuration check for {} failed: {}", provider.name(), e.what());
    } catch (...) {
        spdlog::error("Configuration check for {} failed with an unknown error", provider.name());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = providers_[index];
    if (!configured) {
        if (!entry.warned_unconfigured) {
            spdlog::warn("{} provider is not configured, skipping it", provider.name());
            entry.warned_unconfigured = true;
        }
        return false;
    }
    if (entry.warned_unconfigured) {
        spdlog::info("{} provider is now configured", provider.name());
        entry.warned_unconfigured = false;
    }
    return true;
}

void NotificationManager::fetch_from(size_t index, NotificationProvider& provider,
                                     std::vector<Notification>& out) {
    if (!check_configured(index, provider)) {
        return;
    }

    FetchResult result;
    try {
        result = provider.fetch_notifications();
    } catch (const std::exception& e) {
        spdlog::error("Error fetching from {}: {}", provider.name(), e.what());
        return;
    } catch (...) {
        spdlog::error("Error fetching from {}: unknown exception", provider.name());
        return;
    }

    if (!result.ok()) {
        if (*result.error == FetchError::NotConfigured) {
            spdlog::warn("{} reported it is not configured: {}", provider.name(), result.message);
        } else {
            spdlog::error("Error fetching from {} ({}): {}", provider.name(),
                          to_string(*result.error), result.message);
        }
        return;
    }

    if (result.skipped_items > 0) {
        spdlog::warn("{} skipped {} malformed notifications", provider.name(), result.skipped_items);
    }
    spdlog::debug("{} returned {} notifications", provider.name(), result.notifications.size());

    out.insert(out.end(),
               std::make_move_iterator(result.notifications.begin()),
               std::make_move_iterator(result.notifications.end()));
}
