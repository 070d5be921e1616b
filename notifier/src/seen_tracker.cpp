
#include "seen_tracker.hpp"

bool SeenTracker::contains(const std::string& source, const std::string& id) const {
    auto it = seen_by_source_.find(source);
    return it != seen_by_source_.end() && it->second.count(id) > 0;
}

bool SeenTracker::contains(const Notification& notification) const {
    return contains(notification.source, notification.id);
}

bool SeenTracker::insert(const std::string& source, const std::string& id) {
    bool inserted = seen_by_source_[source].insert(id).second;
    if (inserted) {
        ++total_;
    }
    return inserted;
}

std::vector<Notification> SeenTracker::filter_unseen(const std::vector<Notification>& batch) const {
    std::vector<Notification> fresh;
    SeenTracker pending;

    for (const auto& notification : batch) {
        if (contains(notification)) {
            continue;
        }
        // Same id twice in one cycle: first occurrence wins
        if (!pending.insert(notification.source, notification.id)) {
            continue;
        }
        fresh.push_back(notification);
    }

    return fresh;
}

void SeenTracker::commit(const std::vector<Notification>& batch) {
    for (const auto& notification : batch) {
        insert(notification.source, notification.id);
    }
}

size_t SeenTracker::size() const {
    return total_;
}

size_t SeenTracker::size(const std::string& source) const {
    auto it = seen_by_source_.find(source);
    return it == seen_by_source_.end() ? 0 : it->second.size();
}
