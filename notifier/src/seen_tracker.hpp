#pragma once

#include "types.hpp"
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Record of (source, id) pairs already delivered. Grows for the lifetime of
// the owner and is never pruned. Not thread-safe; the owner serializes access.
class SeenTracker {
public:
    bool contains(const std::string& source, const std::string& id) const;
    bool contains(const Notification& notification) const;

    // Returns true if the pair was not present before.
    bool insert(const std::string& source, const std::string& id);

    // Drops already-seen items and repeats within the batch, keeping the
    // first occurrence. Does not modify the tracker.
    std::vector<Notification> filter_unseen(const std::vector<Notification>& batch) const;

    // Marks every item of the batch as seen.
    void commit(const std::vector<Notification>& batch);

    size_t size() const;
    size_t size(const std::string& source) const;

private:
    std::unordered_map<std::string, std::unordered_set<std::string>> seen_by_source_;
    size_t total_ = 0;
};
