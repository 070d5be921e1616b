
#pragma once

#include "types.hpp"
#include <memory>
#include <string>
#include <vector>

/**
 * Consumer of new-notification batches.
 *
 * deliver() returns false when the batch could not be consumed. An empty
 * batch is a no-op and must return true.
 */
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual std::string name() const = 0;
    virtual bool deliver(const std::vector<Notification>& notifications) = 0;
};

using SinkPtr = std::shared_ptr<NotificationSink>;
