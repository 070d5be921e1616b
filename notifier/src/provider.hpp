
#pragma once

#include "types.hpp"
#include <memory>
#include <string>

/**
 * A single external notification source.
 *
 * Implementations own their transport and parsing. They must not throw out
 * of fetch_notifications(); failures are returned as a FetchResult.
 */
class NotificationProvider {
public:
    virtual ~NotificationProvider() = default;

    // Stable source name. Used as the dedup namespace and for display.
    virtual std::string name() const = 0;

    // Cheap credential check, performed before any network call.
    virtual bool is_configured() const = 0;

    virtual FetchResult fetch_notifications() = 0;
};

using ProviderPtr = std::shared_ptr<NotificationProvider>;
