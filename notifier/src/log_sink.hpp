#pragma once

#include "sink.hpp"

// Writes each notification to the service log. Used when no printer is set up.
class LogSink : public NotificationSink {
public:
    std::string name() const override;
    bool deliver(const std::vector<Notification>& notifications) override;
};
