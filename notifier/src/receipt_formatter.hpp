#pragma once

#include "types.hpp"
#include <chrono>
#include <string>
#include <vector>

// Lays notifications out as fixed-width text for a receipt printer.
class ReceiptFormatter {
public:
    explicit ReceiptFormatter(int width = 32);

    std::string format_notification(const Notification& notification) const;

    // Header with totals, notifications grouped by source in order of first
    // appearance, and a footer.
    std::string format_batch(const std::vector<Notification>& notifications,
                             std::chrono::system_clock::time_point printed_at) const;

    std::vector<std::string> wrap(const std::string& text) const;

private:
    std::string rule(char ch) const;
    std::string fit(const std::string& line) const;

    int width_;
};
