
#include "receipt_formatter.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <sstream>

ReceiptFormatter::ReceiptFormatter(int width) : width_(std::max(width, 1)) {}

std::string ReceiptFormatter::format_notification(const Notification& notification) const {
    std::vector<std::string> lines;
    lines.push_back(rule('='));
    lines.push_back(fit(fmt::format("SERVICE: {}", notification.source)));
    if (notification.repository) {
        lines.push_back(fit(fmt::format("REPO: {}", *notification.repository)));
    }
    lines.push_back(fit(fmt::format("TYPE: {}", notification.type)));
    if (notification.reason) {
        lines.push_back(fit(fmt::format("REASON: {}", util::to_upper(*notification.reason))));
    }
    lines.push_back(fit(fmt::format("TIME: {}", util::format_minutes(notification.timestamp))));
    lines.push_back(rule('-'));

    for (auto& line : wrap(notification.title)) {
        lines.push_back(std::move(line));
    }

    lines.push_back(rule('='));
    lines.push_back("");

    std::ostringstream out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out << '\n';
        out << lines[i];
    }
    return out.str();
}

std::string ReceiptFormatter::format_batch(const std::vector<Notification>& notifications,
                                           std::chrono::system_clock::time_point printed_at) const {
    // Group by source, keeping first-appearance order
    std::vector<std::pair<std::string, std::vector<const Notification*>>> groups;
    for (const auto& notification : notifications) {
        auto it = std::find_if(groups.begin(), groups.end(),
                               [&](const auto& group) { return group.first == notification.source; });
        if (it == groups.end()) {
            groups.push_back({notification.source, {&notification}});
        } else {
            it->second.push_back(&notification);
        }
    }

    std::string services;
    for (const auto& group : groups) {
        if (!services.empty()) services += ", ";
        services += group.first;
    }

    std::ostringstream out;
    out << rule('=') << '\n'
        << "NOTIFICATIONS" << '\n'
        << rule('=') << '\n'
        << fmt::format("Total: {}", notifications.size()) << '\n'
        << fmt::format("Services: {}", services) << '\n'
        << fmt::format("Time: {}", util::format_minutes(printed_at)) << '\n'
        << '\n';

    for (const auto& group : groups) {
        out << fmt::format("--- {} ---", util::to_upper(group.first)) << '\n'
            << fmt::format("Count: {}", group.second.size()) << '\n'
            << '\n';
        for (const auto* notification : group.second) {
            out << format_notification(*notification) << '\n';
        }
    }

    out << rule('=') << '\n'
        << "END OF NOTIFICATIONS" << '\n'
        << rule('=') << '\n';
    return out.str();
}

std::vector<std::string> ReceiptFormatter::wrap(const std::string& text) const {
    std::vector<std::string> lines;
    std::string current;

    for (const auto& word : util::split_words(text)) {
        if (current.empty()) {
            current = word;
        } else if (current.size() + 1 + word.size() <= static_cast<size_t>(width_)) {
            current += " " + word;
        } else {
            lines.push_back(current);
            current = word;
        }
    }

    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

std::string ReceiptFormatter::rule(char ch) const {
    return std::string(static_cast<size_t>(width_), ch);
}

std::string ReceiptFormatter::fit(const std::string& line) const {
    return line.substr(0, static_cast<size_t>(width_));
}
