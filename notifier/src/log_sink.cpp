
#include "log_sink.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

std::string LogSink::name() const {
    return "log";
}

bool LogSink::deliver(const std::vector<Notification>& notifications) {
    for (const auto& notification : notifications) {
        spdlog::info("[{}] {} | {} | {} | {}",
                     notification.source,
                     notification.type,
                     notification.repository.value_or("-"),
                     util::format_minutes(notification.timestamp),
                     notification.title);
        spdlog::debug("{}", notification.to_json().dump());
    }
    return true;
}
