
#include "printer_sink.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

PrinterSink::PrinterSink(std::unique_ptr<PrinterTransport> transport, int width, int feed_lines)
    : transport_(std::move(transport)), formatter_(width), feed_lines_(std::clamp(feed_lines, 0, 255)) {}

std::string PrinterSink::name() const {
    return "printer";
}

bool PrinterSink::deliver(const std::vector<Notification>& notifications) {
    if (notifications.empty()) {
        return true;
    }

    if (!transport_ || !transport_->open()) {
        spdlog::error("Failed to connect to printer");
        return false;
    }

    std::string receipt = initialize_command();
    receipt += formatter_.format_batch(notifications, std::chrono::system_clock::now());
    receipt += feed_command(feed_lines_);

    bool ok = transport_->write(receipt);
    transport_->close();

    if (ok) {
        spdlog::info("Printed {} notifications", notifications.size());
    }
    return ok;
}

std::string PrinterSink::initialize_command() {
    return std::string("\x1B\x40", 2);
}

std::string PrinterSink::feed_command(int lines) {
    std::string command("\x1B\x64", 2);
    command.push_back(static_cast<char>(std::clamp(lines, 0, 255)));
    return command;
}
