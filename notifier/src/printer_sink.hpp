#pragma once

#include "printer_transport.hpp"
#include "receipt_formatter.hpp"
#include "sink.hpp"
#include <memory>

// Prints each batch as one receipt. The transport is opened per batch and
// closed again afterwards so the printer can sleep between polls.
class PrinterSink : public NotificationSink {
public:
    PrinterSink(std::unique_ptr<PrinterTransport> transport, int width, int feed_lines);

    std::string name() const override;
    bool deliver(const std::vector<Notification>& notifications) override;

    // ESC/POS framing around the receipt text
    static std::string initialize_command();
    static std::string feed_command(int lines);

private:
    std::unique_ptr<PrinterTransport> transport_;
    ReceiptFormatter formatter_;
    int feed_lines_;
};
