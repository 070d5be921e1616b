#pragma once

#include <string>

// Byte channel to a receipt printer.
class PrinterTransport {
public:
    virtual ~PrinterTransport() = default;

    virtual bool open() = 0;
    virtual bool write(const std::string& bytes) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

// ESC/POS printer behind a character device, e.g. /dev/rfcomm0 bound to a
// Bluetooth serial port.
class DevicePrinterTransport : public PrinterTransport {
public:
    explicit DevicePrinterTransport(std::string device_path);
    ~DevicePrinterTransport() override;

    DevicePrinterTransport(const DevicePrinterTransport&) = delete;
    DevicePrinterTransport& operator=(const DevicePrinterTransport&) = delete;

    bool open() override;
    bool write(const std::string& bytes) override;
    void close() override;
    bool is_open() const override;

private:
    std::string device_path_;
    int fd_ = -1;
};
