
#include "printer_transport.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

DevicePrinterTransport::DevicePrinterTransport(std::string device_path)
    : device_path_(std::move(device_path)) {}

DevicePrinterTransport::~DevicePrinterTransport() {
    close();
}

bool DevicePrinterTransport::open() {
    if (fd_ >= 0) {
        return true;
    }

    fd_ = ::open(device_path_.c_str(), O_WRONLY | O_NOCTTY | O_CLOEXEC);
    if (fd_ < 0) {
        spdlog::error("Failed to open printer device {}: {}", device_path_, std::strerror(errno));
        return false;
    }

    spdlog::debug("Opened printer device {}", device_path_);
    return true;
}

bool DevicePrinterTransport::write(const std::string& bytes) {
    if (fd_ < 0) {
        spdlog::error("Printer device {} is not open", device_path_);
        return false;
    }

    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = ::write(fd_, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("Write to printer device {} failed: {}", device_path_, std::strerror(errno));
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

void DevicePrinterTransport::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool DevicePrinterTransport::is_open() const {
    return fd_ >= 0;
}
