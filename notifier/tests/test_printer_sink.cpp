#include <gtest/gtest.h>
#include "log_sink.hpp"
#include "printer_sink.hpp"
#include "test_helpers.hpp"

#include <cstdio>
#include <fstream>
#include <iterator>
#include <memory>

class PrinterSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto owned = std::make_unique<MemoryPrinterTransport>();
        transport = owned.get();
        sink = std::make_unique<PrinterSink>(std::move(owned), 32, 3);
    }

    MemoryPrinterTransport* transport = nullptr;
    std::unique_ptr<PrinterSink> sink;
};

TEST_F(PrinterSinkTest, EmptyBatchIsNoOp) {
    EXPECT_TRUE(sink->deliver({}));
    EXPECT_EQ(transport->open_count, 0);
    EXPECT_TRUE(transport->written.empty());
}

TEST_F(PrinterSinkTest, EmptyBatchSucceedsEvenWithoutPrinter) {
    transport->can_open = false;
    EXPECT_TRUE(sink->deliver({}));
}

TEST_F(PrinterSinkTest, ReceiptIsFramedWithEscPos) {
    ASSERT_TRUE(sink->deliver({make_notification("GitHub", "1", "Review requested")}));

    const auto& out = transport->written;
    ASSERT_GE(out.size(), 5u);
    EXPECT_EQ(out.substr(0, 2), PrinterSink::initialize_command());
    EXPECT_EQ(out.substr(out.size() - 3), PrinterSink::feed_command(3));
    EXPECT_NE(out.find("Review requested"), std::string::npos);
    EXPECT_NE(out.find("Total: 1"), std::string::npos);
    EXPECT_FALSE(transport->is_open());
}

TEST_F(PrinterSinkTest, OpenFailureIsReported) {
    transport->can_open = false;
    EXPECT_FALSE(sink->deliver({make_notification("GitHub", "1")}));
}

TEST_F(PrinterSinkTest, WriteFailureIsReported) {
    transport->fail_writes = true;
    EXPECT_FALSE(sink->deliver({make_notification("GitHub", "1")}));
    EXPECT_FALSE(transport->is_open());
}

TEST(PrinterSinkCommandsTest, FeedCommandClampsLineCount) {
    EXPECT_EQ(PrinterSink::feed_command(3), std::string("\x1B\x64\x03", 3));
    EXPECT_EQ(PrinterSink::feed_command(-1), std::string("\x1B\x64\x00", 3));
    EXPECT_EQ(PrinterSink::feed_command(1000).back(), static_cast<char>(255));
}

TEST(DevicePrinterTransportTest, WritesToDeviceFile) {
    std::string path = ::testing::TempDir() + "notifier_printer_device";
    { std::ofstream create(path); }

    DevicePrinterTransport transport(path);
    ASSERT_TRUE(transport.open());
    EXPECT_TRUE(transport.write("hello"));
    transport.close();
    EXPECT_FALSE(transport.is_open());

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "hello");
    std::remove(path.c_str());
}

TEST(DevicePrinterTransportTest, MissingDeviceFailsToOpen) {
    DevicePrinterTransport transport("/nonexistent/rfcomm-test");
    EXPECT_FALSE(transport.open());
    EXPECT_FALSE(transport.write("x"));
}

TEST(LogSinkTest, AcceptsAnyBatch) {
    LogSink sink;
    EXPECT_TRUE(sink.deliver({}));
    EXPECT_TRUE(sink.deliver({make_notification("GitHub", "1")}));
}
