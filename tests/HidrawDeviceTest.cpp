#include "common/device/HidrawDevice.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <future>

#include <sys/stat.h>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

/**
 * @brief 临时目录中的 FIFO，作为可读写、可加锁的非 hidraw 字符节点
 */
class HidrawDeviceTest : public ::testing::Test {
protected:
    std::string dir;
    std::string path;

    void SetUp() override {
        char tmpl[] = "/tmp/knx_hidraw_XXXXXX";
        ASSERT_NE(::mkdtemp(tmpl), nullptr);
        dir = tmpl;
        path = dir + "/hidraw-fifo";
        ASSERT_EQ(::mkfifo(path.c_str(), 0600), 0);
    }

    void TearDown() override {
        if (!path.empty()) ::unlink(path.c_str());
        if (!dir.empty()) ::rmdir(dir.c_str());
    }
};

}  // namespace

TEST_F(HidrawDeviceTest, OpenFailsForMissingPath) {
    HidrawDevice device(dir + "/missing");
    auto result = device.open();
    EXPECT_EQ(result.status, DeviceIoResult::Status::Error);
    EXPECT_NE(result.error.find("missing"), std::string::npos);
    EXPECT_FALSE(device.isOpen());
}

TEST_F(HidrawDeviceTest, SecondOpenIsBusyUntilClosed) {
    HidrawDevice first(path);
    HidrawDevice second(path);

    ASSERT_TRUE(first.open().ok());
    auto busy = second.open();
    EXPECT_EQ(busy.status, DeviceIoResult::Status::Error);
    EXPECT_NE(busy.error.find("device busy"), std::string::npos);
    EXPECT_FALSE(second.isOpen());

    first.close();
    EXPECT_FALSE(first.isOpen());
    EXPECT_TRUE(second.open().ok());
    EXPECT_TRUE(second.isOpen());
}

TEST_F(HidrawDeviceTest, UnknownIdsOnNonHidrawNode) {
    HidrawDevice device(path);
    ASSERT_TRUE(device.open().ok());

    auto info = device.info();
    EXPECT_EQ(info.path, path);
    EXPECT_FALSE(info.vendorId.has_value());
    EXPECT_FALSE(info.productId.has_value());
}

TEST_F(HidrawDeviceTest, WrittenBytesAreReadBack) {
    HidrawDevice device(path);
    ASSERT_TRUE(device.open().ok());

    std::vector<uint8_t> report{0x01, 0x13, 0x0B, 0x00, 0x08};
    ASSERT_TRUE(device.write(report).ok());

    auto result = device.read(64);
    ASSERT_EQ(result.status, DeviceIoResult::Status::Ok);
    EXPECT_EQ(result.data, report);
}

TEST_F(HidrawDeviceTest, ReadTruncatesToMaxBytes) {
    HidrawDevice device(path);
    ASSERT_TRUE(device.open().ok());
    ASSERT_TRUE(device.write({0xAA, 0xBB, 0xCC, 0xDD}).ok());

    auto result = device.read(2);
    ASSERT_EQ(result.status, DeviceIoResult::Status::Ok);
    EXPECT_EQ(result.data, (std::vector<uint8_t>{0xAA, 0xBB}));
}

TEST_F(HidrawDeviceTest, InterruptUnblocksPendingRead) {
    HidrawDevice device(path);
    ASSERT_TRUE(device.open().ok());

    auto pending = std::async(std::launch::async, [&device]() { return device.read(64); });
    EXPECT_EQ(pending.wait_for(100ms), std::future_status::timeout);

    device.interruptRead();
    ASSERT_EQ(pending.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(pending.get().status, DeviceIoResult::Status::Interrupted);
}

TEST_F(HidrawDeviceTest, ReopenClearsInterrupt) {
    HidrawDevice device(path);
    ASSERT_TRUE(device.open().ok());
    device.interruptRead();
    EXPECT_EQ(device.read(64).status, DeviceIoResult::Status::Interrupted);
    device.close();

    ASSERT_TRUE(device.open().ok());
    ASSERT_TRUE(device.write({0x42}).ok());
    auto result = device.read(64);
    ASSERT_EQ(result.status, DeviceIoResult::Status::Ok);
    EXPECT_EQ(result.data, (std::vector<uint8_t>{0x42}));
}

TEST_F(HidrawDeviceTest, IoOnClosedDeviceFails) {
    HidrawDevice device(path);
    EXPECT_EQ(device.read(64).status, DeviceIoResult::Status::Error);
    EXPECT_EQ(device.write({0x01}).status, DeviceIoResult::Status::Error);
    device.interruptRead();
    device.close();
}
