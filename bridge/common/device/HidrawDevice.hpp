#pragma once

#include "HidDevice.hpp"

#include <trantor/utils/Logger.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <linux/hidraw.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/file.h>
#include <sys/ioctl.h>
#include <unistd.h>

/**
 * @brief Linux hidraw 设备 (/dev/hidrawN)
 *
 * - open: O_RDWR | O_CLOEXEC，flock 独占，防止多个进程同时占用网关
 * - read: poll 同时等待设备 fd 和 eventfd，interruptRead() 写 eventfd 唤醒
 * - 厂商/产品 ID 通过 HIDIOCGRAWINFO 获取，失败时保持未知
 */
class HidrawDevice : public HidDevice {
public:
    explicit HidrawDevice(std::string path) {
        info_.path = std::move(path);
    }

    ~HidrawDevice() override {
        close();
    }

    HidrawDevice(const HidrawDevice&) = delete;
    HidrawDevice& operator=(const HidrawDevice&) = delete;

    DeviceIoResult open() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fd_ >= 0) {
            return DeviceIoResult::success();
        }

        int fd = ::open(info_.path.c_str(), O_RDWR | O_CLOEXEC);
        if (fd < 0) {
            return DeviceIoResult::failure(info_.path + ": " + std::strerror(errno));
        }

        if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
            std::string err = info_.path + ": device busy (" + std::strerror(errno) + ")";
            ::close(fd);
            return DeviceIoResult::failure(err);
        }

        int wakeFd = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
        if (wakeFd < 0) {
            std::string err = std::string("eventfd: ") + std::strerror(errno);
            ::close(fd);
            return DeviceIoResult::failure(err);
        }

        struct hidraw_devinfo devInfo{};
        if (::ioctl(fd, HIDIOCGRAWINFO, &devInfo) == 0) {
            info_.vendorId = static_cast<uint16_t>(devInfo.vendor);
            info_.productId = static_cast<uint16_t>(devInfo.product);
        } else {
            LOG_DEBUG << "[Hidraw] " << info_.path << " HIDIOCGRAWINFO unavailable: "
                      << std::strerror(errno);
        }

        fd_ = fd;
        wakeFd_ = wakeFd;
        interrupted_.store(false, std::memory_order_relaxed);
        LOG_INFO << "[Hidraw] Opened " << info_.path;
        return DeviceIoResult::success();
    }

    DeviceIoResult read(size_t maxBytes) override {
        int fd = fd_;
        int wakeFd = wakeFd_;
        if (fd < 0) {
            return DeviceIoResult::failure("device not open");
        }

        std::vector<uint8_t> buf(maxBytes);
        while (true) {
            if (interrupted_.load(std::memory_order_acquire)) {
                return DeviceIoResult::interrupted();
            }

            struct pollfd fds[2] = {
                {fd, POLLIN, 0},
                {wakeFd, POLLIN, 0}
            };
            int rc = ::poll(fds, 2, -1);
            if (rc < 0) {
                if (errno == EINTR) continue;
                return DeviceIoResult::failure(std::string("poll: ") + std::strerror(errno));
            }

            if (fds[1].revents & POLLIN) {
                return DeviceIoResult::interrupted();
            }
            if (fds[0].revents & (POLLERR | POLLNVAL)) {
                return DeviceIoResult::failure(info_.path + ": device error");
            }
            if (!(fds[0].revents & (POLLIN | POLLHUP))) {
                continue;
            }

            ssize_t n = ::read(fd, buf.data(), buf.size());
            if (n > 0) {
                buf.resize(static_cast<size_t>(n));
                return DeviceIoResult::success(std::move(buf));
            }
            if (n == 0) {
                return DeviceIoResult::endOfStream();
            }
            if (errno == EINTR || errno == EAGAIN) continue;
            return DeviceIoResult::failure(std::string("read: ") + std::strerror(errno));
        }
    }

    DeviceIoResult write(const std::vector<uint8_t>& data) override {
        if (fd_ < 0) {
            return DeviceIoResult::failure("device not open");
        }

        ssize_t n;
        do {
            n = ::write(fd_, data.data(), data.size());
        } while (n < 0 && errno == EINTR);

        if (n < 0) {
            return DeviceIoResult::failure(std::string("write: ") + std::strerror(errno));
        }
        // hidraw 一次写入一个完整报告，部分写入视为失败
        if (static_cast<size_t>(n) != data.size()) {
            return DeviceIoResult::failure("short write: " + std::to_string(n) + "/" +
                                           std::to_string(data.size()));
        }
        return DeviceIoResult::success();
    }

    void interruptRead() override {
        interrupted_.store(true, std::memory_order_release);
        int wakeFd = wakeFd_;
        if (wakeFd < 0) return;

        uint64_t one = 1;
        if (::write(wakeFd, &one, sizeof(one)) != static_cast<ssize_t>(sizeof(one))) {
            LOG_WARN << "[Hidraw] " << info_.path << " wake-up failed: " << std::strerror(errno);
        }
    }

    /** 调用前读取线程必须已退出 */
    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
            fd_ = -1;
            LOG_INFO << "[Hidraw] Closed " << info_.path;
        }
        if (wakeFd_ >= 0) {
            ::close(wakeFd_);
            wakeFd_ = -1;
        }
    }

    bool isOpen() const override { return fd_ >= 0; }

    DeviceInfo info() const override { return info_; }

private:
    DeviceInfo info_;
    std::atomic<int> fd_{-1};
    std::atomic<int> wakeFd_{-1};
    std::atomic<bool> interrupted_{false};
    std::mutex mutex_;
};
